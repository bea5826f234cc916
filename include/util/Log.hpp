#pragma once

#include <chrono>
#include <ctime>
#include <iostream>
#include <string>

// Local wall-clock time, "YYYY-MM-DD HH:MM:SS"
inline std::string nowTime() {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(system_clock::now());
    char buf[64];
    std::strftime(buf, sizeof(buf), "%F %T", std::localtime(&t));
    return std::string(buf);
}

// One diagnostic line on stderr; stdout is reserved for results
#define SSSP_LOG(level, msg)                                                     \
    do {                                                                         \
        std::cerr << "[" << nowTime() << "] [" << level << "] " << msg << std::endl; \
    } while (0)

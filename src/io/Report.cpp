#include "io/Report.hpp"
#include <sstream>

std::string formatDistances(const Distances<std::string>& d) {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& kv : d) {                       // std::map keeps labels sorted
        if (!first) oss << ", ";
        first = false;
        oss << kv.first << '=';
        if (kv.second == kUnreached) oss << "inf";
        else oss << kv.second;
    }
    oss << '}';
    return oss.str();
}

void printReport(std::ostream& out, const std::string& start, const Result<std::string>& r) {
    out << "Algorithm used: " << r.algorithmName() << "\n";
    out << "Shortest path from " << start << ": " << formatDistances(r.distances) << "\n";
}

#pragma once
#include "graph/Graph.hpp"
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>

// Raised for a malformed edge-list line; line() is 1-based
class EdgeListParseError : public std::runtime_error {
public:
    EdgeListParseError(std::size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what), m_line(line) {}

    std::size_t line() const noexcept { return m_line; }

private:
    std::size_t m_line;
};

// Text format, one directive per line:
//   <from> <to> <weight>   directed edge
//   <node>                 node without outgoing edges
//   # comment / blank      ignored
Graph readEdgeList(std::istream& in);

// Same, from a file path. Throws std::runtime_error if it cannot be opened.
Graph readEdgeListFile(const std::string& path);

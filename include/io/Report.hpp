#pragma once
#include "algo/ShortestPaths.hpp"   // Result
#include <ostream>
#include <string>

// "{A=0, B=2, D=inf}" in ascending node order
std::string formatDistances(const Distances<std::string>& d);

// Two lines:
//   Algorithm used: <name>
//   Shortest path from <start>: <distances>
void printReport(std::ostream& out, const std::string& start, const Result<std::string>& r);

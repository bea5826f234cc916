// ==========================
// EdgeListReader.cpp
// ==========================
// Parses the whitespace-separated edge-list format into a Graph.
// Node labels are single tokens; weights go through std::stod and
// must consume the whole token.
// ==========================

#include "io/EdgeListReader.hpp"
#include "graph/GraphBuilder.hpp"
#include "util/Strings.hpp"          // trim
#include <fstream>
#include <sstream>
#include <vector>

static double parseWeight(const std::string& tok, std::size_t lineno) {
    std::size_t used = 0;
    double w = 0;
    try {
        w = std::stod(tok, &used);
    } catch (const std::exception&) {                       // invalid_argument or out_of_range
        throw EdgeListParseError(lineno, "bad weight '" + tok + "'");
    }
    if (used != tok.size()) throw EdgeListParseError(lineno, "bad weight '" + tok + "'");
    return w;
}

Graph readEdgeList(std::istream& in) {
    Builder b;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;             // blank or comment

        std::istringstream iss(t);
        std::vector<std::string> tok;
        for (std::string s; iss >> s; ) tok.push_back(s);

        if (tok.size() == 1) {
            b.addNode(tok[0]);
        } else if (tok.size() == 3) {
            double w = parseWeight(tok[2], lineno);
            try {
                b.addEdge(tok[0], tok[1], w);
            } catch (const std::invalid_argument& e) {      // inf / nan weight
                throw EdgeListParseError(lineno, e.what());
            }
        } else {
            throw EdgeListParseError(lineno, "expected '<from> <to> <weight>' or '<node>'");
        }
    }
    return b.build();
}

Graph readEdgeListFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw std::runtime_error("cannot open edge list: " + path);
    return readEdgeList(in);
}

// ==========================
// tests/test_io.cpp
// ==========================
// Edge-list parsing and the textual report.
// ==========================

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "algo/ShortestPaths.hpp"
#include "graph/Fixtures.hpp"
#include "io/EdgeListReader.hpp"
#include "io/Report.hpp"

#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

TEST_CASE("edge list with comments, blanks and an isolated node") {
    std::istringstream in(
        "# demo\n"
        "A B 2\n"
        "\n"
        "  B C -1.5  \n"
        "Z\n");
    Graph g = readEdgeList(in);
    CHECK((g.nodes() == std::set<std::string>{"A", "B", "C", "Z"}));
    CHECK(g.edgeCount() == 2);
    CHECK(g.outgoing("B").at(0).weight == -1.5);
    CHECK(g.hasNegativeEdge());
}

TEST_CASE("bad weight reports its line") {
    std::istringstream in("A B 1\nB C x\n");
    try {
        readEdgeList(in);
        FAIL("expected EdgeListParseError");
    } catch (const EdgeListParseError& e) {
        CHECK(e.line() == 2);
        CHECK(std::string(e.what()).find("bad weight") != std::string::npos);
    }
}

TEST_CASE("trailing junk in a weight is rejected") {
    std::istringstream in("A B 3kg\n");
    CHECK_THROWS_AS(readEdgeList(in), EdgeListParseError);
}

TEST_CASE("wrong token count is rejected") {
    std::istringstream in("A B\n");
    CHECK_THROWS_AS(readEdgeList(in), EdgeListParseError);
}

TEST_CASE("infinite weight is rejected") {
    std::istringstream in("A B inf\n");
    CHECK_THROWS_AS(readEdgeList(in), EdgeListParseError);
}

TEST_CASE("missing file throws") {
    CHECK_THROWS_AS(readEdgeListFile("/nonexistent/graph.txt"), std::runtime_error);
}

TEST_CASE("formatDistances prints inf for unreached nodes") {
    Distances<std::string> d = {{"b", 1.5}, {"a", 0}, {"c", kUnreached}};
    CHECK(formatDistances(d) == "{a=0, b=1.5, c=inf}");
    CHECK(formatDistances({}) == "{}");
}

TEST_CASE("report for the sample graph") {
    std::ostringstream out;
    printReport(out, "A", shortestPaths(sampleGraph(), std::string("A")));
    CHECK(out.str() ==
          "Algorithm used: Dijkstra\n"
          "Shortest path from A: {A=0, B=2, C=6, D=11, E=9, F=2, G=3}\n");
}

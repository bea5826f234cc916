// ==========================
// tests/test_graph.cpp
// ==========================
// Unit tests for BasicGraph, GraphBuilder and the demo fixtures.
// ==========================

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "graph/Fixtures.hpp"
#include "graph/Graph.hpp"
#include "graph/GraphBuilder.hpp"

#include <limits>       // quiet_NaN, infinity
#include <set>
#include <stdexcept>    // std::invalid_argument, std::out_of_range
#include <string>

// ---------------------------
// Node set covers keys and edge targets
// ---------------------------
TEST_CASE("nodes() includes sinks that only appear as targets") {
    Builder b;
    b.addEdge("x", "y", 1);                      // y never gets an entry of its own
    Graph g = b.build();
    CHECK((g.nodes() == std::set<std::string>{"x", "y"}));
    CHECK(g.contains("y"));
    CHECK(g.outgoing("y").empty());              // sink has no edges
    CHECK(g.nodeCount() == 2);
    CHECK(g.edgeCount() == 1);
}

TEST_CASE("sample graph has seven nodes and ten edges") {
    Graph g = sampleGraph();
    CHECK((g.nodes() == std::set<std::string>{"A", "B", "C", "D", "E", "F", "G"}));
    CHECK(g.edgeCount() == 10);
    CHECK(g.label() == "DirectedGraph(7V,10E)");
    CHECK(g.outgoing("C").empty());
    CHECK(g.outgoing("D").empty());
}

// ---------------------------
// outgoing() keeps insertion order and parallel edges
// ---------------------------
TEST_CASE("outgoing() preserves order and parallel edges") {
    GraphBuilder<int> b;
    b.addEdge(0, 1, 5).addEdge(0, 2, 1).addEdge(0, 1, 2);
    auto g = b.build();
    const auto& out = g.outgoing(0);
    REQUIRE(out.size() == 3);
    CHECK(out[0].target == 1); CHECK(out[0].weight == 5);
    CHECK(out[1].target == 2); CHECK(out[1].weight == 1);
    CHECK(out[2].target == 1); CHECK(out[2].weight == 2);  // not merged with the first
}

TEST_CASE("outgoing() on an unknown node throws UnknownNodeError") {
    Graph g = sampleGraph();
    CHECK_THROWS_AS((void)g.outgoing("Z"), UnknownNodeError);
    CHECK_THROWS_AS((void)g.outgoing("Z"), std::out_of_range);   // same hierarchy as index errors
}

// ---------------------------
// hasNegativeEdge()
// ---------------------------
TEST_CASE("hasNegativeEdge() follows the weights") {
    CHECK_FALSE(sampleGraph().hasNegativeEdge());
    CHECK(sampleGraphWithNegativeEdge().hasNegativeEdge());

    GraphBuilder<int> b;
    b.addEdge(0, 1, 0);                          // zero is not negative
    CHECK_FALSE(b.build().hasNegativeEdge());
    b.addEdge(1, 2, -0.5);
    CHECK(b.build().hasNegativeEdge());
}

TEST_CASE("empty graph") {
    Graph g;
    CHECK(g.nodes().empty());
    CHECK_FALSE(g.hasNegativeEdge());
    CHECK(g.label() == "DirectedGraph(0V,0E)");
}

// ---------------------------
// Builder validation and isolated nodes
// ---------------------------
TEST_CASE("builder rejects non-finite weights") {
    Builder b;
    CHECK_THROWS_AS(b.addEdge("a", "b", std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    CHECK_THROWS_AS(b.addEdge("a", "b", std::numeric_limits<double>::infinity()), std::invalid_argument);
    CHECK(b.build().nodes().empty());            // nothing was added
}

TEST_CASE("addNode() declares an isolated node once") {
    Builder b;
    b.addNode("solo").addNode("solo");
    Graph g = b.build();
    CHECK(g.nodeCount() == 1);
    CHECK(g.outgoing("solo").empty());
}

TEST_CASE("builder stays usable after build()") {
    GraphBuilder<int> b;
    b.addEdge(1, 2, 3);
    auto first = b.build();
    b.addEdge(2, 3, 4);
    auto second = b.build();
    CHECK(first.edgeCount() == 1);               // earlier snapshot unaffected
    CHECK(second.edgeCount() == 2);
    CHECK(second.contains(3));
}

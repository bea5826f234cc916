#pragma once
#include "algo/ShortestPathAlgorithm.hpp"   // Algorithm, Distances
#include "graph/Graph.hpp"
#include <stdexcept>
#include <string>

// ==========================
// Shortest-path engine
// ==========================
// Single entry point: shortestPaths(graph, start).
// Looks at the edge weights once, runs Dijkstra when all are
// non-negative and Bellman-Ford otherwise, and returns the distances
// together with the algorithm that actually ran.
// ==========================

// Thrown when the start node is not in graph.nodes()
class UnknownStartNodeError : public std::invalid_argument {
public:
    explicit UnknownStartNodeError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Algorithm selection policy
enum class Selection { Auto, Dijkstra, BellmanFord };

struct ShortestPathOptions {
    Selection selection = Selection::Auto;   // Auto: Bellman-Ford iff a negative edge exists
    bool detectNegativeCycles = false;       // extra Bellman-Ford pass, throws NegativeCycleError
};

// Outcome of one engine call
template <typename Node>
struct Result {
    Algorithm algorithm;           // the algorithm that produced `distances`
    Distances<Node> distances;     // one entry per graph node

    std::string algorithmName() const { return ::algorithmName(algorithm); }
};

// Parse "auto", "dijkstra", "bellman-ford" (case-insensitive).
// Throws std::invalid_argument for anything else.
Selection parseSelection(const std::string& name);

// Run the engine.
// Throws UnknownStartNodeError if start is not a node of graph,
// std::invalid_argument if Dijkstra is forced on a graph with a negative edge,
// NegativeCycleError if detection is enabled and a cycle is found.
template <typename Node>
Result<Node> shortestPaths(const BasicGraph<Node>& graph, const Node& start,
                           const ShortestPathOptions& options = ShortestPathOptions{});

extern template Result<std::string> shortestPaths(const BasicGraph<std::string>&, const std::string&,
                                                  const ShortestPathOptions&);
extern template Result<int> shortestPaths(const BasicGraph<int>&, const int&,
                                          const ShortestPathOptions&);

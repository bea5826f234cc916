#pragma once
#include "graph/Graph.hpp"      // BasicGraph
#include <limits>
#include <map>
#include <memory>
#include <string>

// Distance per node; unreached nodes hold kUnreached
template <typename Node>
using Distances = std::map<Node, double>;

constexpr double kUnreached = std::numeric_limits<double>::infinity();

// Which algorithm produced a result
enum class Algorithm { Dijkstra, BellmanFord };

// "Dijkstra" or "Bellman-Ford"
std::string algorithmName(Algorithm a);

// Strategy interface all shortest-path algorithms implement
template <typename Node>
struct IShortestPathAlgorithm {
    virtual ~IShortestPathAlgorithm() = default;
    virtual Algorithm kind() const = 0;
    // start must be a node of g; the caller checks it
    virtual Distances<Node> run(const BasicGraph<Node>& g, const Node& start) = 0;
};

// Factory that returns the concrete strategy for an Algorithm tag.
// detectNegativeCycles only affects Bellman-Ford.
template <typename Node>
struct AlgorithmFactory {
    static std::unique_ptr<IShortestPathAlgorithm<Node>> create(Algorithm a,
                                                                bool detectNegativeCycles = false);
};

extern template struct AlgorithmFactory<std::string>;
extern template struct AlgorithmFactory<int>;

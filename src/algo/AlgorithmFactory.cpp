// ===============================================
// AlgorithmFactory.cpp
// Tag -> strategy lookup for the two shortest-path algorithms:
//   * Dijkstra (linear-scan selection, non-negative weights)
//   * Bellman-Ford (|V|-1 rounds, negative weights allowed)
// ===============================================

#include "algo/ShortestPathAlgorithm.hpp"
#include "algo/BellmanFord.hpp"
#include "algo/Dijkstra.hpp"

std::string algorithmName(Algorithm a) {
    switch (a) {
    case Algorithm::Dijkstra:    return "Dijkstra";
    case Algorithm::BellmanFord: return "Bellman-Ford";
    }
    return "unknown";
}

template <typename Node>
std::unique_ptr<IShortestPathAlgorithm<Node>> AlgorithmFactory<Node>::create(Algorithm a,
                                                                             bool detectNegativeCycles) {
    switch (a) {
    case Algorithm::Dijkstra:
        return std::make_unique<Dijkstra<Node>>();
    case Algorithm::BellmanFord:
        return std::make_unique<BellmanFord<Node>>(detectNegativeCycles);
    }
    return nullptr;
}

template struct AlgorithmFactory<std::string>;
template struct AlgorithmFactory<int>;

// ===============================================
// ShortestPaths.cpp
// Engine entry point: validates the start node, decides between
// Dijkstra and Bellman-Ford from a single look at the edge weights,
// and tags the result with the algorithm that ran.
// ===============================================

#include "algo/ShortestPaths.hpp"
#include "util/Strings.hpp"           // toLower

Selection parseSelection(const std::string& name) {
    const std::string n = toLower(name);
    if (n == "auto") return Selection::Auto;
    if (n == "dijkstra") return Selection::Dijkstra;
    if (n == "bellman-ford" || n == "bellmanford" || n == "bellman_ford") return Selection::BellmanFord;
    throw std::invalid_argument("unknown algorithm: " + name);
}

template <typename Node>
Result<Node> shortestPaths(const BasicGraph<Node>& graph, const Node& start,
                           const ShortestPathOptions& options) {
    if (!graph.contains(start)) {
        throw UnknownStartNodeError("start node " + BasicGraph<Node>::describe(start) +
                                    " is not in " + graph.label());
    }

    const bool negative = graph.hasNegativeEdge();               // evaluated once per call

    Algorithm chosen = negative ? Algorithm::BellmanFord : Algorithm::Dijkstra;
    if (options.selection == Selection::BellmanFord) {
        chosen = Algorithm::BellmanFord;                         // always valid
    } else if (options.selection == Selection::Dijkstra) {
        if (negative) throw std::invalid_argument("Dijkstra requires non-negative edge weights");
        chosen = Algorithm::Dijkstra;
    }

    auto algo = AlgorithmFactory<Node>::create(chosen, options.detectNegativeCycles);

    Result<Node> r;
    r.algorithm = algo->kind();                                  // label comes from what runs
    r.distances = algo->run(graph, start);
    return r;
}

template Result<std::string> shortestPaths(const BasicGraph<std::string>&, const std::string&,
                                           const ShortestPathOptions&);
template Result<int> shortestPaths(const BasicGraph<int>&, const int&, const ShortestPathOptions&);

#include "algo/BellmanFord.hpp"
#include <cstddef>

// -----------------------------
// Helper: one pass over every edge; returns true if anything improved
// -----------------------------
template <typename Node>
static bool relaxAll(const BasicGraph<Node>& g, Distances<Node>& dist) {
    bool changed = false;
    for (const auto& u : g.nodes()) {                             // ascending label order
        const double du = dist[u];
        if (du == kUnreached) continue;                           // inf + w never improves anything
        for (const auto& e : g.outgoing(u)) {
            double& dv = dist[e.target];
            if (du + e.weight < dv) {
                dv = du + e.weight;
                changed = true;
            }
        }
    }
    return changed;
}

template <typename Node>
Distances<Node> BellmanFord<Node>::run(const BasicGraph<Node>& g, const Node& start) {
    Distances<Node> dist;
    for (const auto& n : g.nodes()) dist[n] = kUnreached;
    dist[start] = 0.0;

    const std::size_t rounds = g.nodeCount() - 1;                 // start is a node, so nodeCount() >= 1
    for (std::size_t i = 0; i < rounds; ++i) relaxAll(g, dist);

    if (m_detectCycles && relaxAll(g, dist)) {
        throw NegativeCycleError("negative cycle reachable from " + BasicGraph<Node>::describe(start));
    }
    return dist;
}

template class BellmanFord<std::string>;
template class BellmanFord<int>;

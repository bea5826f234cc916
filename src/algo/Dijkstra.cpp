#include "algo/Dijkstra.hpp"    // include our header so the compiler sees the class
#include <iterator>             // std::next
#include <set>                  // unvisited working set

template <typename Node>
Distances<Node> Dijkstra<Node>::run(const BasicGraph<Node>& g, const Node& start) {
    Distances<Node> dist;                                         // tentative distances
    for (const auto& n : g.nodes()) dist[n] = kUnreached;         // everything unreached
    dist[start] = 0.0;                                            // except the source

    std::set<Node> unvisited(g.nodes());                          // not yet settled

    while (!unvisited.empty()) {
        // 1) pick the unvisited node with the smallest tentative distance
        auto best = unvisited.begin();
        for (auto it = std::next(best); it != unvisited.end(); ++it) {
            if (dist[*it] < dist[*best]) best = it;               // strict: first wins on ties
        }
        const Node u = *best;
        const double du = dist[u];

        // 2) relax every edge leaving u
        for (const auto& e : g.outgoing(u)) {
            double& dv = dist[e.target];
            if (du + e.weight < dv) dv = du + e.weight;
        }

        // 3) u is settled
        unvisited.erase(best);
    }
    return dist;
}

template class Dijkstra<std::string>;
template class Dijkstra<int>;

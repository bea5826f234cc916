#pragma once
#include "algo/ShortestPathAlgorithm.hpp"

/**
 * @brief Dijkstra without a priority queue: the next node to settle is picked
 *        by a linear scan over the unvisited set, O(V^2 + E).
 *        Requires non-negative weights; not re-checked here.
 *        Ties go to the smallest label (first in set order).
 */
template <typename Node>
class Dijkstra final : public IShortestPathAlgorithm<Node> {
public:
    Algorithm kind() const override { return Algorithm::Dijkstra; }
    Distances<Node> run(const BasicGraph<Node>& g, const Node& start) override;
};

extern template class Dijkstra<std::string>;
extern template class Dijkstra<int>;

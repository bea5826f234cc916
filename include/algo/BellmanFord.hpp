#pragma once
#include "algo/ShortestPathAlgorithm.hpp"
#include <stdexcept>

// Thrown when a negative cycle is still relaxable after |V|-1 rounds
class NegativeCycleError : public std::runtime_error {
public:
    explicit NegativeCycleError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Bellman-Ford: exactly |V|-1 rounds, each relaxing every edge with
 *        sources visited in ascending label order.
 *
 * With detectCycles == false a reachable negative cycle is not reported;
 * the distances are whatever |V|-1 rounds leave behind. With
 * detectCycles == true one extra pass runs and any edge that still
 * relaxes raises NegativeCycleError.
 */
template <typename Node>
class BellmanFord final : public IShortestPathAlgorithm<Node> {
public:
    explicit BellmanFord(bool detectCycles = false) : m_detectCycles(detectCycles) {}

    Algorithm kind() const override { return Algorithm::BellmanFord; }
    Distances<Node> run(const BasicGraph<Node>& g, const Node& start) override;

private:
    bool m_detectCycles;
};

extern template class BellmanFord<std::string>;
extern template class BellmanFord<int>;

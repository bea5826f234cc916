#pragma once
#include "graph/Graph.hpp"   // BasicGraph, Edge

// Collects nodes and edges, then produces an immutable BasicGraph.
// Parallel edges are kept as separate entries; nothing is deduplicated.
template <typename Node>
class GraphBuilder {
public:
    // Declare a node (possibly isolated). Re-declaring is harmless.
    GraphBuilder& addNode(const Node& n);

    // Append edge from->to with the given weight.
    // Throws std::invalid_argument for NaN or infinite weights.
    GraphBuilder& addEdge(const Node& from, const Node& to, double weight);

    // Snapshot of everything added so far; the builder stays usable.
    BasicGraph<Node> build() const;

private:
    typename BasicGraph<Node>::Adjacency m_adj;
};

using Builder = GraphBuilder<std::string>;

extern template class GraphBuilder<std::string>;
extern template class GraphBuilder<int>;

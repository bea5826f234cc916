// ==========================
// Graph.cpp
// ==========================
// This file implements the out-of-line members of BasicGraph:
// the adjacency-normalising constructor and label().
// The template is explicitly instantiated for std::string and int.
// ==========================

#include "graph/Graph.hpp"   // include the BasicGraph declaration

// --------------------------
// constructor
// --------------------------
// Purpose:
//   Take ownership of the adjacency map, give every edge target its own
//   (empty) entry, and compute the edge count and negative-weight flag.
template <typename Node>
BasicGraph<Node>::BasicGraph(Adjacency adj)
    : m_adj(std::move(adj)), m_edges(0), m_hasNegative(false) {
    std::vector<Node> sinks;                         // targets without an entry of their own
    for (const auto& kv : m_adj) {                   // iterate over sources
        m_nodes.insert(kv.first);                    // every key is a node
        for (const auto& e : kv.second) {            // iterate over its edges
            ++m_edges;
            if (e.weight < 0) m_hasNegative = true;  // remember any negative weight
            if (m_adj.find(e.target) == m_adj.end()) sinks.push_back(e.target);
        }
    }
    for (auto& s : sinks) {                          // materialise sink nodes
        m_nodes.insert(s);
        m_adj.emplace(std::move(s), std::vector<EdgeType>{}); // no-op for duplicates
    }
}

// --------------------------
// label
// --------------------------
// Format:
//   "DirectedGraph(VV,EE)" where VV = number of nodes, EE = number of edges.
template <typename Node>
std::string BasicGraph<Node>::label() const {
    std::ostringstream oss;
    oss << "DirectedGraph(" << nodeCount() << "V," << edgeCount() << "E)";
    return oss.str();
}

template class BasicGraph<std::string>;
template class BasicGraph<int>;

#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // defines std::size_t type
#include <map>           // node -> outgoing edges
#include <set>           // node set
#include <sstream>       // formatting node labels into error messages
#include <stdexcept>     // defines exceptions like out_of_range
#include <string>        // used for std::string in label()
#include <utility>       // std::move
#include <vector>        // used for adjacency lists

// ==========================
// Immutable weighted digraph
// ==========================
// This class supports:
// - Directed edges with real (possibly negative) weights
// - Arbitrary comparable node labels (std::string, int, ...)
// - Parallel edges, kept independently in insertion order
// - Sink nodes that only appear as edge targets
// Construction goes through GraphBuilder (graph/GraphBuilder.hpp).
// Instantiated for std::string and int in Graph.cpp.
// ==========================

// Thrown when a node label is not part of the graph
class UnknownNodeError : public std::out_of_range {
public:
    explicit UnknownNodeError(const std::string& what)
        : std::out_of_range(what) {}
};

// Outgoing edge; the source is implied by the list it lives in
template <typename Node>
struct Edge {
    Node   target;
    double weight;
};

template <typename Node>
class BasicGraph {
public:
    // Type aliases for readability
    using NodeType  = Node;
    using EdgeType  = Edge<Node>;
    using Adjacency = std::map<Node, std::vector<EdgeType>>;

    // Empty graph
    BasicGraph() : m_edges(0), m_hasNegative(false) {}

    // Build from an adjacency map; targets missing as keys become sinks
    explicit BasicGraph(Adjacency adj);

    // ---- Public API ----

    // All labels appearing as a key or as any edge target
    const std::set<Node>& nodes() const noexcept { return m_nodes; }

    // Edges leaving n, in insertion order (empty for sinks)
    const std::vector<EdgeType>& outgoing(const Node& n) const {
        auto it = m_adj.find(n);
        if (it == m_adj.end()) throw UnknownNodeError("unknown node: " + describe(n));
        return it->second;
    }

    // True iff any edge has weight < 0 (computed once, graph is immutable)
    bool hasNegativeEdge() const noexcept { return m_hasNegative; }

    bool contains(const Node& n) const { return m_nodes.count(n) != 0; }

    std::size_t nodeCount() const noexcept { return m_nodes.size(); }
    std::size_t edgeCount() const noexcept { return m_edges; }

    // "DirectedGraph(VV,EE)"
    std::string label() const;

    // Render a label for diagnostics
    static std::string describe(const Node& n) {
        std::ostringstream oss;
        oss << n;
        return oss.str();
    }

private:
    Adjacency m_adj;              // every node has an entry, sinks map to {}
    std::set<Node> m_nodes;       // keys of m_adj
    std::size_t m_edges;          // total number of edges
    bool m_hasNegative;           // cached negative-weight predicate
};

// String-labelled graph used by the demo and the CLI
using Graph = BasicGraph<std::string>;

extern template class BasicGraph<std::string>;
extern template class BasicGraph<int>;

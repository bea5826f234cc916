#include "graph/GraphBuilder.hpp"
#include <cmath>       // std::isfinite

template <typename Node>
GraphBuilder<Node>& GraphBuilder<Node>::addNode(const Node& n) {
    m_adj[n];                                     // creates an empty edge list if absent
    return *this;
}

template <typename Node>
GraphBuilder<Node>& GraphBuilder<Node>::addEdge(const Node& from, const Node& to, double weight) {
    if (!std::isfinite(weight)) {
        throw std::invalid_argument("edge " + BasicGraph<Node>::describe(from) + "->" +
                                    BasicGraph<Node>::describe(to) + " has a non-finite weight");
    }
    m_adj[from].push_back(Edge<Node>{to, weight});
    return *this;
}

template <typename Node>
BasicGraph<Node> GraphBuilder<Node>::build() const {
    return BasicGraph<Node>(m_adj);               // copy, graph normalises sinks itself
}

template class GraphBuilder<std::string>;
template class GraphBuilder<int>;

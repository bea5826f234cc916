#pragma once
#include "graph/Graph.hpp"

// ==========================
// Demo graphs
// ==========================
// Seven nodes A..G:
//   A->B(2) A->F(2) A->G(3) B->A(1) B->C(4)
//   E->D(2) F->A(1) F->E(7) G->C(5) G->E(6)
// C and D have no outgoing edges.
// ==========================

// The sample graph above
Graph sampleGraph();

// Same graph with A->B weighted -2 (forces Bellman-Ford)
Graph sampleGraphWithNegativeEdge();

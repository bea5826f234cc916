#include "graph/Fixtures.hpp"
#include "graph/GraphBuilder.hpp"

// Shared body: only the A->B weight differs between the two fixtures
static Graph makeSample(double abWeight) {
    Builder b;
    b.addEdge("A", "B", abWeight).addEdge("A", "F", 2).addEdge("A", "G", 3);
    b.addEdge("B", "A", 1).addEdge("B", "C", 4);
    b.addNode("C").addNode("D");
    b.addEdge("E", "D", 2);
    b.addEdge("F", "A", 1).addEdge("F", "E", 7);
    b.addEdge("G", "C", 5).addEdge("G", "E", 6);
    return b.build();
}

Graph sampleGraph() { return makeSample(2); }

Graph sampleGraphWithNegativeEdge() { return makeSample(-2); }

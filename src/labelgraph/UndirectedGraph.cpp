#include "labelgraph/UndirectedGraph.hpp"   // include our header so the compiler sees the class

// -----------------------------
// addEdge (undirected)
// -----------------------------
// Same auto-create semantics as Graph::addEdge, but the edge is stored in
// both endpoints' lists so the symmetry a->b <=> b->a always holds.
// A self-loop a-a therefore appears twice in a's list.
void UndirectedGraph::addEdge(const Label& src, const Label& dst, Weight w) {
    Graph::addEdge(src, dst, w);                  // endpoints + forward entry src->dst
    appendEntry(dst, src, w);                     // reverse entry dst->src, same weight
}

// ==========================
// Graph.cpp
// ==========================
// This file implements the default operations of the Graph capability set:
// addNode(), addEdge(), nodes(), edges(), neighbors(), entryCount(), label().
// Storage itself is owned by the concrete graph.
// ==========================

#include "labelgraph/Graph.hpp"            // include the Graph class declaration
#include "labelgraph/NodeNotInGraph.hpp"   // error thrown by neighbors()
#include <sstream>                         // used for building strings in label()

// --------------------------
// addNode
// --------------------------
// Purpose:
//   Insert a node with an empty neighbor sequence.
// Returns:
//   true if the node was inserted, false if it already existed.
bool Graph::addNode(const Label& node) {
    if (contains(node)) return false;                    // already present: leave untouched
    adjacencyTableMutable().emplace(node, std::vector<Neighbor>{}); // new key, no neighbors
    return true;
}

// --------------------------
// addEdge
// --------------------------
// Purpose:
//   Default (one-directional) insertion of src->dst.
//   Missing endpoints are created first, so this never fails.
void Graph::addEdge(const Label& src, const Label& dst, Weight w) {
    addNode(src);                                        // no-op if src exists
    addNode(dst);                                        // no-op if dst exists
    appendEntry(src, dst, w);                            // forward entry only
}

std::unordered_set<Graph::Label> Graph::nodes() const {
    std::unordered_set<Label> out;
    out.reserve(adjacencyTable().size());
    for (const auto& kv : adjacencyTable()) out.insert(kv.first);
    return out;
}

// --------------------------
// edges
// --------------------------
// Purpose:
//   Flatten the adjacency table into (src, dst, weight) tuples.
//   Undirected graphs report every logical edge once per direction.
std::vector<Graph::Edge> Graph::edges() const {
    std::vector<Edge> out;
    out.reserve(entryCount());                           // exact number of tuples
    for (const auto& kv : adjacencyTable()) {            // for each node
        for (const auto& e : kv.second) {                // for each (neighbor, weight)
            out.emplace_back(kv.first, e.first, e.second);
        }
    }
    return out;
}

const std::vector<Graph::Neighbor>& Graph::neighbors(const Label& node) const {
    auto it = adjacencyTable().find(node);
    if (it == adjacencyTable().end()) throw NodeNotInGraph();
    return it->second;
}

std::size_t Graph::entryCount() const noexcept {
    std::size_t total = 0;
    for (const auto& kv : adjacencyTable()) total += kv.second.size();
    return total;
}

// --------------------------
// label
// --------------------------
// Format:
//   "<kindName>(VV,EE)" where VV = number of nodes and
//   EE = number of stored entries (2 per undirected edge),
//   e.g. "UndirectedGraph(3V,6E)" or "Graph(2V,1E)".
std::string Graph::label() const {
    std::ostringstream oss;                              // create a string stream
    oss << kindName();                                   // write graph kind
    oss << "(" << nodeCount() << "V," << entryCount() << "E)"; // add node and entry counts
    return oss.str();                                    // return composed string
}

#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // defines std::size_t type
#include <string>        // node labels and label()
#include <tuple>         // std::tuple to represent (src, dst, weight) edges
#include <unordered_map> // adjacency table keyed by label
#include <unordered_set> // snapshot returned by nodes()
#include <utility>       // std::pair for (neighbor, weight) entries
#include <vector>        // neighbor sequences and edges()

// ==========================
// Label-keyed weighted Graph
// ==========================
// Abstract capability set over an adjacency table:
// - Nodes are identified by a unique string label
// - addEdge() auto-creates missing endpoints
// - The default addEdge() stores only the forward entry src->dst;
//   concrete graphs override it (see UndirectedGraph)
// - Storage only grows: nothing is ever removed
// ==========================

class Graph {
public:
    // Type aliases for readability
    using Label          = std::string;                              // node identity
    using Weight         = int;                                      // edge weight
    using Neighbor       = std::pair<Label, Weight>;                 // entry as (neighbor, weight)
    using AdjacencyTable = std::unordered_map<Label, std::vector<Neighbor>>;
    using Edge           = std::tuple<Label, Label, Weight>;         // (src, dst, weight)

    virtual ~Graph() = default;

    // ---- Storage access (provided by the concrete graph) ----

    virtual AdjacencyTable& adjacencyTableMutable() = 0;
    virtual const AdjacencyTable& adjacencyTable() const = 0;

    // ---- Insertion ----

    // Insert `node` with no neighbors. Returns false (and changes nothing)
    // if the label is already present.
    bool addNode(const Label& node);

    // Add entry src->dst with weight w, creating either endpoint if missing.
    // Repeated calls append duplicate entries.
    virtual void addEdge(const Label& src, const Label& dst, Weight w);

    // ---- Queries ----

    // Return true if `node` is a key of the adjacency table
    bool contains(const Label& node) const {
        return adjacencyTable().find(node) != adjacencyTable().end();
    }

    // Snapshot of all node labels (no defined order)
    std::unordered_set<Label> nodes() const;

    // One (src, dst, weight) tuple per neighbor entry of every node
    std::vector<Edge> edges() const;

    // Neighbor sequence of `node` in insertion order.
    // Throws NodeNotInGraph if the label was never added.
    const std::vector<Neighbor>& neighbors(const Label& node) const;

    // Number of nodes
    std::size_t nodeCount() const noexcept { return adjacencyTable().size(); }

    // Number of stored neighbor entries across all nodes
    std::size_t entryCount() const noexcept;

    // Name of the concrete graph kind, used by label()
    virtual std::string kindName() const { return "Graph"; }

    // Human-readable summary: "<kind>(VV,EE)" with EE = entryCount()
    std::string label() const;

protected:
    Graph() = default;
    Graph(const Graph&) = default;
    Graph(Graph&&) = default;
    Graph& operator=(const Graph&) = default;
    Graph& operator=(Graph&&) = default;

    // Helper: append entry src->dst to the (existing) list of src
    void appendEntry(const Label& src, const Label& dst, Weight w) {
        adjacencyTableMutable()[src].emplace_back(dst, w);
    }
}; // end class Graph

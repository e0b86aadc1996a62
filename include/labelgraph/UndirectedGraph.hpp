#pragma once                              // ensure this header is included only once per translation unit

#include "labelgraph/Graph.hpp"           // the Graph capability set we implement
#include <string>                         // std::string for kindName()

/**
 * @brief Undirected weighted graph stored as an adjacency table.
 *        Every edge a-b with weight w is kept twice: (b,w) in a's list
 *        and (a,w) in b's list.
 */
class UndirectedGraph final : public Graph {
public:
    UndirectedGraph() = default;          // empty graph

    AdjacencyTable& adjacencyTableMutable() override { return m_adjacencyTable; }
    const AdjacencyTable& adjacencyTable() const override { return m_adjacencyTable; }

    // Add a-b: forward entry plus the reverse entry with the same weight
    void addEdge(const Label& src, const Label& dst, Weight w) override;

    std::string kindName() const override { return "UndirectedGraph"; }

private:
    AdjacencyTable m_adjacencyTable;      // label -> [(neighbor, weight), ...]
};

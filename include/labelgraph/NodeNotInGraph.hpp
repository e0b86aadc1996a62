#pragma once

#include <stdexcept>     // std::out_of_range base class

// Thrown by lookup-only operations when a label is not a node of the graph.
// Stateless: every instance renders the same message and compares equal.
class NodeNotInGraph : public std::out_of_range {
public:
    NodeNotInGraph() : std::out_of_range("accessing a node that is not in the graph") {}

    friend bool operator==(const NodeNotInGraph&, const NodeNotInGraph&) noexcept { return true; }
    friend bool operator!=(const NodeNotInGraph&, const NodeNotInGraph&) noexcept { return false; }
};

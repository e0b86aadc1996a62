// ==========================
// labelgraph demo
// ==========================
// Parses: [-n <label>]... [-e <src>,<dst>,<weight>]...
// Builds an UndirectedGraph from the options (or the a-b-c triangle when
// none are given) and prints its summary, nodes and edges.
// ==========================

#include "labelgraph/UndirectedGraph.hpp"   // UndirectedGraph API
#include <getopt.h>                         // getopt for command-line parsing
#include <algorithm>                        // std::sort for stable output
#include <cctype>                           // std::isspace
#include <cstdlib>                          // std::exit
#include <exception>                        // std::exception
#include <iostream>                         // I/O
#include <sstream>                          // split "a,b,w"
#include <stdexcept>                        // std::invalid_argument
#include <string>
#include <tuple>                            // std::get on Graph::Edge
#include <vector>

static void usage(const char* prog) {                         // print usage and exit
    std::cerr << "Usage: " << prog
              << " [-n <label>]... [-e <src>,<dst>,<weight>]...\n";
    std::exit(1);
}

// Parse "src,dst,weight" into an edge; throws std::invalid_argument on bad input
static Graph::Edge parse_edge(const std::string& arg) {
    std::istringstream in(arg);
    std::string src, dst, w;
    if (!std::getline(in, src, ',') || !std::getline(in, dst, ',') || !std::getline(in, w))
        throw std::invalid_argument("edge must be <src>,<dst>,<weight>: " + arg);
    if (src.empty() || dst.empty())
        throw std::invalid_argument("edge endpoints must be non-empty: " + arg);
    if (w.empty() || std::isspace(static_cast<unsigned char>(w[0])))
        throw std::invalid_argument("edge weight is not an integer: " + arg);
    std::size_t used = 0;
    int weight = std::stoi(w, &used);                         // throws on non-numbers
    if (used != w.size())
        throw std::invalid_argument("edge weight is not an integer: " + arg);
    return Graph::Edge(src, dst, weight);
}

int main(int argc, char* argv[]) {                            // entry point
    std::vector<Graph::Label> nodes;                          // -n arguments in order
    std::vector<Graph::Edge> edges;                           // -e arguments in order

    try {
        for (int opt; (opt = getopt(argc, argv, "n:e:")) != -1; ) {
            if (opt == 'n') {                                 // explicit node
                if (*optarg == '\0') throw std::invalid_argument("node label must be non-empty");
                nodes.emplace_back(optarg);
            }
            else if (opt == 'e') edges.push_back(parse_edge(optarg)); // weighted edge
            else usage(argv[0]);                              // invalid flag
        }
    } catch (const std::exception& ex) {                      // std::stoi / parse_edge errors
        std::cerr << "Bad argument: " << ex.what() << "\n";
        usage(argv[0]);
    }
    if (optind < argc) usage(argv[0]);                        // stray positional arguments

    if (nodes.empty() && edges.empty()) {                     // default triangle a-b-c
        edges.emplace_back("a", "b", 5);
        edges.emplace_back("b", "c", 10);
        edges.emplace_back("c", "a", 7);
    }

    try {
        UndirectedGraph g;
        for (const auto& n : nodes) {
            if (!g.addNode(n)) std::cerr << "Node " << n << " already present\n";
        }
        for (const auto& e : edges) g.addEdge(std::get<0>(e), std::get<1>(e), std::get<2>(e));

        std::cout << g.label() << "\n";                       // e.g. UndirectedGraph(3V,6E)

        auto labels = g.nodes();
        std::vector<Graph::Label> sorted(labels.begin(), labels.end());
        std::sort(sorted.begin(), sorted.end());              // unordered storage, ordered output
        std::cout << "Nodes:";
        for (const auto& n : sorted) std::cout << " " << n;
        std::cout << "\n";

        auto all = g.edges();
        std::sort(all.begin(), all.end());
        std::cout << "Edges:\n";
        for (const auto& e : all) {
            std::cout << "  " << std::get<0>(e) << " -> " << std::get<1>(e)
                      << " (" << std::get<2>(e) << ")\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;                                                 // success
}

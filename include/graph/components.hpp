#pragma once

#include "graph/vault_graph.hpp"
#include <string>
#include <vector>

namespace vgraph {

// Member paths of one component, sorted
using Component = std::vector<std::string>;

/**
 * @brief Weak and strong component partitions of the note graph
 *
 * Both lists cover every node (isolated nodes are singletons). Lists are
 * ordered by size descending, then by first member path. Component IDs are
 * "comp<i>" and "scc<i>" by list position and are written onto the nodes.
 */
class ComponentFinder {
public:
    /**
     * @brief Union-find over the undirected view
     */
    static std::vector<Component> weak_components(const NodeMap& nodes);

    /**
     * @brief Tarjan's algorithm, iterative, visiting nodes in path order
     */
    static std::vector<Component> strong_components(const NodeMap& nodes);

    // Stamp weak_component / strong_component IDs onto nodes
    static void assign(NodeMap& nodes,
                       const std::vector<Component>& weak,
                       const std::vector<Component>& strong);

    // Sort members, then the list by size desc / first member
    static void sort_components(std::vector<Component>& components);
};

/**
 * @brief Disjoint-set forest with path halving and union by size
 */
class UnionFind {
public:
    explicit UnionFind(size_t n);

    size_t find(size_t x);
    bool unite(size_t a, size_t b);

private:
    std::vector<size_t> parent_;
    std::vector<size_t> size_;
};

} // namespace vgraph

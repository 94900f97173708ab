#ifndef VGRAPH_VAULT_GRAPH_HPP
#define VGRAPH_VAULT_GRAPH_HPP

#include "vault/note_entry.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace vgraph {

/**
 * @brief A note that links to this one, with the variant of its first link
 */
struct Backlink {
    std::string referrer;
    LinkKind kind = LinkKind::BASIC;

    nlohmann::json to_json() const;
};

/**
 * @brief Represents a note in the link graph
 *
 * Created by GraphBuilder. Scores and component/community IDs are filled in
 * by the later analysis phases and frozen once the analysis returns.
 */
struct GraphNode {
    std::string path;                                  // Unique key
    std::string title;
    std::vector<std::string> tags;
    std::map<std::string, std::string> properties;     // Frontmatter scalars
    std::vector<std::string> neighbors;                // Outbound targets, deduplicated, source order
    std::vector<Backlink> backlinks;                   // Sorted by referrer
    int inbound = 0;
    int outbound = 0;
    double hub = 0.0;
    double authority = 0.0;
    std::string community;                             // Empty when unassigned
    std::string strong_component;
    std::string weak_component;
    std::optional<TimePoint> modified;

    bool is_orphan() const { return inbound == 0 && outbound == 0; }
    bool links_to(const std::string& target) const;

    /**
     * @brief Convert node to JSON representation
     */
    nlohmann::json to_json() const;
};

// Path-ordered so every traversal is deterministic
using NodeMap = std::map<std::string, GraphNode>;

// Undirected view: each node's distinct neighbors in either direction, sorted
using UndirectedAdjacency = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Options controlling which notes and links become graph structure
 */
struct BuildOptions {
    bool skip_anchors = false;                  // Drop [[x#heading]] and [[x#^block]] links
    bool skip_embeds = false;                   // Drop ![[x]] links
    std::vector<std::string> include_patterns;  // Note selectors; empty = all
    std::vector<std::string> exclude_patterns;
    int min_degree = 2;                         // inbound + outbound floor; 0 disables
    bool mutual_only = false;                   // Keep only reciprocated links
};

/**
 * @brief Turns note entries into a directed adjacency
 *
 * Order of operations: selector filtering, link filtering and resolution,
 * optional mutual-only restriction, then a single min-degree pruning pass.
 * Pruning does not cascade: a node whose degree drops below the threshold
 * because a neighbor was pruned is kept.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(BuildOptions options = {});

    NodeMap build(const std::vector<NoteEntry>& entries);

    // Notes dropped by include/exclude selectors in the last build
    const std::set<std::string>& filtered_out() const { return filtered_; }

    // Notes removed by min-degree pruning in the last build
    const std::set<std::string>& pruned() const { return pruned_; }

private:
    bool keep_link(const NoteLink& link) const;
    void apply_mutual_only(NodeMap& nodes) const;
    void apply_min_degree(NodeMap& nodes);
    void rebuild_backlinks(NodeMap& nodes) const;

    BuildOptions options_;
    std::set<std::string> filtered_;
    std::set<std::string> pruned_;
    std::map<std::pair<std::string, std::string>, LinkKind> edge_kinds_;
};

// ==========================================
// Graph helpers
// ==========================================

// Recompute inbound/outbound counts from neighbor lists
void recount_degrees(NodeMap& nodes);

// Number of directed edges
size_t count_edges(const NodeMap& nodes);

UndirectedAdjacency undirected_adjacency(const NodeMap& nodes);

} // namespace vgraph

#endif // VGRAPH_VAULT_GRAPH_HPP

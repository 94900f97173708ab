#include "graph/vault_graph.hpp"
#include "vault/note_selector.hpp"
#include <algorithm>

namespace vgraph {

// ==========================================
// Backlink / GraphNode Implementation
// ==========================================

nlohmann::json Backlink::to_json() const {
    nlohmann::json j;
    j["referrer"] = referrer;
    j["linkType"] = link_kind_to_string(kind);
    return j;
}

bool GraphNode::links_to(const std::string& target) const {
    return std::find(neighbors.begin(), neighbors.end(), target) != neighbors.end();
}

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["path"] = path;
    j["title"] = title;
    j["tags"] = tags;
    j["neighbors"] = neighbors;
    j["inbound"] = inbound;
    j["outbound"] = outbound;
    j["hub"] = hub;
    j["authority"] = authority;
    j["community"] = community;
    j["strongComponent"] = strong_component;
    j["weakComponent"] = weak_component;
    if (modified) {
        j["modified"] = format_timestamp(*modified);
    }
    return j;
}

// ==========================================
// GraphBuilder Implementation
// ==========================================

GraphBuilder::GraphBuilder(BuildOptions options)
    : options_(std::move(options)) {}

bool GraphBuilder::keep_link(const NoteLink& link) const {
    if (options_.skip_embeds && link.kind == LinkKind::EMBED) {
        return false;
    }
    if (options_.skip_anchors && link.kind != LinkKind::EMBED &&
        (link.anchored || link.kind == LinkKind::HEADING || link.kind == LinkKind::BLOCK)) {
        return false;
    }
    return true;
}

NodeMap GraphBuilder::build(const std::vector<NoteEntry>& entries) {
    filtered_.clear();
    pruned_.clear();
    edge_kinds_.clear();

    auto include = parse_selectors(options_.include_patterns);
    auto exclude = parse_selectors(options_.exclude_patterns);

    NodeMap nodes;
    std::vector<const NoteEntry*> kept;
    kept.reserve(entries.size());

    for (const auto& entry : entries) {
        std::string path = normalize_path(add_md_suffix(entry.path));
        if (nodes.count(path) || filtered_.count(path)) {
            continue;  // First entry for a path wins
        }
        if (!passes_filters(include, exclude, entry)) {
            filtered_.insert(path);
            continue;
        }

        GraphNode node;
        node.path = path;
        node.title = entry.title.empty() ? path_basename(strip_extension(path)) : entry.title;
        node.tags = entry.tags;
        node.properties = entry.frontmatter;
        node.modified = entry.modified;
        nodes.emplace(path, std::move(node));
        kept.push_back(&entry);
    }

    for (const auto* entry : kept) {
        std::string src = normalize_path(add_md_suffix(entry->path));
        GraphNode& node = nodes.at(src);
        std::set<std::string> seen;

        for (const auto& link : entry->links) {
            if (!keep_link(link)) continue;
            std::string dst = normalize_path(add_md_suffix(link.target));
            if (dst == src || !nodes.count(dst)) {
                continue;  // Self links and targets outside the graph are ignored
            }
            if (seen.insert(dst).second) {
                node.neighbors.push_back(dst);
                edge_kinds_.emplace(std::make_pair(src, dst), link.kind);
            }
        }
    }

    recount_degrees(nodes);

    if (options_.mutual_only) {
        apply_mutual_only(nodes);
        recount_degrees(nodes);
    }

    if (options_.min_degree > 0) {
        apply_min_degree(nodes);
    }

    rebuild_backlinks(nodes);
    return nodes;
}

void GraphBuilder::apply_mutual_only(NodeMap& nodes) const {
    // Decide against the unfiltered graph, then apply
    std::map<std::string, std::vector<std::string>> kept;
    for (const auto& [path, node] : nodes) {
        auto& out = kept[path];
        for (const auto& dst : node.neighbors) {
            if (nodes.at(dst).links_to(path)) {
                out.push_back(dst);
            }
        }
    }
    for (auto& [path, node] : nodes) {
        node.neighbors = std::move(kept[path]);
    }
}

void GraphBuilder::apply_min_degree(NodeMap& nodes) {
    for (const auto& [path, node] : nodes) {
        if (node.inbound + node.outbound < options_.min_degree) {
            pruned_.insert(path);
        }
    }
    if (pruned_.empty()) {
        return;
    }

    for (const auto& path : pruned_) {
        nodes.erase(path);
    }
    for (auto& [path, node] : nodes) {
        node.neighbors.erase(
            std::remove_if(node.neighbors.begin(), node.neighbors.end(),
                           [this](const std::string& dst) { return pruned_.count(dst) > 0; }),
            node.neighbors.end());
    }
    recount_degrees(nodes);
}

void GraphBuilder::rebuild_backlinks(NodeMap& nodes) const {
    for (auto& [path, node] : nodes) {
        node.backlinks.clear();
    }
    // Outer loop is path-ordered, so each backlink list ends up sorted by referrer
    for (const auto& [src, node] : nodes) {
        for (const auto& dst : node.neighbors) {
            Backlink bl;
            bl.referrer = src;
            auto it = edge_kinds_.find({src, dst});
            if (it != edge_kinds_.end()) bl.kind = it->second;
            nodes.at(dst).backlinks.push_back(bl);
        }
    }
}

// ==========================================
// Graph helpers
// ==========================================

void recount_degrees(NodeMap& nodes) {
    for (auto& [path, node] : nodes) {
        node.inbound = 0;
        node.outbound = static_cast<int>(node.neighbors.size());
    }
    for (const auto& [path, node] : nodes) {
        for (const auto& dst : node.neighbors) {
            auto it = nodes.find(dst);
            if (it != nodes.end()) {
                it->second.inbound++;
            }
        }
    }
}

size_t count_edges(const NodeMap& nodes) {
    size_t edges = 0;
    for (const auto& [path, node] : nodes) {
        edges += node.neighbors.size();
    }
    return edges;
}

UndirectedAdjacency undirected_adjacency(const NodeMap& nodes) {
    std::map<std::string, std::set<std::string>> sets;
    for (const auto& [path, node] : nodes) {
        sets[path];
        for (const auto& dst : node.neighbors) {
            if (!nodes.count(dst) || dst == path) continue;
            sets[path].insert(dst);
            sets[dst].insert(path);
        }
    }

    UndirectedAdjacency adj;
    for (auto& [path, s] : sets) {
        adj[path] = std::vector<std::string>(s.begin(), s.end());
    }
    return adj;
}

} // namespace vgraph

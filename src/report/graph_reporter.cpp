#include "report/graph_reporter.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace vgraph {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string tag_suffix(const std::vector<std::string>& tags) {
    if (tags.empty()) return "";
    return " tags:" + join(tags, ",");
}

template <typename T>
std::vector<T> head(const std::vector<T>& items, int limit) {
    if (limit <= 0 || static_cast<size_t>(limit) >= items.size()) {
        return items;
    }
    return std::vector<T>(items.begin(), items.begin() + limit);
}

// Rank by a metric descending, ties by path
template <typename Metric>
std::vector<const GraphNode*> rank_nodes(const NodeMap& nodes, Metric metric) {
    std::vector<const GraphNode*> ranked;
    ranked.reserve(nodes.size());
    for (const auto& [path, node] : nodes) {
        ranked.push_back(&node);
    }
    std::sort(ranked.begin(), ranked.end(), [&metric](const GraphNode* a, const GraphNode* b) {
        auto ma = metric(*a);
        auto mb = metric(*b);
        if (ma != mb) return ma > mb;
        return a->path < b->path;
    });
    return ranked;
}

} // namespace

GraphReporter::GraphReporter(const AnalysisResult& result, ReportConfig config)
    : result_(result), config_(std::move(config)) {}

// ==========================================
// Helpers
// ==========================================

size_t GraphReporter::effective_limit(size_t available) const {
    if (config_.show_all || config_.limit <= 0) {
        return available;
    }
    return std::min(available, static_cast<size_t>(config_.limit));
}

bool GraphReporter::truncated(size_t shown, size_t available) const {
    return !config_.show_all && shown < available;
}

std::string GraphReporter::color_community(const std::string& id) const {
    if (config_.no_color) {
        return id;
    }
    return "\033[36m" + id + "\033[0m";
}

std::string GraphReporter::format_tags(const std::vector<TagCount>& tags, size_t limit, bool ellipsis) const {
    std::vector<std::string> parts;
    for (size_t i = 0; i < tags.size() && i < limit; ++i) {
        parts.push_back(tags[i].tag + "(" + std::to_string(tags[i].count) + ")");
    }
    if (ellipsis && limit < tags.size()) {
        parts.push_back("...");
    }
    return join(parts, ", ");
}

double GraphReporter::fraction_of_vault(const CommunitySummary& community) const {
    if (result_.stats.node_count == 0) return 0.0;
    return static_cast<double>(community.size()) / static_cast<double>(result_.stats.node_count);
}

std::string GraphReporter::generate_header(const std::string& title) const {
    std::stringstream ss;
    ss << title << " \"" << config_.vault_name << "\"";
    if (!config_.vault_path.empty()) {
        ss << " (" << config_.vault_path << ")";
    }
    ss << "\n";
    return ss.str();
}

std::vector<const CommunitySummary*> GraphReporter::communities_by_recency() const {
    std::vector<const CommunitySummary*> ordered;
    for (const auto& c : result_.communities) {
        ordered.push_back(&c);
    }
    std::sort(ordered.begin(), ordered.end(), [](const CommunitySummary* a, const CommunitySummary* b) {
        if (a->recency.has_value() != b->recency.has_value()) {
            return a->recency.has_value();
        }
        if (a->recency && a->recency->latest_age_days != b->recency->latest_age_days) {
            return a->recency->latest_age_days < b->recency->latest_age_days;
        }
        if (a->size() != b->size()) return a->size() > b->size();
        return a->id < b->id;
    });
    return ordered;
}

void GraphReporter::save_to_file(const std::string& path, const std::string& content) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << content;
}

// ==========================================
// Degrees
// ==========================================

std::string GraphReporter::generate_top_section(const std::string& title,
                                                const std::vector<const GraphNode*>& ranked,
                                                const RowFormatter& row) const {
    std::stringstream ss;
    size_t max = effective_limit(ranked.size());
    ss << "Top " << max << " by " << title << ":\n";
    for (size_t i = 0; i < max; ++i) {
        ss << "  " << (i + 1) << ") " << ranked[i]->path << " " << row(*ranked[i]) << "\n";
    }
    if (truncated(max, ranked.size())) {
        ss << "  ... (" << (ranked.size() - max) << " more)\n";
    }
    return ss.str();
}

std::string GraphReporter::degrees() const {
    std::stringstream ss;
    ss << generate_header("Graph for vault");
    ss << "Nodes: " << result_.stats.node_count
       << "  Edges: " << result_.stats.edge_count
       << "  Orphans: " << result_.orphans.size()
       << "  Communities: " << result_.communities.size() << "\n\n";

    if (result_.nodes.empty()) {
        return ss.str();
    }

    auto scores = [](const GraphNode& n, bool hub_first) {
        return hub_first
            ? "hub=" + fixed(n.hub, 4) + " auth=" + fixed(n.authority, 4)
            : "auth=" + fixed(n.authority, 4) + " hub=" + fixed(n.hub, 4);
    };

    ss << generate_top_section("authority (cornerstone concepts)",
                               rank_nodes(result_.nodes, [](const GraphNode& n) { return n.authority; }),
                               [&scores](const GraphNode& n) {
                                   return scores(n, false) + " in=" + std::to_string(n.inbound) +
                                          " out=" + std::to_string(n.outbound) +
                                          " community=" + n.community + tag_suffix(n.tags);
                               });
    ss << "\n";
    ss << generate_top_section("hub (index/MOC notes)",
                               rank_nodes(result_.nodes, [](const GraphNode& n) { return n.hub; }),
                               [&scores](const GraphNode& n) {
                                   return scores(n, true) + " in=" + std::to_string(n.inbound) +
                                          " out=" + std::to_string(n.outbound) +
                                          " community=" + n.community + tag_suffix(n.tags);
                               });
    ss << "\n";
    ss << generate_top_section("inbound links",
                               rank_nodes(result_.nodes, [](const GraphNode& n) { return n.inbound; }),
                               [&scores](const GraphNode& n) {
                                   return "in=" + std::to_string(n.inbound) +
                                          " out=" + std::to_string(n.outbound) + " " +
                                          scores(n, false) + " community=" + n.community;
                               });
    ss << "\n";
    ss << generate_top_section("outbound links",
                               rank_nodes(result_.nodes, [](const GraphNode& n) { return n.outbound; }),
                               [&scores](const GraphNode& n) {
                                   return "out=" + std::to_string(n.outbound) +
                                          " in=" + std::to_string(n.inbound) + " " +
                                          scores(n, false) + " community=" + n.community;
                               });
    return ss.str();
}

// ==========================================
// Communities
// ==========================================

std::string GraphReporter::generate_community_block(const CommunitySummary& c) const {
    std::stringstream ss;
    ss << "  community " << color_community(c.id) << " (size " << c.size() << ")\n";
    if (!c.anchor.empty()) {
        ss << "    anchor: " << c.anchor << "\n";
    }
    if (c.density > 0) {
        ss << "    density: " << fixed(c.density, 3) << "\n";
    }
    if (c.recency) {
        ss << "    recency: " << fixed(c.recency->latest_age_days, 1) << " days ago ("
           << c.recency->recent_count << " in last " << c.recency->window_days << "d)\n";
    }
    if (!c.top_tags.empty()) {
        ss << "    tags: " << format_tags(c.top_tags, effective_limit(c.top_tags.size()), !config_.show_all) << "\n";
    }

    size_t note_limit = effective_limit(c.top_authority.size());
    if (note_limit > 0) {
        ss << "    top notes (by authority):\n";
        for (size_t i = 0; i < note_limit; ++i) {
            const auto& score = c.top_authority[i];
            const GraphNode& n = result_.nodes.at(score.path);
            ss << "      " << (i + 1) << ") " << score.path
               << " auth=" << fixed(score.authority, 4) << " hub=" << fixed(score.hub, 4)
               << " in=" << n.inbound << " out=" << n.outbound << tag_suffix(n.tags) << "\n";
        }
        if (truncated(note_limit, c.top_authority.size())) {
            ss << "      ... (" << (c.top_authority.size() - note_limit) << " more)\n";
        }
    }
    if (!c.bridges.empty()) {
        ss << "    bridges: " << join(c.bridge_paths(config_.bridge_limit), ", ") << "\n";
    }
    return ss.str();
}

std::string GraphReporter::communities() const {
    std::stringstream ss;
    ss << generate_header("Communities for vault");
    if (result_.communities.empty()) {
        ss << "  (none)\n";
        return ss.str();
    }

    auto ordered = communities_by_recency();
    size_t limit = effective_limit(ordered.size());
    if (truncated(limit, ordered.size())) {
        ss << "Showing top " << limit << " of " << ordered.size() << " communities:\n";
    }
    for (size_t i = 0; i < limit; ++i) {
        if (i > 0) {
            ss << std::string(40, '-') << "\n";
        }
        ss << "\n";
        ss << generate_community_block(*ordered[i]);
        ss << "\n";
    }
    return ss.str();
}

const CommunitySummary& GraphReporter::resolve_community(const std::string& key) const {
    if (const CommunitySummary* c = result_.find_community(key)) {
        return *c;
    }

    std::string normalized = add_md_suffix(normalize_path(key));
    if (!config_.vault_path.empty()) {
        std::string root = normalize_path(config_.vault_path);
        if (!root.empty() && normalized.rfind(root + "/", 0) == 0) {
            normalized = normalized.substr(root.size() + 1);
        }
    }

    const GraphNode* node = result_.find_node(normalized);
    if (!node) {
        if (result_.pruned.count(normalized)) {
            throw LookupError("community " + key + " not found and file " + key +
                              " was pruned from the graph (degree below minDegree " +
                              std::to_string(result_.min_degree) + "; lower --min-degree to keep it)");
        }
        if (result_.filtered_out.count(normalized)) {
            throw LookupError("community " + key + " not found and file " + key +
                              " is excluded by include/exclude filters");
        }
        throw LookupError("community " + key + " not found and file " + key +
                          " not in graph (use vault-relative paths, ensure it exists, "
                          "and check include/exclude filters)");
    }

    const CommunitySummary* c = result_.community_of(node->path);
    if (!c) {
        throw LookupError("file " + key + " is not assigned to a community under current filters");
    }
    return *c;
}

std::string GraphReporter::community_detail(const std::string& key) const {
    const CommunitySummary& c = resolve_community(key);

    std::stringstream ss;
    ss << "Community " << color_community(c.id) << " (size " << c.size() << ") in vault \""
       << config_.vault_name << "\"\n";
    if (!c.anchor.empty()) {
        ss << "  anchor: " << c.anchor << "\n";
    }
    if (c.density > 0) {
        ss << "  density: " << fixed(c.density, 3) << "\n";
    }
    ss << "  edges (internal): " << c.internal_edges << "\n";
    if (!c.top_tags.empty()) {
        ss << "  tags: " << format_tags(c.top_tags, c.top_tags.size(), false) << "\n";
    }
    if (!c.bridges.empty()) {
        ss << "  bridges: " << join(c.bridge_paths(), ", ") << "\n";
    }

    // Every member, not just the summary's top slice
    auto members = top_authority_for(c.members, result_.nodes, c.members.size());
    size_t limit = effective_limit(members.size());

    ss << "\nMembers (sorted by authority):\n";
    for (size_t i = 0; i < limit; ++i) {
        const GraphNode& n = result_.nodes.at(members[i].path);
        ss << "  " << (i + 1) << ") " << n.path
           << " auth=" << fixed(n.authority, 4) << " hub=" << fixed(n.hub, 4)
           << " in=" << n.inbound << " out=" << n.outbound;
        if (config_.member_tags) {
            ss << tag_suffix(n.tags);
        }
        ss << "\n";
        if (config_.member_neighbors) {
            ss << "      neighbors: " << join(n.neighbors, ", ") << "\n";
        }
    }
    if (truncated(limit, members.size())) {
        ss << "  ... (" << (members.size() - limit) << " more)\n";
    }
    return ss.str();
}

// ==========================================
// Clusters / orphans / timings
// ==========================================

std::string GraphReporter::clusters() const {
    std::stringstream ss;
    ss << generate_header("Mutual-link clusters for vault");

    auto list = result_.clusters();
    if (list.empty()) {
        ss << "  (none)\n";
        return ss.str();
    }

    size_t limit = effective_limit(list.size());
    if (truncated(limit, list.size())) {
        ss << "Showing top " << limit << " of " << list.size() << " clusters:\n";
    }
    for (size_t i = 0; i < limit; ++i) {
        ss << "  size " << list[i].size() << ": " << join(list[i], ", ") << "\n";
    }
    if (truncated(limit, list.size())) {
        ss << "  ... (" << (list.size() - limit) << " more)\n";
    }
    return ss.str();
}

std::string GraphReporter::orphans() const {
    std::stringstream ss;
    ss << "Orphans (no inbound or outbound wikilinks) in \"" << config_.vault_name << "\"";
    if (!config_.vault_path.empty()) {
        ss << " (" << config_.vault_path << ")";
    }
    ss << ":\n";
    if (result_.orphans.empty()) {
        ss << "  (none)\n";
        return ss.str();
    }
    for (const auto& path : result_.orphans) {
        ss << "  " << path << "\n";
    }
    return ss.str();
}

std::string GraphReporter::timings() const {
    const auto& t = result_.timings;
    std::stringstream ss;
    ss << "Timings:\n";
    ss << "  load:       " << AnalysisTimings::to_millis(t.load) << " ms\n";
    ss << "  build:      " << AnalysisTimings::to_millis(t.build) << " ms\n";
    ss << "  hits:       " << AnalysisTimings::to_millis(t.hits) << " ms\n";
    ss << "  components: " << AnalysisTimings::to_millis(t.components) << " ms\n";
    ss << "  label:      " << AnalysisTimings::to_millis(t.label_propagation) << " ms\n";
    ss << "  recency:    " << AnalysisTimings::to_millis(t.recency) << " ms\n";
    ss << "  summaries:  " << AnalysisTimings::to_millis(t.summaries) << " ms\n";
    ss << "  total:      " << AnalysisTimings::to_millis(t.total) << " ms\n";
    return ss.str();
}

// ==========================================
// JSON reports
// ==========================================

nlohmann::json GraphReporter::community_context(const CommunitySummary& c, bool include_tags) const {
    nlohmann::json j;
    j["id"] = c.id;
    j["size"] = c.size();
    j["fractionOfVault"] = fraction_of_vault(c);
    j["anchor"] = c.anchor;
    j["density"] = c.density;
    j["recency"] = c.recency ? c.recency->to_json() : nlohmann::json(nullptr);
    if (include_tags) {
        j["topTags"] = nlohmann::json::array();
        for (const auto& t : c.top_tags) {
            j["topTags"].push_back({{"tag", t.tag}, {"count", t.count}});
        }
    }
    return j;
}

nlohmann::json GraphReporter::note_context(const std::vector<std::string>& paths,
                                           const NoteContextOptions& options) const {
    nlohmann::json contexts = nlohmann::json::array();

    for (const auto& raw : paths) {
        std::string target = add_md_suffix(normalize_path(raw));
        nlohmann::json ctx;
        ctx["path"] = target;

        auto it = result_.nodes.find(target);
        if (it == result_.nodes.end()) {
            ctx["error"] = "not found in graph (respect include/exclude filters)";
            contexts.push_back(ctx);
            continue;
        }
        const GraphNode& node = it->second;

        ctx["title"] = node.title;
        if (options.include_tags) {
            ctx["tags"] = node.tags;
        }
        if (options.include_frontmatter) {
            ctx["frontmatter"] = node.properties;
        }
        ctx["graph"] = {
            {"inbound", node.inbound},
            {"outbound", node.outbound},
            {"hub", node.hub},
            {"authority", node.authority}
        };

        if (const CommunitySummary* c = result_.community_of(target)) {
            ctx["community"] = community_context(*c, options.include_tags);
        }

        if (options.include_neighbors) {
            std::vector<std::string> links_in;
            for (const auto& b : node.backlinks) {
                links_in.push_back(b.referrer);
            }
            ctx["neighbors"] = {
                {"linksOut", head(node.neighbors, options.neighbor_limit)},
                {"linksIn", head(links_in, options.neighbor_limit)}
            };
        }

        if (options.include_backlinks && !node.backlinks.empty()) {
            ctx["backlinks"] = nlohmann::json::array();
            for (const auto& b : head(node.backlinks, options.backlink_limit)) {
                ctx["backlinks"].push_back(b.to_json());
            }
        }

        contexts.push_back(ctx);
    }

    nlohmann::json payload;
    payload["contexts"] = contexts;
    payload["count"] = contexts.size();
    if (options.include_timings) {
        payload["timings"] = result_.timings.to_json();
    }
    return payload;
}

nlohmann::json GraphReporter::vault_context(const VaultContextOptions& options) const {
    nlohmann::json payload;
    payload["stats"] = {
        {"nodeCount", result_.stats.node_count},
        {"edgeCount", result_.stats.edge_count}
    };
    payload["orphanCount"] = result_.orphans.size();
    payload["orphans"] = result_.orphans;
    payload["components"] = result_.weak_components;

    size_t max = result_.communities.size();
    if (options.max_communities > 0) {
        max = std::min(max, static_cast<size_t>(options.max_communities));
    }
    int top_notes = options.community_top_notes > 0 ? options.community_top_notes : 5;
    int top_tags = options.community_top_tags > 0 ? options.community_top_tags : 5;

    payload["communities"] = nlohmann::json::array();
    for (size_t i = 0; i < max; ++i) {
        const auto& c = result_.communities[i];
        nlohmann::json j = community_context(c, false);
        j["topTags"] = nlohmann::json::array();
        for (const auto& t : head(c.top_tags, top_tags)) {
            j["topTags"].push_back({{"tag", t.tag}, {"count", t.count}});
        }
        j["topAuthority"] = nlohmann::json::array();
        for (const auto& a : head(c.top_authority, top_notes)) {
            j["topAuthority"].push_back({{"path", a.path}, {"authority", a.authority}, {"hub", a.hub}});
        }
        if (c.authority_stats) {
            j["authorityStats"] = c.authority_stats->to_json();
        }
        payload["communities"].push_back(j);
    }

    if (options.include_timings) {
        payload["timings"] = result_.timings.to_json();
    }
    return payload;
}

} // namespace vgraph

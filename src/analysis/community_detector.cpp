#include "analysis/community_detector.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace vgraph {

// ==========================================
// JSON
// ==========================================

nlohmann::json AuthorityStats::to_json() const {
    return {
        {"mean", mean}, {"p50", p50}, {"p75", p75}, {"p90", p90},
        {"p95", p95}, {"p99", p99}, {"max", max}
    };
}

nlohmann::json AuthorityBucket::to_json() const {
    return {{"low", low}, {"high", high}, {"count", count}, {"example", example}};
}

nlohmann::json CommunityRecency::to_json() const {
    nlohmann::json j;
    j["latestPath"] = latest_path;
    j["latestAgeDays"] = latest_age_days;
    j["latestTimestamp"] = format_timestamp(latest_timestamp);
    j["recentCount"] = recent_count;
    j["windowDays"] = window_days;
    return j;
}

bool CommunitySummary::contains(const std::string& path) const {
    return std::binary_search(members.begin(), members.end(), path);
}

std::vector<std::string> CommunitySummary::bridge_paths(size_t limit) const {
    std::vector<std::string> paths;
    for (const auto& b : bridges) {
        if (limit > 0 && paths.size() >= limit) break;
        paths.push_back(b.path);
    }
    return paths;
}

nlohmann::json CommunitySummary::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["size"] = members.size();
    j["nodes"] = members;
    j["anchor"] = anchor;
    j["internalEdges"] = internal_edges;
    j["density"] = density;

    j["topTags"] = nlohmann::json::array();
    for (const auto& t : top_tags) {
        j["topTags"].push_back({{"tag", t.tag}, {"count", t.count}});
    }
    j["topAuthority"] = nlohmann::json::array();
    for (const auto& a : top_authority) {
        j["topAuthority"].push_back({{"path", a.path}, {"authority", a.authority}, {"hub", a.hub}});
    }
    if (authority_stats) {
        j["authorityStats"] = authority_stats->to_json();
    }
    j["authorityBuckets"] = nlohmann::json::array();
    for (const auto& b : authority_buckets) {
        j["authorityBuckets"].push_back(b.to_json());
    }
    j["recency"] = recency ? recency->to_json() : nlohmann::json(nullptr);
    j["bridges"] = bridge_paths();
    return j;
}

// ==========================================
// CommunityDetector
// ==========================================

CommunityDetector::CommunityDetector(CommunityOptions options)
    : options_(options) {}

LabelPropagationResult CommunityDetector::propagate(const NodeMap& nodes) const {
    LabelPropagationResult result;
    UndirectedAdjacency adj = undirected_adjacency(nodes);

    for (const auto& [path, node] : nodes) {
        result.labels[path] = path;
    }
    if (nodes.empty()) {
        result.converged = true;
        return result;
    }

    for (int round = 0; round < options_.max_rounds; ++round) {
        bool changed = false;
        for (const auto& [path, neighbors] : adj) {
            if (neighbors.empty()) continue;

            // std::map iterates labels ascending, so '>' keeps the lowest on ties
            std::map<std::string, int> counts;
            for (const auto& n : neighbors) {
                counts[result.labels[n]]++;
            }
            const std::string* best = nullptr;
            int best_count = 0;
            for (const auto& [label, count] : counts) {
                if (count > best_count) {
                    best = &label;
                    best_count = count;
                }
            }

            if (best && *best != result.labels[path]) {
                result.labels[path] = *best;
                changed = true;
            }
        }
        result.rounds = round + 1;
        if (!changed) {
            result.converged = true;
            break;
        }
    }
    return result;
}

std::vector<CommunitySummary> CommunityDetector::summarize(NodeMap& nodes,
                                                           const std::map<std::string, std::string>& labels,
                                                           const TimeMap& effective_times,
                                                           TimePoint now) const {
    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& [path, label] : labels) {
        if (nodes.count(path)) {
            grouped[label].push_back(path);
        }
    }

    std::vector<CommunitySummary> communities;
    for (auto& [label, members] : grouped) {
        if (members.size() == 1 && !options_.include_singletons) {
            continue;
        }
        CommunitySummary summary;
        summary.members = std::move(members);
        std::sort(summary.members.begin(), summary.members.end());
        communities.push_back(std::move(summary));
    }

    std::sort(communities.begin(), communities.end(),
              [](const CommunitySummary& a, const CommunitySummary& b) {
                  if (a.members.size() != b.members.size()) return a.members.size() > b.members.size();
                  return a.members.front() < b.members.front();
              });

    for (auto& [path, node] : nodes) {
        node.community.clear();
    }
    for (size_t i = 0; i < communities.size(); ++i) {
        auto& summary = communities[i];
        summary.id = "c" + std::to_string(i + 1);
        for (const auto& m : summary.members) {
            nodes.at(m).community = summary.id;
        }
        fill_summary(summary, nodes, effective_times, now);
    }

    attach_bridges(communities, nodes);
    return communities;
}

void CommunityDetector::fill_summary(CommunitySummary& summary, const NodeMap& nodes,
                                     const TimeMap& effective_times, TimePoint now) const {
    summary.anchor = anchor_for(summary.members, nodes);
    summary.internal_edges = internal_edge_count(summary.members, nodes);
    summary.density = community_density(summary.internal_edges, summary.members.size());
    if (options_.include_tags) {
        summary.top_tags = top_tags_for(summary.members, nodes, options_.top_tags_limit);
    }
    summary.top_authority = top_authority_for(summary.members, nodes, options_.top_authority_limit);

    std::vector<double> values;
    values.reserve(summary.members.size());
    for (const auto& m : summary.members) {
        values.push_back(nodes.at(m).authority);
    }
    summary.authority_stats = authority_stats_for(values);
    summary.authority_buckets = authority_buckets_for(summary.members, nodes);
    summary.recency = community_recency(summary.members, effective_times, now,
                                        options_.recent_window_days);
}

void CommunityDetector::attach_bridges(std::vector<CommunitySummary>& communities,
                                       const NodeMap& nodes) const {
    std::map<std::string, int> cross;
    for (const auto& [src, node] : nodes) {
        if (node.community.empty()) continue;
        for (const auto& dst : node.neighbors) {
            auto it = nodes.find(dst);
            if (it == nodes.end() || it->second.community.empty()) continue;
            if (it->second.community != node.community) {
                cross[src]++;
                cross[dst]++;
            }
        }
    }

    for (auto& summary : communities) {
        summary.bridges.clear();
        for (const auto& m : summary.members) {
            auto it = cross.find(m);
            if (it != cross.end()) {
                summary.bridges.push_back({m, it->second});
            }
        }
        std::sort(summary.bridges.begin(), summary.bridges.end(),
                  [&nodes](const Bridge& a, const Bridge& b) {
                      if (a.cross_edges != b.cross_edges) return a.cross_edges > b.cross_edges;
                      double aa = nodes.at(a.path).authority;
                      double ba = nodes.at(b.path).authority;
                      if (aa != ba) return aa > ba;
                      return a.path < b.path;
                  });
    }
}

// ==========================================
// Summary helpers
// ==========================================

std::string anchor_for(const std::vector<std::string>& members, const NodeMap& nodes) {
    std::string best;
    double best_auth = -1.0;
    for (const auto& m : members) {
        double a = nodes.at(m).authority;
        if (best.empty() || a > best_auth || (a == best_auth && m < best)) {
            best = m;
            best_auth = a;
        }
    }
    return best;
}

int internal_edge_count(const std::vector<std::string>& members, const NodeMap& nodes) {
    std::set<std::string> member_set(members.begin(), members.end());
    int edges = 0;
    for (const auto& m : members) {
        for (const auto& dst : nodes.at(m).neighbors) {
            if (member_set.count(dst)) edges++;
        }
    }
    return edges;
}

double community_density(int internal_edges, size_t size) {
    if (size < 2) return 0.0;
    double n = static_cast<double>(size);
    return static_cast<double>(internal_edges) / (n * (n - 1.0));
}

std::vector<TagCount> top_tags_for(const std::vector<std::string>& members, const NodeMap& nodes, size_t limit) {
    std::map<std::string, int> counts;
    for (const auto& m : members) {
        for (auto tag : nodes.at(m).tags) {
            std::transform(tag.begin(), tag.end(), tag.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            counts[tag]++;
        }
    }

    std::vector<TagCount> list;
    for (const auto& [tag, count] : counts) {
        list.push_back({tag, count});
    }
    std::stable_sort(list.begin(), list.end(),
                     [](const TagCount& a, const TagCount& b) { return a.count > b.count; });
    if (list.size() > limit) {
        list.resize(limit);
    }
    return list;
}

std::vector<AuthorityScore> top_authority_for(const std::vector<std::string>& members, const NodeMap& nodes, size_t limit) {
    std::vector<AuthorityScore> list;
    for (const auto& m : members) {
        const auto& node = nodes.at(m);
        list.push_back({m, node.authority, node.hub});
    }
    std::sort(list.begin(), list.end(), [](const AuthorityScore& a, const AuthorityScore& b) {
        if (a.authority != b.authority) return a.authority > b.authority;
        return a.path < b.path;
    });
    if (list.size() > limit) {
        list.resize(limit);
    }
    return list;
}

std::optional<AuthorityStats> authority_stats_for(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double v : values) sum += v;
    std::sort(values.begin(), values.end());

    // Nearest-rank percentile
    auto pct = [&values](double q) {
        long idx = static_cast<long>(std::ceil(q * static_cast<double>(values.size()))) - 1;
        idx = std::max(0L, std::min(idx, static_cast<long>(values.size()) - 1));
        return values[static_cast<size_t>(idx)];
    };

    AuthorityStats stats;
    stats.mean = sum / static_cast<double>(values.size());
    stats.p50 = pct(0.50);
    stats.p75 = pct(0.75);
    stats.p90 = pct(0.90);
    stats.p95 = pct(0.95);
    stats.p99 = pct(0.99);
    stats.max = values.back();
    return stats;
}

int bucket_count_for(size_t size) {
    if (size == 0) return 0;
    int c = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(size))));
    return std::max(5, std::min(10, c));
}

std::vector<AuthorityBucket> authority_buckets_for(const std::vector<std::string>& members, const NodeMap& nodes) {
    std::vector<AuthorityBucket> buckets;
    if (members.empty()) {
        return buckets;
    }

    auto ranked = top_authority_for(members, nodes, members.size());
    size_t count = static_cast<size_t>(bucket_count_for(ranked.size()));
    size_t size = (ranked.size() + count - 1) / count;

    for (size_t i = 0; i < ranked.size(); i += size) {
        size_t end = std::min(i + size, ranked.size());
        AuthorityBucket bucket;
        bucket.high = ranked[i].authority;
        bucket.low = ranked[end - 1].authority;
        bucket.count = static_cast<int>(end - i);
        bucket.example = ranked[i].path;
        buckets.push_back(bucket);
    }
    return buckets;
}

std::optional<CommunityRecency> community_recency(const std::vector<std::string>& members,
                                                  const TimeMap& effective_times,
                                                  TimePoint now, int window_days) {
    if (members.empty() || window_days <= 0) {
        return std::nullopt;
    }

    CommunityRecency rec;
    rec.window_days = window_days;
    bool found = false;
    const auto window = std::chrono::hours(24 * window_days);

    for (const auto& m : members) {
        auto it = effective_times.find(m);
        if (it == effective_times.end()) continue;
        TimePoint ts = it->second;
        if (!found || ts > rec.latest_timestamp) {
            rec.latest_timestamp = ts;
            rec.latest_path = m;
            found = true;
        }
        if (now - ts <= window) {
            rec.recent_count++;
        }
    }
    if (!found) {
        return std::nullopt;
    }
    rec.latest_age_days = age_in_days(rec.latest_timestamp, now);
    return rec;
}

std::map<std::string, size_t> community_membership(const std::vector<CommunitySummary>& communities) {
    std::map<std::string, size_t> lookup;
    for (size_t i = 0; i < communities.size(); ++i) {
        for (const auto& m : communities[i].members) {
            lookup[m] = i;
        }
    }
    return lookup;
}

} // namespace vgraph

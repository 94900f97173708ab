#pragma once

#include "graph/vault_graph.hpp"
#include "analysis/recency.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace vgraph {

struct TagCount {
    std::string tag;
    int count = 0;
};

struct AuthorityScore {
    std::string path;
    double authority = 0.0;
    double hub = 0.0;
};

struct AuthorityStats {
    double mean = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    double max = 0.0;

    nlohmann::json to_json() const;
};

// One run of members with consecutive authority ranks
struct AuthorityBucket {
    double low = 0.0;
    double high = 0.0;
    int count = 0;
    std::string example;    // Highest-authority member of the run

    nlohmann::json to_json() const;
};

struct CommunityRecency {
    std::string latest_path;
    double latest_age_days = 0.0;
    TimePoint latest_timestamp;
    int recent_count = 0;
    int window_days = 0;

    nlohmann::json to_json() const;
};

struct Bridge {
    std::string path;
    int cross_edges = 0;    // Edges to or from other communities
};

/**
 * @brief Metadata for one label-propagation community
 */
struct CommunitySummary {
    std::string id;
    std::vector<std::string> members;                  // Sorted
    std::string anchor;                                // Highest authority, ties by path
    int internal_edges = 0;
    double density = 0.0;
    std::vector<TagCount> top_tags;
    std::vector<AuthorityScore> top_authority;
    std::optional<AuthorityStats> authority_stats;
    std::vector<AuthorityBucket> authority_buckets;
    std::optional<CommunityRecency> recency;           // Absent when no member is dated
    std::vector<Bridge> bridges;                       // Most cross edges first

    size_t size() const { return members.size(); }
    bool contains(const std::string& path) const;
    std::vector<std::string> bridge_paths(size_t limit = 0) const;

    nlohmann::json to_json() const;
};

struct CommunityOptions {
    int max_rounds = 20;
    bool include_singletons = true;     // Report one-member communities
    bool include_tags = true;
    size_t top_tags_limit = 5;
    size_t top_authority_limit = 5;
    int recent_window_days = 30;
};

struct LabelPropagationResult {
    std::map<std::string, std::string> labels;
    int rounds = 0;
    bool converged = false;
};

/**
 * @brief Label propagation plus per-community summaries
 *
 * Every node starts with its own path as label. Each round visits nodes in
 * path order and adopts the label most common among its undirected
 * neighbors, ties to the lexicographically lowest label. Updates are visible
 * within the same round. Stops on a round without changes or at max_rounds.
 */
class CommunityDetector {
public:
    explicit CommunityDetector(CommunityOptions options = {});

    LabelPropagationResult propagate(const NodeMap& nodes) const;

    /**
     * @brief Group labels into summaries and stamp community IDs on nodes
     *
     * Groups are ordered by size descending, then first member, and named
     * c1, c2, ... in that order. Nodes in suppressed singleton groups keep an
     * empty community ID.
     *
     * @param effective_times Recency per path, as produced by RecencyPropagator
     */
    std::vector<CommunitySummary> summarize(NodeMap& nodes,
                                            const std::map<std::string, std::string>& labels,
                                            const TimeMap& effective_times,
                                            TimePoint now) const;

private:
    void fill_summary(CommunitySummary& summary, const NodeMap& nodes,
                      const TimeMap& effective_times, TimePoint now) const;
    void attach_bridges(std::vector<CommunitySummary>& communities, const NodeMap& nodes) const;

    CommunityOptions options_;
};

// ==========================================
// Summary helpers
// ==========================================

std::string anchor_for(const std::vector<std::string>& members, const NodeMap& nodes);
int internal_edge_count(const std::vector<std::string>& members, const NodeMap& nodes);
double community_density(int internal_edges, size_t size);
std::vector<TagCount> top_tags_for(const std::vector<std::string>& members, const NodeMap& nodes, size_t limit);
std::vector<AuthorityScore> top_authority_for(const std::vector<std::string>& members, const NodeMap& nodes, size_t limit);
std::optional<AuthorityStats> authority_stats_for(std::vector<double> values);
std::vector<AuthorityBucket> authority_buckets_for(const std::vector<std::string>& members, const NodeMap& nodes);
int bucket_count_for(size_t size);
std::optional<CommunityRecency> community_recency(const std::vector<std::string>& members,
                                                  const TimeMap& effective_times,
                                                  TimePoint now, int window_days);

// Path -> summary index, for community-of-note lookups
std::map<std::string, size_t> community_membership(const std::vector<CommunitySummary>& communities);

} // namespace vgraph

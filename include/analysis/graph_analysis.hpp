#ifndef VGRAPH_GRAPH_ANALYSIS_HPP
#define VGRAPH_GRAPH_ANALYSIS_HPP

#include "graph/vault_graph.hpp"
#include "graph/hits.hpp"
#include "graph/components.hpp"
#include "analysis/recency.hpp"
#include "analysis/community_detector.hpp"
#include "vault/note_source.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <functional>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace vgraph {

/**
 * @brief Thrown when the analysis input is unusable (e.g. an entry without a path)
 */
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Everything that shapes one analysis run
 *
 * Passed by value into GraphAnalyzer and never changed afterwards, so
 * repeated runs with different options cannot interfere.
 */
struct AnalysisOptions {
    // Graph construction
    bool skip_anchors = false;
    bool skip_embeds = false;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    int min_degree = 2;
    bool mutual_only = false;

    // Community summaries
    bool include_tags = true;
    bool include_singleton_communities = true;
    size_t top_tags_limit = 5;
    size_t top_authority_limit = 5;
    int recent_window_days = 30;
    int label_propagation_rounds = 20;

    // Unset means enabled; an explicit false limits recency to direct neighbors
    std::optional<bool> recency_cascade;
    RecencyOptions recency;

    HitsOptions hits;

    // Reference time for ages; the wall clock when unset
    std::optional<TimePoint> now;

    bool cascade_enabled() const { return recency_cascade.value_or(true); }
    BuildOptions build_options() const;
    CommunityOptions community_options() const;

    nlohmann::json to_json() const;
};

struct GraphStats {
    size_t node_count = 0;
    size_t edge_count = 0;
};

/**
 * @brief Wall-clock time per phase; never influences results
 */
struct AnalysisTimings {
    using Duration = std::chrono::steady_clock::duration;

    Duration load{};
    Duration build{};
    Duration hits{};
    Duration components{};
    Duration label_propagation{};       // Label rounds only
    Duration recency{};
    Duration summaries{};               // Community aggregation
    Duration total{};

    // Any non-zero duration reports as at least 1 ms
    static long long to_millis(Duration d);

    nlohmann::json to_json() const;
};

struct AnalysisDiagnostics {
    HitsResult hits;
    int label_rounds = 0;
    bool labels_converged = false;

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable output of one analysis run
 */
struct AnalysisResult {
    NodeMap nodes;
    std::vector<CommunitySummary> communities;
    std::vector<Component> weak_components;
    std::vector<Component> strong_components;   // Full partition, singletons included
    std::vector<std::string> orphans;           // Sorted
    GraphStats stats;
    AnalysisTimings timings;
    TimeMap effective_times;
    TimePoint reference_time;
    AnalysisDiagnostics diagnostics;
    bool recency_cascade = true;
    int min_degree = 0;                         // Threshold the graph was pruned with

    std::set<std::string> filtered_out;         // Dropped by include/exclude
    std::set<std::string> pruned;               // Dropped by min-degree

    const GraphNode* find_node(const std::string& path) const;
    const CommunitySummary* find_community(const std::string& id) const;
    const CommunitySummary* community_of(const std::string& path) const;

    // Strong components with more than one member
    std::vector<Component> clusters() const;

    nlohmann::json to_json() const;
};

enum class AnalysisState {
    IDLE,
    LOADED,
    BUILT,
    SCORED,
    PARTITIONED,
    DETECTED,
    DONE,
    FAILED
};

std::string analysis_state_name(AnalysisState state);

// Progress callback
using AnalysisProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Runs build, scoring, partitioning and detection in sequence
 *
 * Any failure moves the analyzer to FAILED and propagates the exception;
 * no partial result is returned.
 */
class GraphAnalyzer {
public:
    explicit GraphAnalyzer(AnalysisOptions options = {});

    void set_progress_callback(AnalysisProgressCallback cb) { progress_cb_ = std::move(cb); }

    /**
     * @brief Load entries from a source, then analyze them
     * @param ignore_prefixes Vault-relative prefixes the loader skips
     */
    AnalysisResult run(NoteSource& source, const std::vector<std::string>& ignore_prefixes = {});

    /**
     * @brief Analyze already-loaded entries
     */
    AnalysisResult run(const std::vector<NoteEntry>& entries);

    AnalysisState state() const { return state_; }
    const AnalysisOptions& options() const { return options_; }

private:
    AnalysisResult analyze(const std::vector<NoteEntry>& entries, AnalysisTimings::Duration load_time);
    void transition(AnalysisState next);
    void validate_entries(const std::vector<NoteEntry>& entries) const;

    AnalysisOptions options_;
    AnalysisState state_ = AnalysisState::IDLE;
    AnalysisProgressCallback progress_cb_;
};

} // namespace vgraph

#endif // VGRAPH_GRAPH_ANALYSIS_HPP

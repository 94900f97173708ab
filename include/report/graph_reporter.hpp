#pragma once

#include "analysis/graph_analysis.hpp"
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace vgraph {

/**
 * @brief Thrown when a report cannot locate the community or note it was asked for
 */
class LookupError : public std::runtime_error {
public:
    explicit LookupError(const std::string& message) : std::runtime_error(message) {}
};

// Report configuration
struct ReportConfig {
    std::string vault_name;             ///< Label shown in report headers
    std::string vault_path;             ///< Absolute vault location, shown in parentheses
    int limit = 100;                    ///< Top-N rows per section; <= 0 means all
    bool show_all = false;              ///< Ignore limit entirely
    bool no_color = false;              ///< Plain community IDs (no ANSI escapes)
    bool member_tags = false;           ///< Community detail: print member tags
    bool member_neighbors = false;      ///< Community detail: print member neighbor lists
    size_t bridge_limit = 5;            ///< Bridges printed per community in listings
};

struct NoteContextOptions {
    bool include_tags = true;
    bool include_neighbors = true;
    bool include_backlinks = true;
    bool include_frontmatter = false;
    int neighbor_limit = 50;            ///< Per direction; 0 = all
    int backlink_limit = 50;            ///< 0 = all
    bool include_timings = false;
};

struct VaultContextOptions {
    int max_communities = 25;           ///< <= 0 means all
    int community_top_notes = 5;
    int community_top_tags = 5;
    bool include_timings = false;
};

/**
 * @brief Renders an AnalysisResult as text or JSON reports
 *
 * Reports only select, slice and sort fields of the result; nothing here
 * recomputes scores or memberships.
 */
class GraphReporter {
public:
    GraphReporter(const AnalysisResult& result, ReportConfig config = {});

    // Totals plus top-N by authority, hub, inbound and outbound
    std::string degrees() const;

    // All communities, most recently active first
    std::string communities() const;

    /**
     * @brief Detail for one community
     * @param key A community ID (e.g. "c3") or a vault-relative note path
     * @throws LookupError naming the likely cause when nothing matches
     */
    std::string community_detail(const std::string& key) const;

    /**
     * @brief Resolve a community ID or note path to its community
     * @throws LookupError as community_detail
     */
    const CommunitySummary& resolve_community(const std::string& key) const;

    // Strong components with more than one member
    std::string clusters() const;

    std::string orphans() const;

    std::string timings() const;

    nlohmann::json note_context(const std::vector<std::string>& paths,
                                const NoteContextOptions& options = {}) const;

    nlohmann::json vault_context(const VaultContextOptions& options = {}) const;

    // Communities in listing order: latest age ascending (undated last), size desc, ID
    std::vector<const CommunitySummary*> communities_by_recency() const;

    void save_to_file(const std::string& path, const std::string& content) const;

private:
    using RowFormatter = std::function<std::string(const GraphNode&)>;

    const AnalysisResult& result_;
    ReportConfig config_;

    // Section generators
    std::string generate_header(const std::string& title) const;
    std::string generate_top_section(const std::string& title,
                                     const std::vector<const GraphNode*>& ranked,
                                     const RowFormatter& row) const;
    std::string generate_community_block(const CommunitySummary& community) const;

    // Helpers
    size_t effective_limit(size_t available) const;
    bool truncated(size_t shown, size_t available) const;
    std::string color_community(const std::string& id) const;
    std::string format_tags(const std::vector<TagCount>& tags, size_t limit, bool ellipsis) const;
    nlohmann::json community_context(const CommunitySummary& community, bool include_tags) const;
    double fraction_of_vault(const CommunitySummary& community) const;
};

} // namespace vgraph

#ifndef VGRAPH_MARKDOWN_HPP
#define VGRAPH_MARKDOWN_HPP

#include "vault/note_entry.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace vgraph {

/**
 * @brief A wikilink as found in note text, before resolution
 */
struct RawWikilink {
    std::string target;     // Text inside [[ ]] up to '|', slashes normalized
    LinkKind kind = LinkKind::BASIC;
    bool anchored = false;
};

/**
 * @brief Frontmatter block between the leading "---" fences
 *
 * Only the flat subset used by note properties is understood: "key: value"
 * scalars, inline "[a, b]" lists and "- item" block lists.
 */
struct Frontmatter {
    std::map<std::string, std::string> scalars;
    std::map<std::string, std::vector<std::string>> lists;

    bool empty() const { return scalars.empty() && lists.empty(); }
    std::optional<std::string> get(const std::string& key) const;
};

/**
 * @brief Extract every wikilink and embed, embeds first, each classified by kind
 */
std::vector<RawWikilink> scan_wikilinks(const std::string& content);

Frontmatter parse_frontmatter(const std::string& content);

// Inline #tags outside fenced and inline code, in first-seen order
std::vector<std::string> extract_hashtags(const std::string& content);

// Frontmatter "tags" plus inline hashtags, lower-cased, unique, sorted
std::vector<std::string> extract_tags(const std::string& content, const Frontmatter& frontmatter);

/**
 * @brief Best-effort content timestamp for a note
 *
 * Tried in order: frontmatter date keys (event_date, meeting_date, updated,
 * modified, date, created), an ISO date in the path, the most recent dated
 * heading, an ISO date in the first 20 lines. Dates before 1900 or more than
 * a year past @p now are rejected; dates after @p now are clamped to it.
 */
std::optional<TimePoint> resolve_content_time(const std::string& path,
                                              const std::string& content,
                                              const Frontmatter& frontmatter,
                                              TimePoint now);

} // namespace vgraph

#endif // VGRAPH_MARKDOWN_HPP

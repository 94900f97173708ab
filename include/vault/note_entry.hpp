#ifndef VGRAPH_NOTE_ENTRY_HPP
#define VGRAPH_NOTE_ENTRY_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace vgraph {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Thrown for input failures: missing vault, unreadable note, bad snapshot
 */
class VaultError : public std::runtime_error {
public:
    explicit VaultError(const std::string& message) : std::runtime_error(message) {}
};

// Wikilink variant as written in the referring note
enum class LinkKind {
    BASIC,      // [[target]]
    ALIAS,      // [[target|shown]]
    HEADING,    // [[target#heading]]
    BLOCK,      // [[target#^block]]
    EMBED       // ![[target]]
};

std::string link_kind_to_string(LinkKind kind);
LinkKind link_kind_from_string(const std::string& s);

/**
 * @brief One outbound wikilink, already resolved to a vault path
 */
struct NoteLink {
    std::string target;                 // Normalized vault-relative path
    LinkKind kind = LinkKind::BASIC;
    bool anchored = false;              // Raw link carried a #heading or #^block part

    nlohmann::json to_json() const;
    static NoteLink from_json(const nlohmann::json& j);
};

/**
 * @brief Parsed note handed to the analysis engine
 *
 * Entries are an immutable snapshot for a single run. The engine never reads
 * note contents itself; loaders produce these.
 */
struct NoteEntry {
    std::string path;                                  // Vault-relative, ".md" suffix
    std::string title;
    std::vector<std::string> tags;                     // Lower-case, no leading '#'
    std::vector<NoteLink> links;                       // In source order
    std::map<std::string, std::string> frontmatter;    // Scalar values as written
    std::optional<TimePoint> modified;

    nlohmann::json to_json() const;
    static NoteEntry from_json(const nlohmann::json& j);
};

/**
 * @brief Options shared by every NoteSource
 */
struct LoaderOptions {
    std::vector<std::string> ignore_prefixes;   // Vault-relative prefixes never loaded
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    std::optional<TimePoint> now;               // Reference time for date sanity checks
};

// Path helpers
std::string normalize_path(const std::string& path);
std::string add_md_suffix(const std::string& path);
std::string strip_extension(const std::string& path);
std::string path_basename(const std::string& path);

// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ" in UTC
std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(const std::string& value);

} // namespace vgraph

#endif // VGRAPH_NOTE_ENTRY_HPP

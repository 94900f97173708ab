#pragma once

#include "vault/note_entry.hpp"
#include <string>
#include <vector>

namespace vgraph {

/**
 * @brief Fuzzy path match used by "find:" selectors
 *
 * Case-insensitive. "dir/words" requires the first path segment to match
 * "dir" (exactly, as a prefix when one character long, or by wildcard) and
 * the words to appear in order at word boundaries in the rest of the path.
 * Without a '/', words may appear anywhere. '*' and '?' are shell wildcards.
 * Patterns containing '.' are tried against each path segment. More than one
 * '/' never matches.
 */
bool fuzzy_match(const std::string& pattern, const std::string& path);

// Shell-style '*' and '?' match; anchored to the whole text unless @p anywhere
bool wildcard_match(const std::string& pattern, const std::string& text, bool anywhere = false);

/**
 * @brief One include/exclude criterion
 *
 *   "Notes/x"     path or directory prefix ("*" matches all)
 *   "find:proj"   fuzzy path match
 *   "tag:idea"    note carries the tag
 *   "status:done" frontmatter property equals the value
 */
struct NoteSelector {
    enum class Type {
        FILE,
        FIND,
        TAG,
        PROPERTY
    };

    Type type = Type::FILE;
    std::string value;
    std::string property;

    static NoteSelector parse(const std::string& raw);
    bool matches(const NoteEntry& entry) const;
};

std::vector<NoteSelector> parse_selectors(const std::vector<std::string>& raw);

bool matches_any(const std::vector<NoteSelector>& selectors, const NoteEntry& entry);

/**
 * @brief Combined include/exclude check
 *
 * A note passes when it matches some include selector (or none are given) and
 * matches no exclude selector.
 */
bool passes_filters(const std::vector<NoteSelector>& include,
                    const std::vector<NoteSelector>& exclude,
                    const NoteEntry& entry);

// Hidden entries, ".git", and any vault-relative prefix in @p ignored
bool should_ignore_path(const std::string& rel_path, const std::vector<std::string>& ignored);

} // namespace vgraph

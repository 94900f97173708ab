#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace vgraph {

/**
 * @brief Resolves wikilink text to vault paths
 *
 * Each note is reachable by its path without extension ("Notes/my note") and by
 * its bare name ("my note"). When two notes share a name the shorter path wins.
 */
class NotePathCache {
public:
    NotePathCache() = default;
    explicit NotePathCache(const std::vector<std::string>& note_paths);

    void add(const std::string& note_path);

    // Strips "#anchor" and a ".md" suffix, then tries full path, then bare name
    std::optional<std::string> resolve(const std::string& link) const;

    size_t size() const { return paths_.size(); }

private:
    std::map<std::string, std::string> paths_;
};

} // namespace vgraph

#include "vault/path_cache.hpp"
#include "vault/note_entry.hpp"

namespace vgraph {

NotePathCache::NotePathCache(const std::vector<std::string>& note_paths) {
    for (const auto& p : note_paths) {
        add(p);
    }
}

void NotePathCache::add(const std::string& note_path) {
    std::string base = strip_extension(note_path);
    paths_[base] = note_path;

    std::string name = path_basename(base);
    auto it = paths_.find(name);
    if (it == paths_.end() || note_path.size() < it->second.size()) {
        paths_[name] = note_path;
    }
}

std::optional<std::string> NotePathCache::resolve(const std::string& link) const {
    std::string target = link;
    auto hash = target.find('#');
    if (hash != std::string::npos) {
        target = target.substr(0, hash);
    }
    target = normalize_path(target);
    // Only the note extension; "v1.2" in a link is part of the name
    if (target.size() > 3 && target.compare(target.size() - 3, 3, ".md") == 0) {
        target.resize(target.size() - 3);
    }

    auto it = paths_.find(target);
    if (it != paths_.end()) {
        return it->second;
    }

    if (target.find('/') != std::string::npos) {
        it = paths_.find(path_basename(target));
        if (it != paths_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

} // namespace vgraph

#include "vault/note_source.hpp"
#include "vault/markdown.hpp"
#include "vault/note_selector.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vgraph {

namespace {

std::vector<NoteEntry> apply_loader_filters(std::vector<NoteEntry> entries,
                                            const LoaderOptions& options) {
    auto include = parse_selectors(options.include_patterns);
    auto exclude = parse_selectors(options.exclude_patterns);

    std::vector<NoteEntry> kept;
    kept.reserve(entries.size());
    for (auto& entry : entries) {
        if (should_ignore_path(entry.path, options.ignore_prefixes)) continue;
        if (!passes_filters(include, exclude, entry)) continue;
        kept.push_back(std::move(entry));
    }
    std::sort(kept.begin(), kept.end(),
              [](const NoteEntry& a, const NoteEntry& b) { return a.path < b.path; });
    return kept;
}

} // namespace

// ==========================================
// VaultNoteSource
// ==========================================

VaultNoteSource::VaultNoteSource(std::string root)
    : root_(std::move(root)) {}

std::vector<NoteEntry> VaultNoteSource::load_entries(const LoaderOptions& options) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw VaultError("vault not found: " + root_);
    }

    TimePoint now = options.now.value_or(Clock::now());
    auto paths = list_note_paths(options.ignore_prefixes);
    NotePathCache cache(paths);

    std::vector<NoteEntry> entries;
    entries.reserve(paths.size());
    for (const auto& rel : paths) {
        std::string content = read_note(rel);
        NoteEntry entry = parse_note(rel, content, cache, now);
        if (!entry.modified) {
            entry.modified = file_modified(rel);
        }
        entries.push_back(std::move(entry));
    }

    return apply_loader_filters(std::move(entries), options);
}

NoteEntry VaultNoteSource::parse_note(const std::string& path, const std::string& content,
                                      const NotePathCache& cache, TimePoint now) {
    NoteEntry entry;
    entry.path = normalize_path(add_md_suffix(path));
    entry.title = path_basename(strip_extension(entry.path));

    Frontmatter fm = parse_frontmatter(content);
    for (const auto& [key, value] : fm.scalars) {
        entry.frontmatter[key] = value;
    }
    for (const auto& [key, items] : fm.lists) {
        std::string joined;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) joined += ", ";
            joined += items[i];
        }
        entry.frontmatter[key] = joined;
    }

    entry.tags = extract_tags(content, fm);
    entry.modified = resolve_content_time(entry.path, content, fm, now);

    for (const auto& raw : scan_wikilinks(content)) {
        auto target = cache.resolve(raw.target);
        if (!target || *target == entry.path) {
            continue;
        }
        NoteLink link;
        link.target = *target;
        link.kind = raw.kind;
        link.anchored = raw.anchored;
        entry.links.push_back(link);
    }
    return entry;
}

std::vector<std::string> VaultNoteSource::list_note_paths(const std::vector<std::string>& ignored) const {
    std::vector<std::string> paths;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw VaultError("Failed to read vault " + root_ + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw VaultError("Failed to walk vault " + root_ + ": " + ec.message());
        }
        std::string rel = fs::relative(it->path(), root_, ec).generic_string();
        if (ec) {
            throw VaultError("Failed to resolve " + it->path().string() + ": " + ec.message());
        }

        // Dangling symlinks report not_found and are skipped
        fs::file_status status = it->status(ec);
        if (ec && status.type() != fs::file_type::not_found) {
            throw VaultError("Failed to stat " + it->path().string() + ": " + ec.message());
        }
        ec.clear();

        if (should_ignore_path(rel, ignored)) {
            if (fs::is_directory(status)) it.disable_recursion_pending();
            continue;
        }
        if (fs::is_regular_file(status) && it->path().extension() == ".md") {
            paths.push_back(normalize_path(rel));
        }
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

std::string VaultNoteSource::read_note(const std::string& rel_path) const {
    fs::path full = fs::path(root_) / rel_path;
    std::ifstream file(full, std::ios::binary);
    if (!file.is_open()) {
        throw VaultError("Failed to open note: " + full.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw VaultError("Failed to read note: " + full.string());
    }
    return buffer.str();
}

std::optional<TimePoint> VaultNoteSource::file_modified(const std::string& rel_path) const {
    std::error_code ec;
    auto ftime = fs::last_write_time(fs::path(root_) / rel_path, ec);
    if (ec) {
        return std::nullopt;
    }
    // file_time_type has its own epoch; shift through "now" on both clocks
    auto shifted = ftime - fs::file_time_type::clock::now() + Clock::now();
    return std::chrono::time_point_cast<Clock::duration>(shifted);
}

// ==========================================
// JsonNoteSource
// ==========================================

JsonNoteSource::JsonNoteSource(std::string path)
    : path_(std::move(path)) {}

std::vector<NoteEntry> JsonNoteSource::load_entries(const LoaderOptions& options) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw VaultError("Failed to open snapshot: " + path_);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw VaultError("Invalid snapshot " + path_ + ": " + e.what());
    }

    const nlohmann::json* notes = &j;
    if (j.is_object()) {
        if (!j.contains("notes")) {
            throw VaultError("Snapshot " + path_ + " has no \"notes\" array");
        }
        notes = &j["notes"];
    }
    if (!notes->is_array()) {
        throw VaultError("Snapshot " + path_ + ": notes must be an array");
    }

    std::vector<NoteEntry> entries;
    entries.reserve(notes->size());
    for (const auto& item : *notes) {
        try {
            entries.push_back(NoteEntry::from_json(item));
        } catch (const nlohmann::json::exception& e) {
            throw VaultError("Invalid note in snapshot " + path_ + ": " + e.what());
        }
    }
    return apply_loader_filters(std::move(entries), options);
}

void JsonNoteSource::save(const std::vector<NoteEntry>& entries, const std::string& path) {
    nlohmann::json j;
    j["notes"] = nlohmann::json::array();
    for (const auto& entry : entries) {
        j["notes"].push_back(entry.to_json());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw VaultError("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

std::unique_ptr<NoteSource> make_note_source(const std::string& vault_root,
                                             const std::string& snapshot_path) {
    if (!snapshot_path.empty()) {
        return std::make_unique<JsonNoteSource>(snapshot_path);
    }
    return std::make_unique<VaultNoteSource>(vault_root);
}

} // namespace vgraph

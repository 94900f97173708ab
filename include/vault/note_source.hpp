#pragma once

#include "vault/note_entry.hpp"
#include "vault/path_cache.hpp"
#include <string>
#include <vector>
#include <memory>

namespace vgraph {

/**
 * @brief Abstract producer of note entries
 *
 * Implementations do all I/O; the analysis engine only consumes the entries.
 * Failures are reported by throwing VaultError.
 */
class NoteSource {
public:
    virtual ~NoteSource() = default;

    /**
     * @brief Load every note that passes the loader options
     * @return Entries sorted by path
     */
    virtual std::vector<NoteEntry> load_entries(const LoaderOptions& options) = 0;

    /**
     * @brief Human-readable origin, used in report headers
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief Reads markdown notes from a vault directory
 */
class VaultNoteSource : public NoteSource {
public:
    explicit VaultNoteSource(std::string root);

    std::vector<NoteEntry> load_entries(const LoaderOptions& options) override;
    std::string describe() const override { return root_; }

    const std::string& root() const { return root_; }

    /**
     * @brief Build one entry from note text
     *
     * @param path Vault-relative path
     * @param content Raw markdown
     * @param cache Resolves wikilink text; unresolved and self links are dropped
     */
    static NoteEntry parse_note(const std::string& path, const std::string& content,
                                const NotePathCache& cache, TimePoint now);

private:
    std::vector<std::string> list_note_paths(const std::vector<std::string>& ignored) const;
    std::string read_note(const std::string& rel_path) const;
    std::optional<TimePoint> file_modified(const std::string& rel_path) const;

    std::string root_;
};

/**
 * @brief Reads entries from a JSON snapshot
 *
 * Accepts {"notes": [...]} or a bare array of NoteEntry objects.
 */
class JsonNoteSource : public NoteSource {
public:
    explicit JsonNoteSource(std::string path);

    std::vector<NoteEntry> load_entries(const LoaderOptions& options) override;
    std::string describe() const override { return path_; }

    // Write entries in the format load_entries reads
    static void save(const std::vector<NoteEntry>& entries, const std::string& path);

private:
    std::string path_;
};

std::unique_ptr<NoteSource> make_note_source(const std::string& vault_root,
                                             const std::string& snapshot_path);

} // namespace vgraph

#include "cli/cli.hpp"
#include "config/vault_config.hpp"
#include "vault/note_source.hpp"
#include "analysis/graph_analysis.hpp"
#include "report/graph_reporter.hpp"
#include <iostream>
#include <filesystem>
#include <memory>
#include <algorithm>

namespace fs = std::filesystem;

using namespace vgraph;

// ============== Helper Functions ==============

// Options every analysis command accepts
OptionGroup graph_options() {
    return {"Graph", {
        {"vault", "V", "Vault root directory (default: $VGRAPH_VAULT)", "", false, false},
        {"snapshot", "S", "Read notes from a JSON snapshot instead of a vault", "", false, false},
        {"include", "i", "Comma-separated note selectors to keep", "", false, false},
        {"exclude", "e", "Comma-separated note selectors to drop", "", false, false},
        {"min-degree", "m", "Drop notes with fewer links (in + out); 0 disables (default: 2)", "", false, false},
        {"mutual-only", "", "Keep only links that are reciprocated", "", false, true},
        {"recency-cascade", "", "Propagate recency beyond direct neighbors: true or false (default: true)", "", false, false},
        {"no-singletons", "", "Do not report one-note communities", "", false, true},
        {"recent-window", "", "Days counted as recent in community recency (default: 30)", "", false, false},
        {"skip-anchors", "", "Skip wikilinks with heading/block anchors (e.g. [[Note#Section]])", "", false, true},
        {"skip-embeds", "", "Skip embedded wikilinks (e.g. ![[Embedded Note]])", "", false, true},
        {"timings", "", "Print per-phase analysis timings", "", false, true},
        {"verbose", "v", "Print analysis progress to stderr", "", false, true}
    }};
}

// Options for the text reports
OptionGroup display_options() {
    return {"Display", {
        {"limit", "n", "Rows per section", "100", false, false},
        {"all", "a", "Show every row, ignoring --limit", "", false, true},
        {"no-color", "", "Disable ANSI color in community IDs", "", false, true},
        {"output", "o", "Write the report to a file instead of stdout (implies --no-color)", "", false, false}
    }};
}

// Options for the JSON context commands
OptionGroup json_options() {
    return {"Output", {
        {"output", "o", "Write the JSON to a file instead of stdout", "", false, false}
    }};
}

// Resolved input: where notes come from and the vault's own settings
struct GraphInput {
    std::string vault_root;     // Empty when reading a snapshot only
    std::string label;
    std::string location;
    VaultConfig config;
    std::unique_ptr<NoteSource> source;
};

std::string vault_label(const fs::path& path) {
    fs::path p = path;
    if (p.filename().empty()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

GraphInput open_input(const Args& args) {
    EnvironmentConfig env = EnvironmentConfig::from_environment();
    std::string vault = args.has("vault") ? args.get("vault").value : env.vault;
    std::string snapshot = args.has("snapshot") ? args.get("snapshot").value : env.snapshot;

    if (vault.empty() && snapshot.empty()) {
        throw std::runtime_error("No vault given: pass --vault or set VGRAPH_VAULT");
    }

    GraphInput input;
    if (!vault.empty()) {
        fs::path abs = fs::absolute(vault).lexically_normal();
        input.vault_root = vault;
        input.label = vault_label(abs);
        input.location = abs.string();
        if (!input.location.empty() && input.location.back() == '/') {
            input.location.pop_back();
        }
        if (fs::is_directory(vault)) {
            input.config = VaultConfig::load_for_vault(vault);
            std::string error;
            if (!input.config.validate(error)) {
                throw std::runtime_error("Invalid config " + VaultConfig::path_for(vault) + ": " + error);
            }
        }
    } else {
        fs::path abs = fs::absolute(snapshot).lexically_normal();
        input.label = abs.stem().string();
        input.location = abs.string();
    }
    input.source = make_note_source(vault, snapshot);
    return input;
}

// CLI flag > vault config > built-in default
AnalysisOptions analysis_options(const Args& args, const VaultConfig& config) {
    AnalysisOptions options;
    options.skip_anchors = args.has("skip-anchors");
    options.skip_embeds = args.has("skip-embeds");
    options.include_patterns = args.get("include").as_list();
    options.exclude_patterns = args.get("exclude").as_list();

    options.min_degree = args.has("min-degree")
        ? args.get("min-degree").as_int()
        : config.min_degree.value_or(options.min_degree);
    if (options.min_degree < 0) {
        throw std::runtime_error("--min-degree must be >= 0");
    }

    options.mutual_only = args.has("mutual-only") || config.mutual_only.value_or(false);

    if (args.has("recency-cascade")) {
        options.recency_cascade = args.get("recency-cascade").as_bool();
    } else if (config.recency_cascade) {
        options.recency_cascade = *config.recency_cascade;
    }

    options.include_singleton_communities = args.has("no-singletons")
        ? false
        : config.include_singletons.value_or(true);

    options.recent_window_days = args.has("recent-window")
        ? args.get("recent-window").as_int()
        : config.recent_window_days.value_or(options.recent_window_days);
    if (options.recent_window_days <= 0) {
        throw std::runtime_error("--recent-window must be > 0");
    }
    return options;
}

AnalysisResult run_analysis(const Args& args, GraphInput& input, AnalysisOptions options) {
    bool verbose = args.has("verbose");
    GraphAnalyzer analyzer(std::move(options));

    if (verbose) {
        std::cerr << "Analyzing " << input.source->describe() << "\n";
        std::cerr << "  Options: " << analyzer.options().to_json().dump() << "\n";
        if (!input.config.graph_ignore.empty()) {
            std::cerr << "  Ignoring " << input.config.graph_ignore.size() << " prefix(es) from "
                      << VaultConfig::path_for(input.vault_root) << "\n";
        }
        analyzer.set_progress_callback([](const std::string& stage, int current, int total) {
            std::cerr << "  [" << current << "/" << total << "] " << stage << "\n";
        });
    }

    AnalysisResult result = analyzer.run(*input.source, input.config.graph_ignore);

    if (verbose) {
        const auto& d = result.diagnostics;
        std::cerr << "  HITS: " << d.hits.iterations << " iterations"
                  << (d.hits.converged ? "" : " (not converged)") << "\n";
        std::cerr << "  Label propagation: " << d.label_rounds << " rounds"
                  << (d.labels_converged ? "" : " (not converged)") << "\n";
        if (!result.filtered_out.empty()) {
            std::cerr << "  Filtered out: " << result.filtered_out.size() << " notes\n";
        }
        if (!result.pruned.empty()) {
            std::cerr << "  Pruned (min-degree " << result.min_degree << "): "
                      << result.pruned.size() << " notes\n";
        }
    }
    return result;
}

ReportConfig report_config(const Args& args, const GraphInput& input) {
    ReportConfig config;
    config.vault_name = input.label;
    config.vault_path = input.location;
    config.limit = args.get("limit", "100").as_int();
    config.show_all = args.has("all");
    config.no_color = args.has("no-color") || args.has("output") ||
                      EnvironmentConfig::from_environment().no_color;
    return config;
}

// Report text goes to --output when given, stdout otherwise
void emit(const Args& args, const GraphReporter& reporter, const std::string& text) {
    if (!args.has("output")) {
        std::cout << text;
        return;
    }
    std::string output_path = args.get("output").value;
    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    reporter.save_to_file(output_path, text);
    std::cerr << "Report saved to: " << output_path << "\n";
}

std::string with_timings(const Args& args, const GraphReporter& reporter, std::string text,
                         const std::string& separator = "") {
    if (args.has("timings")) {
        text += separator + reporter.timings();
    }
    return text;
}

// ============== vgraph degrees ==============
int cmd_degrees(const Args& args) {
    GraphInput input = open_input(args);
    AnalysisResult result = run_analysis(args, input, analysis_options(args, input.config));

    GraphReporter reporter(result, report_config(args, input));
    emit(args, reporter, with_timings(args, reporter, reporter.degrees(), "\n"));
    return 0;
}

// ============== vgraph communities ==============
int cmd_communities(const Args& args) {
    GraphInput input = open_input(args);
    AnalysisResult result = run_analysis(args, input, analysis_options(args, input.config));

    GraphReporter reporter(result, report_config(args, input));
    emit(args, reporter, with_timings(args, reporter, reporter.communities()));
    return 0;
}

// ============== vgraph community ==============
int cmd_community(const Args& args) {
    if (args.positional.size() != 1) {
        std::cerr << "Error: expected exactly one community ID or note path\n";
        return 1;
    }

    GraphInput input = open_input(args);
    AnalysisOptions options = analysis_options(args, input.config);
    options.include_tags = args.has("tags");
    AnalysisResult result = run_analysis(args, input, options);

    ReportConfig config = report_config(args, input);
    config.member_tags = args.has("tags");
    config.member_neighbors = args.has("neighbors");

    GraphReporter reporter(result, config);
    emit(args, reporter, with_timings(args, reporter, reporter.community_detail(args.positional[0])));
    return 0;
}

// ============== vgraph clusters ==============
int cmd_clusters(const Args& args) {
    GraphInput input = open_input(args);
    AnalysisResult result = run_analysis(args, input, analysis_options(args, input.config));

    GraphReporter reporter(result, report_config(args, input));
    emit(args, reporter, with_timings(args, reporter, reporter.clusters()));
    return 0;
}

// ============== vgraph orphans ==============
int cmd_orphans(const Args& args) {
    GraphInput input = open_input(args);
    AnalysisResult result = run_analysis(args, input, analysis_options(args, input.config));

    GraphReporter reporter(result, report_config(args, input));
    emit(args, reporter, with_timings(args, reporter, reporter.orphans()));
    return 0;
}

// ============== vgraph note-context ==============
int cmd_note_context(const Args& args) {
    auto files = args.get("files").as_list();
    files.insert(files.end(), args.positional.begin(), args.positional.end());
    if (files.empty()) {
        std::cerr << "Error: --files requires at least one note path\n";
        return 1;
    }

    GraphInput input = open_input(args);
    AnalysisOptions options = analysis_options(args, input.config);
    options.include_tags = !args.has("no-tags");
    AnalysisResult result = run_analysis(args, input, options);

    NoteContextOptions context;
    context.include_tags = !args.has("no-tags");
    context.include_neighbors = !args.has("no-neighbors");
    context.include_backlinks = !args.has("no-backlinks");
    context.include_frontmatter = args.has("frontmatter");
    context.neighbor_limit = args.get("neighbor-limit", "50").as_int();
    context.backlink_limit = args.get("backlinks-limit", "50").as_int();
    context.include_timings = args.has("timings");

    GraphReporter reporter(result, report_config(args, input));
    emit(args, reporter, reporter.note_context(files, context).dump(2) + "\n");
    return 0;
}

// ============== vgraph vault-context ==============
int cmd_vault_context(const Args& args) {
    GraphInput input = open_input(args);
    AnalysisOptions options = analysis_options(args, input.config);
    options.include_tags = true;

    VaultContextOptions context;
    context.max_communities = args.get("max-communities", "25").as_int();
    context.community_top_notes = args.get("community-top-notes", "5").as_int();
    context.community_top_tags = args.get("community-top-tags", "5").as_int();
    context.include_timings = args.has("timings");

    // Summaries must carry at least as many rows as the report slices
    options.top_tags_limit = static_cast<size_t>(std::max(context.community_top_tags, 5));
    options.top_authority_limit = static_cast<size_t>(std::max(context.community_top_notes, 5));

    AnalysisResult result = run_analysis(args, input, options);

    GraphReporter reporter(result, report_config(args, input));
    emit(args, reporter, reporter.vault_context(context).dump(2) + "\n");
    return 0;
}

// ============== vgraph graph-ignore ==============
int cmd_graph_ignore(const Args& args) {
    EnvironmentConfig env = EnvironmentConfig::from_environment();
    std::string vault = args.has("vault") ? args.get("vault").value : env.vault;
    if (vault.empty()) {
        throw std::runtime_error("No vault given: pass --vault or set VGRAPH_VAULT");
    }
    if (!fs::is_directory(vault)) {
        throw VaultError("vault not found: " + vault);
    }
    if (args.positional.empty()) {
        std::cerr << "Error: expected one of: list, add <prefix>, remove <prefix>\n";
        return 1;
    }

    std::string action = args.positional[0];
    std::string config_path = VaultConfig::path_for(vault);
    VaultConfig config = VaultConfig::from_json_file(config_path);

    if (action == "list") {
        if (config.graph_ignore.empty()) {
            std::cout << "  (none)\n";
        }
        for (const auto& prefix : config.graph_ignore) {
            std::cout << "  " << prefix << "\n";
        }
        return 0;
    }

    if (action != "add" && action != "remove") {
        std::cerr << "Error: unknown action '" << action << "' (expected list, add or remove)\n";
        return 1;
    }
    if (args.positional.size() < 2) {
        std::cerr << "Error: " << action << " requires a path prefix\n";
        return 1;
    }

    int changed = 0;
    for (size_t i = 1; i < args.positional.size(); ++i) {
        const std::string& prefix = args.positional[i];
        bool did = action == "add" ? add_graph_ignore(config, prefix)
                                   : remove_graph_ignore(config, prefix);
        if (did) {
            changed++;
            std::cout << (action == "add" ? "Ignoring " : "No longer ignoring ") << prefix << "\n";
        } else {
            std::cout << (action == "add" ? "Already ignored: " : "Not in ignore list: ") << prefix << "\n";
        }
    }

    if (changed > 0) {
        config.to_json_file(config_path);
        std::cout << "Saved " << config_path << "\n";
    }
    return 0;
}

// ============== vgraph snapshot ==============
int cmd_snapshot(const Args& args) {
    std::string output_path = args.require("output");
    GraphInput input = open_input(args);

    LoaderOptions loader;
    loader.ignore_prefixes = input.config.graph_ignore;
    loader.include_patterns = args.get("include").as_list();
    loader.exclude_patterns = args.get("exclude").as_list();

    if (args.has("verbose")) {
        std::cerr << "Reading notes from " << input.source->describe() << "\n";
    }
    std::vector<NoteEntry> entries = input.source->load_entries(loader);

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    JsonNoteSource::save(entries, output_path);
    std::cout << "Saved " << entries.size() << " notes to: " << output_path << "\n";
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("vgraph", "1.0.0");

    const std::vector<OptionGroup> report_groups = {graph_options(), display_options()};

    // vgraph degrees / stats
    cli.register_command({
        "degrees",
        "Totals and top notes by authority, hub, inbound and outbound links",
        report_groups,
        cmd_degrees
    });
    cli.register_alias("stats", "degrees");

    // vgraph communities
    cli.register_command({
        "communities",
        "List link communities, most recently active first",
        report_groups,
        cmd_communities
    });

    // vgraph community
    cli.register_command({
        "community",
        "Show one community by ID or by a note it contains",
        {graph_options(), display_options(), {"Community", {
            {"tags", "t", "Show tags for members", "", false, true},
            {"neighbors", "", "Show neighbor lists for members", "", false, true}
        }}},
        cmd_community,
        "<id|path>"
    });

    // vgraph clusters
    cli.register_command({
        "clusters",
        "List mutual-link clusters (strong components with more than one note)",
        report_groups,
        cmd_clusters
    });

    // vgraph orphans
    cli.register_command({
        "orphans",
        "List notes with no inbound or outbound wikilinks",
        report_groups,
        cmd_orphans
    });

    // vgraph note-context
    cli.register_command({
        "note-context",
        "Print JSON graph context for specific notes",
        {graph_options(), json_options(), {"Context", {
            {"files", "f", "Comma-separated vault-relative note paths", "", false, false},
            {"no-tags", "", "Omit tags", "", false, true},
            {"no-neighbors", "", "Omit neighbor lists", "", false, true},
            {"no-backlinks", "", "Omit backlinks", "", false, true},
            {"frontmatter", "", "Include frontmatter properties", "", false, true},
            {"neighbor-limit", "", "Max neighbors per direction (0 = all)", "50", false, false},
            {"backlinks-limit", "", "Max backlinks (0 = all)", "50", false, false}
        }}},
        cmd_note_context,
        "[path...]"
    });

    // vgraph vault-context
    cli.register_command({
        "vault-context",
        "Print a JSON vault context (communities, stats, recency)",
        {graph_options(), json_options(), {"Context", {
            {"max-communities", "", "Max communities to include (0 = all)", "25", false, false},
            {"community-top-notes", "", "Top authority notes per community", "5", false, false},
            {"community-top-tags", "", "Top tags per community", "5", false, false}
        }}},
        cmd_vault_context
    });

    // vgraph graph-ignore
    cli.register_command({
        "graph-ignore",
        "List, add or remove path prefixes excluded from the graph",
        {{"Vault", {
            {"vault", "V", "Vault root directory (default: $VGRAPH_VAULT)", "", false, false}
        }}},
        cmd_graph_ignore,
        "list | add <prefix>... | remove <prefix>..."
    });

    // vgraph snapshot
    cli.register_command({
        "snapshot",
        "Export parsed notes to a JSON snapshot",
        {graph_options(), {"Snapshot", {
            {"output", "o", "Output path for the snapshot JSON", "", true, false}
        }}},
        cmd_snapshot
    });

    return cli.run(argc, argv);
}

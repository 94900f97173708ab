#include "analysis/graph_analysis.hpp"
#include <algorithm>

namespace vgraph {

namespace {

using SteadyClock = std::chrono::steady_clock;

const std::vector<std::string> kStageNames = {
    "Loading notes", "Building graph", "Scoring (HITS)",
    "Finding components", "Detecting communities", "Aggregating"
};

} // namespace

// ==========================================
// AnalysisOptions
// ==========================================

BuildOptions AnalysisOptions::build_options() const {
    BuildOptions b;
    b.skip_anchors = skip_anchors;
    b.skip_embeds = skip_embeds;
    b.include_patterns = include_patterns;
    b.exclude_patterns = exclude_patterns;
    b.min_degree = min_degree;
    b.mutual_only = mutual_only;
    return b;
}

CommunityOptions AnalysisOptions::community_options() const {
    CommunityOptions c;
    c.max_rounds = label_propagation_rounds;
    c.include_singletons = include_singleton_communities;
    c.include_tags = include_tags;
    c.top_tags_limit = top_tags_limit;
    c.top_authority_limit = top_authority_limit;
    c.recent_window_days = recent_window_days;
    return c;
}

nlohmann::json AnalysisOptions::to_json() const {
    nlohmann::json j;
    j["skipAnchors"] = skip_anchors;
    j["skipEmbeds"] = skip_embeds;
    j["includePatterns"] = include_patterns;
    j["excludePatterns"] = exclude_patterns;
    j["minDegree"] = min_degree;
    j["mutualOnly"] = mutual_only;
    j["includeTags"] = include_tags;
    j["includeSingletons"] = include_singleton_communities;
    j["recencyCascade"] = cascade_enabled();
    j["recencyCascadeExplicit"] = recency_cascade.has_value();
    j["recentWindowDays"] = recent_window_days;
    j["recency"] = recency.to_json();
    j["hitsMaxIterations"] = hits.max_iterations;
    j["hitsTolerance"] = hits.tolerance;
    j["labelPropagationRounds"] = label_propagation_rounds;
    return j;
}

// ==========================================
// Timings / diagnostics
// ==========================================

long long AnalysisTimings::to_millis(Duration d) {
    if (d <= Duration::zero()) return 0;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    return ms == 0 ? 1 : ms;
}

nlohmann::json AnalysisTimings::to_json() const {
    nlohmann::json j;
    j["loadMs"] = to_millis(load);
    j["buildMs"] = to_millis(build);
    j["hitsMs"] = to_millis(hits);
    j["componentsMs"] = to_millis(components);
    j["labelPropagationMs"] = to_millis(label_propagation);
    j["recencyMs"] = to_millis(recency);
    j["summariesMs"] = to_millis(summaries);
    j["totalMs"] = to_millis(total);
    return j;
}

nlohmann::json AnalysisDiagnostics::to_json() const {
    nlohmann::json j;
    j["hits"] = hits.to_json();
    j["labelPropagation"] = {{"rounds", label_rounds}, {"converged", labels_converged}};
    return j;
}

// ==========================================
// AnalysisResult
// ==========================================

const GraphNode* AnalysisResult::find_node(const std::string& path) const {
    auto it = nodes.find(path);
    if (it == nodes.end()) {
        it = nodes.find(add_md_suffix(normalize_path(path)));
    }
    return it != nodes.end() ? &it->second : nullptr;
}

const CommunitySummary* AnalysisResult::find_community(const std::string& id) const {
    for (const auto& c : communities) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

const CommunitySummary* AnalysisResult::community_of(const std::string& path) const {
    const GraphNode* node = find_node(path);
    if (!node || node->community.empty()) {
        return nullptr;
    }
    return find_community(node->community);
}

std::vector<Component> AnalysisResult::clusters() const {
    std::vector<Component> result;
    for (const auto& c : strong_components) {
        if (c.size() > 1) result.push_back(c);
    }
    return result;
}

nlohmann::json AnalysisResult::to_json() const {
    nlohmann::json j;
    j["stats"] = {{"nodeCount", stats.node_count}, {"edgeCount", stats.edge_count}};
    j["orphanCount"] = orphans.size();
    j["orphans"] = orphans;
    j["weakComponents"] = weak_components;
    j["clusters"] = clusters();
    j["communities"] = nlohmann::json::array();
    for (const auto& c : communities) {
        j["communities"].push_back(c.to_json());
    }
    j["nodes"] = nlohmann::json::object();
    for (const auto& [path, node] : nodes) {
        j["nodes"][path] = node.to_json();
    }
    j["recencyCascade"] = recency_cascade;
    j["referenceTime"] = format_timestamp(reference_time);
    j["timings"] = timings.to_json();
    j["diagnostics"] = diagnostics.to_json();
    return j;
}

// ==========================================
// GraphAnalyzer
// ==========================================

std::string analysis_state_name(AnalysisState state) {
    switch (state) {
        case AnalysisState::IDLE: return "idle";
        case AnalysisState::LOADED: return "loaded";
        case AnalysisState::BUILT: return "built";
        case AnalysisState::SCORED: return "scored";
        case AnalysisState::PARTITIONED: return "partitioned";
        case AnalysisState::DETECTED: return "detected";
        case AnalysisState::DONE: return "done";
        case AnalysisState::FAILED: return "failed";
    }
    return "unknown";
}

GraphAnalyzer::GraphAnalyzer(AnalysisOptions options)
    : options_(std::move(options)) {}

void GraphAnalyzer::transition(AnalysisState next) {
    state_ = next;
    if (!progress_cb_ || next == AnalysisState::FAILED) {
        return;
    }
    int step = static_cast<int>(next);
    int total = static_cast<int>(AnalysisState::DONE);
    const std::string& stage = kStageNames[static_cast<size_t>(std::min(step, total) - 1)];
    progress_cb_(stage, step, total);
}

void GraphAnalyzer::validate_entries(const std::vector<NoteEntry>& entries) const {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].path.empty()) {
            throw AnalysisError("note entry #" + std::to_string(i) + " has an empty path");
        }
    }
}

AnalysisResult GraphAnalyzer::run(NoteSource& source, const std::vector<std::string>& ignore_prefixes) {
    state_ = AnalysisState::IDLE;
    try {
        auto start = SteadyClock::now();
        LoaderOptions loader;
        loader.ignore_prefixes = ignore_prefixes;
        loader.now = options_.now;

        // Selectors run in the builder so the notes they drop are recorded
        std::vector<NoteEntry> entries = source.load_entries(loader);
        auto load_time = SteadyClock::now() - start;
        transition(AnalysisState::LOADED);
        return analyze(entries, load_time);
    } catch (const std::exception&) {
        state_ = AnalysisState::FAILED;
        throw;
    }
}

AnalysisResult GraphAnalyzer::run(const std::vector<NoteEntry>& entries) {
    state_ = AnalysisState::IDLE;
    try {
        transition(AnalysisState::LOADED);
        return analyze(entries, AnalysisTimings::Duration::zero());
    } catch (const std::exception&) {
        state_ = AnalysisState::FAILED;
        throw;
    }
}

AnalysisResult GraphAnalyzer::analyze(const std::vector<NoteEntry>& entries,
                                      AnalysisTimings::Duration load_time) {
    auto total_start = SteadyClock::now();
    validate_entries(entries);

    AnalysisResult result;
    result.reference_time = options_.now.value_or(Clock::now());
    result.recency_cascade = options_.cascade_enabled();
    result.min_degree = options_.min_degree;
    result.timings.load = load_time;

    // Build
    auto t = SteadyClock::now();
    GraphBuilder builder(options_.build_options());
    result.nodes = builder.build(entries);
    result.filtered_out = builder.filtered_out();
    result.pruned = builder.pruned();
    result.timings.build = SteadyClock::now() - t;
    transition(AnalysisState::BUILT);

    // Score
    t = SteadyClock::now();
    HitsScorer scorer(options_.hits);
    result.diagnostics.hits = scorer.score(result.nodes);
    result.timings.hits = SteadyClock::now() - t;
    transition(AnalysisState::SCORED);

    // Partition
    t = SteadyClock::now();
    result.weak_components = ComponentFinder::weak_components(result.nodes);
    result.strong_components = ComponentFinder::strong_components(result.nodes);
    ComponentFinder::assign(result.nodes, result.weak_components, result.strong_components);
    result.timings.components = SteadyClock::now() - t;
    transition(AnalysisState::PARTITIONED);

    // Detect
    t = SteadyClock::now();
    RecencyPropagator propagator(options_.recency);
    result.effective_times = propagator.effective_times(result.nodes, result.reference_time,
                                                        result.recency_cascade);
    result.timings.recency = SteadyClock::now() - t;

    t = SteadyClock::now();
    CommunityDetector detector(options_.community_options());
    auto labels = detector.propagate(result.nodes);
    result.diagnostics.label_rounds = labels.rounds;
    result.diagnostics.labels_converged = labels.converged;
    result.timings.label_propagation = SteadyClock::now() - t;

    t = SteadyClock::now();
    result.communities = detector.summarize(result.nodes, labels.labels,
                                            result.effective_times, result.reference_time);
    result.timings.summaries = SteadyClock::now() - t;
    transition(AnalysisState::DETECTED);

    // Aggregate
    for (const auto& [path, node] : result.nodes) {
        if (node.is_orphan()) {
            result.orphans.push_back(path);
        }
    }
    result.stats.node_count = result.nodes.size();
    result.stats.edge_count = count_edges(result.nodes);
    result.timings.total = load_time + (SteadyClock::now() - total_start);
    transition(AnalysisState::DONE);

    return result;
}

} // namespace vgraph

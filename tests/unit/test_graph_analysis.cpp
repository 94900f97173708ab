#include <gtest/gtest.h>
#include "analysis/graph_analysis.hpp"
#include <map>

using namespace vgraph;

namespace {

NoteEntry note(const std::string& path, const std::vector<std::string>& targets = {}) {
    NoteEntry e;
    e.path = path;
    e.title = path_basename(strip_extension(path));
    for (const auto& t : targets) {
        e.links.push_back({t, LinkKind::BASIC, false});
    }
    return e;
}

// Serves a fixed entry list, or fails like an unreadable vault
class FixedSource : public NoteSource {
public:
    explicit FixedSource(std::vector<NoteEntry> entries, bool fail = false)
        : entries_(std::move(entries)), fail_(fail) {}

    std::vector<NoteEntry> load_entries(const LoaderOptions& options) override {
        last_options = options;
        if (fail_) throw VaultError("vault not found: /missing");
        return entries_;
    }
    std::string describe() const override { return "fixed"; }

    LoaderOptions last_options;

private:
    std::vector<NoteEntry> entries_;
    bool fail_;
};

} // namespace

class GraphAnalysisTest : public ::testing::Test {
protected:
    AnalysisOptions options;
    TimePoint now;

    void SetUp() override {
        now = *parse_timestamp("2024-06-01T00:00:00Z");
        options.now = now;
        options.min_degree = 0;
    }

    std::vector<NoteEntry> three_notes() const {
        return {note("A.md", {"B.md"}), note("B.md", {"A.md", "C.md"}), note("C.md")};
    }
};

// ==========================================
// Scenario Tests
// ==========================================

TEST_F(GraphAnalysisTest, ThreeNoteVault) {
    AnalysisResult result = GraphAnalyzer(options).run(three_notes());

    EXPECT_TRUE(result.orphans.empty());
    EXPECT_EQ(result.stats.node_count, 3);
    EXPECT_EQ(result.stats.edge_count, 3);

    ASSERT_EQ(result.clusters().size(), 1);
    EXPECT_EQ(result.clusters()[0], (Component{"A.md", "B.md"}));
    ASSERT_EQ(result.weak_components.size(), 1);
    EXPECT_EQ(result.weak_components[0], (Component{"A.md", "B.md", "C.md"}));

    const GraphNode* b = result.find_node("B");
    ASSERT_NE(b, nullptr);
    EXPECT_GT(result.find_node("C.md")->authority, 0.0);
    for (const auto& [path, node] : result.nodes) {
        EXPECT_LE(node.hub, b->hub);
    }
    EXPECT_TRUE(result.diagnostics.hits.converged);
}

TEST_F(GraphAnalysisTest, DisconnectedNotes) {
    std::vector<NoteEntry> entries;
    for (int i = 1; i <= 5; ++i) {
        entries.push_back(note("n" + std::to_string(i) + ".md"));
    }

    AnalysisResult result = GraphAnalyzer(options).run(entries);
    EXPECT_EQ(result.orphans.size(), 5);
    EXPECT_EQ(result.weak_components.size(), 5);
    EXPECT_EQ(result.stats.edge_count, 0);
    EXPECT_TRUE(result.clusters().empty());
    // Singletons are reported by default
    EXPECT_EQ(result.communities.size(), 5);

    options.include_singleton_communities = false;
    result = GraphAnalyzer(options).run(entries);
    EXPECT_TRUE(result.communities.empty());
    EXPECT_EQ(result.community_of("n1.md"), nullptr);
}

TEST_F(GraphAnalysisTest, StarPrunedAtMinDegreeTwo) {
    std::vector<NoteEntry> entries = {note("Center.md", {"L1.md", "L2.md", "L3.md", "L4.md", "L5.md"})};
    for (int i = 1; i <= 5; ++i) {
        entries.push_back(note("L" + std::to_string(i) + ".md"));
    }

    options.min_degree = 2;
    AnalysisResult result = GraphAnalyzer(options).run(entries);

    EXPECT_EQ(result.stats.node_count, 1);
    EXPECT_EQ(result.stats.edge_count, 0);
    EXPECT_EQ(result.pruned.size(), 5);
    EXPECT_EQ(result.orphans, (std::vector<std::string>{"Center.md"}));
    EXPECT_EQ(result.min_degree, 2);
}

TEST_F(GraphAnalysisTest, RecencyCascadeToggle) {
    auto days_ago = [this](int d) { return now - std::chrono::hours(24 * d); };
    std::vector<NoteEntry> entries = {note("A.md", {"F1.md", "F2.md", "F3.md"}), note("X.md", {"A.md"})};
    entries[0].modified = days_ago(100);
    for (int i = 1; i <= 3; ++i) {
        entries.push_back(note("F" + std::to_string(i) + ".md"));
        entries.back().modified = days_ago(1);
    }

    // Direct neighbors count either way
    options.recency_cascade = false;
    AnalysisResult off = GraphAnalyzer(options).run(entries);
    EXPECT_FALSE(off.recency_cascade);
    EXPECT_NEAR(age_in_days(off.effective_times.at("A.md"), now), 8.0, 1e-9);
    EXPECT_NEAR(age_in_days(off.effective_times.at("X.md"), now), 107.0, 1e-9);

    options.recency_cascade = true;
    AnalysisResult on = GraphAnalyzer(options).run(entries);
    EXPECT_NEAR(age_in_days(on.effective_times.at("A.md"), now), 8.0, 1e-9);
    EXPECT_NEAR(age_in_days(on.effective_times.at("X.md"), now), 15.0, 1e-9);

    const CommunitySummary* single = off.community_of("X.md");
    const CommunitySummary* cascaded = on.community_of("X.md");
    ASSERT_NE(single, nullptr);
    ASSERT_NE(cascaded, nullptr);
    ASSERT_TRUE(single->recency.has_value());
    ASSERT_TRUE(cascaded->recency.has_value());
    EXPECT_NEAR(cascaded->recency->latest_age_days, 1.0, 1e-9);
    EXPECT_EQ(single->recency->recent_count, 4);
    EXPECT_EQ(cascaded->recency->recent_count, 5);
}

// ==========================================
// Invariant Tests
// ==========================================

TEST_F(GraphAnalysisTest, DegreesMatchNeighborLists) {
    std::vector<NoteEntry> entries = {
        note("a.md", {"b.md", "c.md", "b.md"}), note("b.md", {"c.md"}),
        note("c.md", {"a.md", "missing.md"}), note("d.md", {"c.md"}),
    };
    AnalysisResult result = GraphAnalyzer(options).run(entries);

    for (const auto& [path, node] : result.nodes) {
        int inbound = 0;
        for (const auto& [other, o] : result.nodes) {
            if (o.links_to(path)) inbound++;
        }
        EXPECT_EQ(node.inbound, inbound) << path;
        EXPECT_EQ(node.outbound, static_cast<int>(node.neighbors.size())) << path;
        EXPECT_FALSE(node.weak_component.empty());
        EXPECT_FALSE(node.strong_component.empty());
    }
}

TEST_F(GraphAnalysisTest, CommunitiesPartitionEveryNode) {
    // Two cycles joined by a bridge, a tail, a mutual pair and two isolated notes
    std::vector<NoteEntry> entries = {
        note("a.md", {"b.md"}), note("b.md", {"c.md"}), note("c.md", {"a.md", "d.md"}),
        note("d.md", {"e.md"}), note("e.md", {"f.md"}), note("f.md", {"d.md", "g.md"}),
        note("g.md"),
        note("p.md", {"q.md"}), note("q.md", {"p.md"}),
        note("solo1.md"), note("solo2.md"),
    };
    AnalysisResult result = GraphAnalyzer(options).run(entries);
    ASSERT_EQ(result.nodes.size(), entries.size());
    ASSERT_GE(result.weak_components.size(), 4);

    std::map<std::string, int> seen;
    for (const auto& c : result.communities) {
        EXPECT_FALSE(c.members.empty());
        for (const auto& m : c.members) {
            seen[m]++;
        }
    }
    ASSERT_EQ(seen.size(), result.nodes.size());
    for (const auto& [path, node] : result.nodes) {
        ASSERT_TRUE(seen.count(path)) << path;
        EXPECT_EQ(seen[path], 1) << path;
        const CommunitySummary* c = result.community_of(path);
        ASSERT_NE(c, nullptr) << path;
        EXPECT_TRUE(c->contains(path));
    }
    EXPECT_NE(result.community_of("solo1.md"), result.community_of("solo2.md"));
}

TEST_F(GraphAnalysisTest, RepeatedRunsAreIdentical) {
    GraphAnalyzer analyzer(options);
    AnalysisResult first = analyzer.run(three_notes());
    AnalysisResult second = analyzer.run(three_notes());

    auto strip = [](nlohmann::json j) {
        j.erase("timings");
        return j;
    };
    EXPECT_EQ(strip(first.to_json()), strip(second.to_json()));
}

TEST_F(GraphAnalysisTest, EmptyInputIsValid) {
    AnalysisResult result = GraphAnalyzer(options).run(std::vector<NoteEntry>{});
    EXPECT_EQ(result.stats.node_count, 0);
    EXPECT_TRUE(result.communities.empty());
    EXPECT_TRUE(result.orphans.empty());
}

// ==========================================
// State and Error Tests
// ==========================================

TEST_F(GraphAnalysisTest, ProgressReportsEveryStage) {
    GraphAnalyzer analyzer(options);
    std::vector<std::string> stages;
    int last_total = 0;
    analyzer.set_progress_callback([&](const std::string& stage, int current, int total) {
        stages.push_back(stage);
        last_total = total;
        EXPECT_EQ(current, static_cast<int>(stages.size()));
    });

    EXPECT_EQ(analyzer.state(), AnalysisState::IDLE);
    analyzer.run(three_notes());
    EXPECT_EQ(analyzer.state(), AnalysisState::DONE);
    EXPECT_EQ(stages.size(), 6);
    EXPECT_EQ(last_total, 6);
    EXPECT_EQ(stages.front(), "Loading notes");
    EXPECT_EQ(analysis_state_name(analyzer.state()), "done");
}

TEST_F(GraphAnalysisTest, TimingsReportEachPhase) {
    AnalysisResult result = GraphAnalyzer(options).run(three_notes());
    const auto& t = result.timings;
    EXPECT_GE(t.label_propagation.count(), 0);
    EXPECT_GE(t.summaries.count(), 0);
    EXPECT_GE(t.total, t.label_propagation + t.summaries);

    nlohmann::json j = t.to_json();
    EXPECT_TRUE(j.contains("labelPropagationMs"));
    EXPECT_TRUE(j.contains("summariesMs"));
    EXPECT_EQ(AnalysisTimings::to_millis(AnalysisTimings::Duration::zero()), 0);
    EXPECT_EQ(AnalysisTimings::to_millis(std::chrono::microseconds(10)), 1);
}

TEST_F(GraphAnalysisTest, EmptyPathFails) {
    GraphAnalyzer analyzer(options);
    std::vector<NoteEntry> entries = {note("a.md"), NoteEntry{}};
    EXPECT_THROW(analyzer.run(entries), AnalysisError);
    EXPECT_EQ(analyzer.state(), AnalysisState::FAILED);
}

TEST_F(GraphAnalysisTest, SourceErrorsPropagate) {
    FixedSource source({}, true);
    GraphAnalyzer analyzer(options);
    EXPECT_THROW(analyzer.run(source), VaultError);
    EXPECT_EQ(analyzer.state(), AnalysisState::FAILED);
}

TEST_F(GraphAnalysisTest, SourceRunRecordsFilteredNotes) {
    FixedSource source(three_notes());
    options.exclude_patterns = {"C"};
    AnalysisResult result = GraphAnalyzer(options).run(source, {"Templates"});

    EXPECT_EQ(source.last_options.ignore_prefixes, (std::vector<std::string>{"Templates"}));
    EXPECT_TRUE(source.last_options.exclude_patterns.empty());
    EXPECT_EQ(result.filtered_out, (std::set<std::string>{"C.md"}));
    EXPECT_EQ(result.find_node("C.md"), nullptr);
    EXPECT_EQ(result.stats.edge_count, 2);
}

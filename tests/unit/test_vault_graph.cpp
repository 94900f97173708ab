#include <gtest/gtest.h>
#include "graph/vault_graph.hpp"

using namespace vgraph;

namespace {

NoteEntry note(const std::string& path,
               std::vector<NoteLink> links = {},
               std::vector<std::string> tags = {}) {
    NoteEntry e;
    e.path = path;
    e.title = path_basename(strip_extension(path));
    e.links = std::move(links);
    e.tags = std::move(tags);
    return e;
}

NoteLink link(const std::string& target, LinkKind kind = LinkKind::BASIC) {
    NoteLink l;
    l.target = target;
    l.kind = kind;
    l.anchored = kind == LinkKind::HEADING || kind == LinkKind::BLOCK;
    return l;
}

} // namespace

class GraphBuilderTest : public ::testing::Test {
protected:
    BuildOptions options;

    void SetUp() override {
        options.min_degree = 0;
    }
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(GraphBuilderTest, DegreesAndNeighbors) {
    std::vector<NoteEntry> entries = {
        note("A.md", {link("B.md"), link("C.md")}),
        note("B.md", {link("A.md")}),
        note("C.md"),
    };

    GraphBuilder builder(options);
    NodeMap nodes = builder.build(entries);

    ASSERT_EQ(nodes.size(), 3);
    EXPECT_EQ(nodes.at("A.md").outbound, 2);
    EXPECT_EQ(nodes.at("A.md").inbound, 1);
    EXPECT_EQ(nodes.at("C.md").inbound, 1);
    EXPECT_EQ(nodes.at("C.md").outbound, 0);
    EXPECT_EQ(nodes.at("A.md").neighbors, (std::vector<std::string>{"B.md", "C.md"}));
    EXPECT_EQ(count_edges(nodes), 3);
}

TEST_F(GraphBuilderTest, DuplicateSelfAndDanglingLinksIgnored) {
    std::vector<NoteEntry> entries = {
        note("A.md", {link("B.md"), link("B.md", LinkKind::ALIAS), link("A.md"), link("Nowhere.md")}),
        note("B.md"),
    };

    NodeMap nodes = GraphBuilder(options).build(entries);
    EXPECT_EQ(nodes.at("A.md").outbound, 1);
    EXPECT_EQ(nodes.at("B.md").inbound, 1);

    // The first link to a target decides the backlink kind
    ASSERT_EQ(nodes.at("B.md").backlinks.size(), 1);
    EXPECT_EQ(nodes.at("B.md").backlinks[0].kind, LinkKind::BASIC);
}

TEST_F(GraphBuilderTest, FirstEntryForPathWins) {
    std::vector<NoteEntry> entries = {
        note("A.md", {link("B.md")}, {"first"}),
        note("A", {}, {"second"}),
        note("B.md"),
    };

    NodeMap nodes = GraphBuilder(options).build(entries);
    ASSERT_EQ(nodes.size(), 2);
    EXPECT_EQ(nodes.at("A.md").tags, (std::vector<std::string>{"first"}));
    EXPECT_EQ(nodes.at("A.md").outbound, 1);
}

TEST_F(GraphBuilderTest, SkipEmbedsAndAnchors) {
    std::vector<NoteEntry> entries = {
        note("A.md", {link("B.md", LinkKind::EMBED), link("C.md", LinkKind::HEADING),
                      link("D.md", LinkKind::BLOCK), link("E.md", LinkKind::ALIAS)}),
        note("B.md"), note("C.md"), note("D.md"), note("E.md"),
    };

    options.skip_embeds = true;
    NodeMap nodes = GraphBuilder(options).build(entries);
    EXPECT_EQ(nodes.at("A.md").neighbors, (std::vector<std::string>{"C.md", "D.md", "E.md"}));

    options.skip_embeds = false;
    options.skip_anchors = true;
    nodes = GraphBuilder(options).build(entries);
    EXPECT_EQ(nodes.at("A.md").neighbors, (std::vector<std::string>{"B.md", "E.md"}));
}

TEST_F(GraphBuilderTest, MutualOnlyKeepsReciprocatedLinks) {
    std::vector<NoteEntry> entries = {
        note("A.md", {link("B.md"), link("C.md")}),
        note("B.md", {link("A.md")}),
        note("C.md"),
    };

    options.mutual_only = true;
    NodeMap nodes = GraphBuilder(options).build(entries);
    EXPECT_EQ(nodes.at("A.md").neighbors, (std::vector<std::string>{"B.md"}));
    EXPECT_EQ(nodes.at("B.md").neighbors, (std::vector<std::string>{"A.md"}));
    EXPECT_TRUE(nodes.at("C.md").is_orphan());
}

// ==========================================
// Pruning and Filtering Tests
// ==========================================

TEST_F(GraphBuilderTest, MinDegreePruneDoesNotCascade) {
    std::vector<NoteEntry> entries = {note("Hub.md", {link("L1.md"), link("L2.md"), link("L3.md"),
                                                      link("L4.md"), link("L5.md")})};
    for (int i = 1; i <= 5; ++i) {
        entries.push_back(note("L" + std::to_string(i) + ".md"));
    }

    options.min_degree = 2;
    GraphBuilder builder(options);
    NodeMap nodes = builder.build(entries);

    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(builder.pruned().size(), 5);
    EXPECT_TRUE(builder.pruned().count("L3.md"));
    // Hub keeps its place even though it has no edges left
    EXPECT_TRUE(nodes.at("Hub.md").neighbors.empty());
    EXPECT_TRUE(nodes.at("Hub.md").is_orphan());
}

TEST_F(GraphBuilderTest, SelectorsRecordFilteredNotes) {
    std::vector<NoteEntry> entries = {
        note("Projects/a.md", {link("Inbox/b.md")}),
        note("Projects/c.md", {link("Projects/a.md")}, {"draft"}),
        note("Inbox/b.md", {link("Projects/a.md")}),
    };

    options.include_patterns = {"Projects"};
    options.exclude_patterns = {"tag:draft"};
    GraphBuilder builder(options);
    NodeMap nodes = builder.build(entries);

    ASSERT_EQ(nodes.size(), 1);
    EXPECT_TRUE(nodes.count("Projects/a.md"));
    EXPECT_EQ(builder.filtered_out(), (std::set<std::string>{"Inbox/b.md", "Projects/c.md"}));
    // Links to filtered notes disappear
    EXPECT_TRUE(nodes.at("Projects/a.md").is_orphan());
}

// ==========================================
// Backlink and Helper Tests
// ==========================================

TEST_F(GraphBuilderTest, BacklinksSortedByReferrer) {
    std::vector<NoteEntry> entries = {
        note("Z.md", {link("T.md", LinkKind::EMBED)}),
        note("A.md", {link("T.md", LinkKind::HEADING)}),
        note("M.md", {link("T.md")}),
        note("T.md"),
    };

    NodeMap nodes = GraphBuilder(options).build(entries);
    const auto& bl = nodes.at("T.md").backlinks;
    ASSERT_EQ(bl.size(), 3);
    EXPECT_EQ(bl[0].referrer, "A.md");
    EXPECT_EQ(bl[0].kind, LinkKind::HEADING);
    EXPECT_EQ(bl[1].referrer, "M.md");
    EXPECT_EQ(bl[2].referrer, "Z.md");
    EXPECT_EQ(bl[2].to_json()["linkType"], "embed");
}

TEST(GraphHelperTest, UndirectedAdjacencyIsSymmetric) {
    NodeMap nodes;
    nodes["a.md"].path = "a.md";
    nodes["b.md"].path = "b.md";
    nodes["c.md"].path = "c.md";
    nodes["a.md"].neighbors = {"b.md"};
    nodes["b.md"].neighbors = {"a.md"};
    recount_degrees(nodes);

    auto adj = undirected_adjacency(nodes);
    EXPECT_EQ(adj.at("a.md"), (std::vector<std::string>{"b.md"}));
    EXPECT_EQ(adj.at("b.md"), (std::vector<std::string>{"a.md"}));
    EXPECT_TRUE(adj.at("c.md").empty());
    EXPECT_EQ(nodes.at("a.md").inbound, 1);
}

#include <gtest/gtest.h>
#include "graph/components.hpp"
#include <algorithm>

using namespace vgraph;

class ComponentsTest : public ::testing::Test {
protected:
    NodeMap nodes;

    void add_edge(const std::string& src, const std::string& dst) {
        nodes[src].path = src;
        nodes[dst].path = dst;
        nodes[src].neighbors.push_back(dst);
    }

    void add_node(const std::string& path) {
        nodes[path].path = path;
    }

    void SetUp() override {
        // Cycle a -> b -> c -> a, tail c -> d, separate pair x <-> y, isolated z
        add_edge("a.md", "b.md");
        add_edge("b.md", "c.md");
        add_edge("c.md", "a.md");
        add_edge("c.md", "d.md");
        add_edge("x.md", "y.md");
        add_edge("y.md", "x.md");
        add_node("z.md");
        recount_degrees(nodes);
    }
};

// ==========================================
// Weak Component Tests
// ==========================================

TEST_F(ComponentsTest, WeakComponentsSortedBySize) {
    auto weak = ComponentFinder::weak_components(nodes);
    ASSERT_EQ(weak.size(), 3);
    EXPECT_EQ(weak[0], (Component{"a.md", "b.md", "c.md", "d.md"}));
    EXPECT_EQ(weak[1], (Component{"x.md", "y.md"}));
    EXPECT_EQ(weak[2], (Component{"z.md"}));
}

// ==========================================
// Strong Component Tests
// ==========================================

TEST_F(ComponentsTest, StrongComponentsSplitTails) {
    auto strong = ComponentFinder::strong_components(nodes);
    ASSERT_EQ(strong.size(), 4);
    EXPECT_EQ(strong[0], (Component{"a.md", "b.md", "c.md"}));
    EXPECT_EQ(strong[1], (Component{"x.md", "y.md"}));
    // Singletons ordered by path
    EXPECT_EQ(strong[2], (Component{"d.md"}));
    EXPECT_EQ(strong[3], (Component{"z.md"}));
}

TEST_F(ComponentsTest, StrongComponentsNestInWeakOnes) {
    // Second cycle e -> f -> g -> e draining into the first, plus a chain m -> n -> o
    add_edge("e.md", "f.md");
    add_edge("f.md", "g.md");
    add_edge("g.md", "e.md");
    add_edge("g.md", "a.md");
    add_edge("m.md", "n.md");
    add_edge("n.md", "o.md");
    recount_degrees(nodes);

    auto weak = ComponentFinder::weak_components(nodes);
    auto strong = ComponentFinder::strong_components(nodes);
    ASSERT_EQ(weak.size(), 4);
    EXPECT_EQ(strong.size(), 8);

    size_t covered = 0;
    for (const auto& scc : strong) {
        ASSERT_FALSE(scc.empty());
        covered += scc.size();
        int containing = 0;
        for (const auto& wcc : weak) {
            if (std::includes(wcc.begin(), wcc.end(), scc.begin(), scc.end())) {
                containing++;
            }
        }
        EXPECT_EQ(containing, 1) << scc.front();
    }
    EXPECT_EQ(covered, nodes.size());
}

TEST_F(ComponentsTest, LongChainDoesNotRecurse) {
    NodeMap chain;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        std::string p = "n" + std::to_string(i) + ".md";
        chain[p].path = p;
        chain[p].neighbors.push_back("n" + std::to_string((i + 1) % n) + ".md");
    }
    auto strong = ComponentFinder::strong_components(chain);
    ASSERT_EQ(strong.size(), 1);
    EXPECT_EQ(strong[0].size(), static_cast<size_t>(n));
}

// ==========================================
// Assignment Tests
// ==========================================

TEST_F(ComponentsTest, AssignStampsIds) {
    auto weak = ComponentFinder::weak_components(nodes);
    auto strong = ComponentFinder::strong_components(nodes);
    ComponentFinder::assign(nodes, weak, strong);

    EXPECT_EQ(nodes.at("d.md").weak_component, "comp0");
    EXPECT_EQ(nodes.at("y.md").weak_component, "comp1");
    EXPECT_EQ(nodes.at("z.md").weak_component, "comp2");
    EXPECT_EQ(nodes.at("b.md").strong_component, "scc0");
    EXPECT_EQ(nodes.at("d.md").strong_component, "scc2");
}

TEST(UnionFindTest, UniteAndFind) {
    UnionFind uf(5);
    EXPECT_TRUE(uf.unite(0, 1));
    EXPECT_TRUE(uf.unite(3, 4));
    EXPECT_FALSE(uf.unite(1, 0));
    EXPECT_EQ(uf.find(0), uf.find(1));
    EXPECT_NE(uf.find(0), uf.find(3));
    EXPECT_EQ(uf.find(2), 2u);
}

#include <gtest/gtest.h>
#include "vault/note_entry.hpp"
#include "vault/path_cache.hpp"

using namespace vgraph;

// ==========================================
// Link Kind Tests
// ==========================================

TEST(LinkKindTest, StringNames) {
    EXPECT_EQ(link_kind_to_string(LinkKind::ALIAS), "alias");
    EXPECT_EQ(link_kind_from_string("embed"), LinkKind::EMBED);
    EXPECT_EQ(link_kind_from_string("block"), LinkKind::BLOCK);
}

TEST(LinkKindTest, UnknownKindThrows) {
    EXPECT_THROW(link_kind_from_string("transclusion"), VaultError);
}

// ==========================================
// Path Helper Tests
// ==========================================

TEST(PathHelperTest, NormalizePath) {
    EXPECT_EQ(normalize_path("./Notes\\daily\\a.md"), "Notes/daily/a.md");
    EXPECT_EQ(normalize_path("/Notes/a.md"), "Notes/a.md");
}

TEST(PathHelperTest, MdSuffixAndBasename) {
    EXPECT_EQ(add_md_suffix("Notes/a"), "Notes/a.md");
    EXPECT_EQ(add_md_suffix("Notes/a.md"), "Notes/a.md");
    EXPECT_EQ(strip_extension("Notes/v1.2/a.md"), "Notes/v1.2/a");
    EXPECT_EQ(strip_extension("Notes/v1.2/readme"), "Notes/v1.2/readme");
    EXPECT_EQ(path_basename("Notes/daily/a.md"), "a.md");
}

// ==========================================
// Timestamp Tests
// ==========================================

TEST(TimestampTest, DateOnly) {
    auto ts = parse_timestamp("2024-03-10");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-03-10T00:00:00Z");
}

TEST(TimestampTest, OffsetIsApplied) {
    auto ts = parse_timestamp("2024-03-10T12:30:00+02:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-03-10T10:30:00Z");
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("next tuesday").has_value());
    EXPECT_FALSE(parse_timestamp("2024-13-40").has_value());
}

// ==========================================
// NoteEntry JSON Tests
// ==========================================

TEST(NoteEntryTest, FromJsonNormalizes) {
    nlohmann::json j = {
        {"path", "Notes/Alpha"},
        {"tags", {"#Idea", "Work"}},
        {"links", {"Notes/Beta", {{"target", "Gamma"}, {"kind", "heading"}}}},
        {"frontmatter", {{"status", "done"}, {"priority", 2}}},
        {"modified", "2024-05-01T08:00:00Z"}
    };

    NoteEntry e = NoteEntry::from_json(j);
    EXPECT_EQ(e.path, "Notes/Alpha.md");
    EXPECT_EQ(e.title, "Alpha");
    EXPECT_EQ(e.tags, (std::vector<std::string>{"idea", "work"}));

    ASSERT_EQ(e.links.size(), 2);
    EXPECT_EQ(e.links[0].target, "Notes/Beta.md");
    EXPECT_EQ(e.links[0].kind, LinkKind::BASIC);
    EXPECT_EQ(e.links[1].target, "Gamma.md");
    EXPECT_EQ(e.links[1].kind, LinkKind::HEADING);
    EXPECT_TRUE(e.links[1].anchored);

    EXPECT_EQ(e.frontmatter.at("status"), "done");
    EXPECT_EQ(e.frontmatter.at("priority"), "2");
    ASSERT_TRUE(e.modified.has_value());
    EXPECT_EQ(format_timestamp(*e.modified), "2024-05-01T08:00:00Z");
}

TEST(NoteEntryTest, BadTimestampThrows) {
    nlohmann::json j = {{"path", "a.md"}, {"modified", "yesterday"}};
    EXPECT_THROW(NoteEntry::from_json(j), VaultError);
}

TEST(NoteEntryTest, ToJsonKeepsLinkKinds) {
    NoteEntry e;
    e.path = "a.md";
    e.title = "a";
    e.links.push_back({"b.md", LinkKind::EMBED, false});

    auto j = e.to_json();
    EXPECT_EQ(j["links"][0]["kind"], "embed");
    EXPECT_FALSE(j.contains("modified"));
}

// ==========================================
// Path Cache Tests
// ==========================================

class PathCacheTest : public ::testing::Test {
protected:
    NotePathCache cache;

    void SetUp() override {
        cache.add("Projects/Roadmap.md");
        cache.add("Archive/Projects/Roadmap.md");
        cache.add("Inbox.md");
        cache.add("Specs/Note v1.2.md");
    }
};

TEST_F(PathCacheTest, ResolvesFullPath) {
    EXPECT_EQ(cache.resolve("Archive/Projects/Roadmap"), "Archive/Projects/Roadmap.md");
    EXPECT_EQ(cache.resolve("Inbox.md"), "Inbox.md");
}

TEST_F(PathCacheTest, BareNamePrefersShorterPath) {
    EXPECT_EQ(cache.resolve("Roadmap"), "Projects/Roadmap.md");
}

TEST_F(PathCacheTest, StripsAnchors) {
    EXPECT_EQ(cache.resolve("Inbox#Today"), "Inbox.md");
    EXPECT_EQ(cache.resolve("Inbox#^abc123"), "Inbox.md");
}

TEST_F(PathCacheTest, FallsBackToBasenameForUnknownFolders) {
    EXPECT_EQ(cache.resolve("Elsewhere/Inbox"), "Inbox.md");
}

TEST_F(PathCacheTest, DotsInNamesAreKept) {
    EXPECT_EQ(cache.resolve("Note v1.2"), "Specs/Note v1.2.md");
}

TEST_F(PathCacheTest, UnknownLink) {
    EXPECT_FALSE(cache.resolve("Nowhere").has_value());
    EXPECT_EQ(cache.size(), 6u);
}

#include <gtest/gtest.h>
#include "vault/note_selector.hpp"

using namespace vgraph;

namespace {

NoteEntry make_entry(const std::string& path,
                     std::vector<std::string> tags = {},
                     std::map<std::string, std::string> frontmatter = {}) {
    NoteEntry e;
    e.path = path;
    e.title = path_basename(strip_extension(path));
    e.tags = std::move(tags);
    e.frontmatter = std::move(frontmatter);
    return e;
}

} // namespace

// ==========================================
// Fuzzy Match Tests
// ==========================================

TEST(FuzzyMatchTest, WordsInOrderAtBoundaries) {
    EXPECT_TRUE(fuzzy_match("proj alpha", "Projects/Alpha Plan.md"));
    EXPECT_FALSE(fuzzy_match("plan alpha", "Projects/Alpha Plan.md"));
    EXPECT_FALSE(fuzzy_match("ha", "Projects/Alpha Plan.md"));
}

TEST(FuzzyMatchTest, DirectoryPart) {
    EXPECT_TRUE(fuzzy_match("projects/alpha", "Projects/Alpha Plan.md"));
    EXPECT_TRUE(fuzzy_match("p/alpha", "Projects/Alpha Plan.md"));
    EXPECT_TRUE(fuzzy_match("projects/", "Projects/Alpha Plan.md"));
    EXPECT_FALSE(fuzzy_match("notes/alpha", "Projects/Alpha Plan.md"));
    EXPECT_FALSE(fuzzy_match("proj/alpha", "Projects/Alpha Plan.md"));
}

TEST(FuzzyMatchTest, Wildcards) {
    EXPECT_TRUE(fuzzy_match("proj*", "Projects/x.md"));
    EXPECT_TRUE(fuzzy_match("pro*/x*", "Projects/x.md"));
    EXPECT_FALSE(fuzzy_match("arch*/x*", "Projects/x.md"));
}

TEST(FuzzyMatchTest, DottedPatternsMatchSegments) {
    EXPECT_TRUE(fuzzy_match("plan.md", "Projects/Alpha Plan.md"));
    EXPECT_FALSE(fuzzy_match("roadmap.md", "Projects/Alpha Plan.md"));
}

TEST(FuzzyMatchTest, TooManySlashes) {
    EXPECT_FALSE(fuzzy_match("a/b/c", "a/b/c.md"));
    EXPECT_FALSE(fuzzy_match("", "a.md"));
}

// ==========================================
// Selector Parsing Tests
// ==========================================

TEST(NoteSelectorTest, ParseKinds) {
    auto tag = NoteSelector::parse("tag:#Idea");
    EXPECT_EQ(tag.type, NoteSelector::Type::TAG);
    EXPECT_EQ(tag.value, "idea");

    auto find = NoteSelector::parse("find:\"alpha plan\"");
    EXPECT_EQ(find.type, NoteSelector::Type::FIND);
    EXPECT_EQ(find.value, "alpha plan");

    auto prop = NoteSelector::parse("status: done");
    EXPECT_EQ(prop.type, NoteSelector::Type::PROPERTY);
    EXPECT_EQ(prop.property, "status");
    EXPECT_EQ(prop.value, "done");

    auto file = NoteSelector::parse("Notes/Daily/");
    EXPECT_EQ(file.type, NoteSelector::Type::FILE);
    EXPECT_EQ(file.value, "Notes/Daily");
}

TEST(NoteSelectorTest, InvalidSelectorsThrow) {
    EXPECT_THROW(NoteSelector::parse("tag:*"), std::runtime_error);
    EXPECT_THROW(NoteSelector::parse("find:"), std::runtime_error);
    EXPECT_THROW(NoteSelector::parse("status:"), std::runtime_error);
    EXPECT_THROW(NoteSelector::parse("   "), std::runtime_error);
}

// ==========================================
// Selector Matching Tests
// ==========================================

TEST(NoteSelectorTest, FileMatchesPathOrDirectory) {
    auto sel = NoteSelector::parse("Notes");
    EXPECT_TRUE(sel.matches(make_entry("Notes/a.md")));
    EXPECT_TRUE(sel.matches(make_entry("Notes.md")));
    EXPECT_FALSE(sel.matches(make_entry("Notesy/a.md")));
    EXPECT_TRUE(NoteSelector::parse("*").matches(make_entry("anything.md")));
}

TEST(NoteSelectorTest, TagMatchesNested) {
    auto sel = NoteSelector::parse("tag:project");
    EXPECT_TRUE(sel.matches(make_entry("a.md", {"project"})));
    EXPECT_TRUE(sel.matches(make_entry("a.md", {"project/alpha"})));
    EXPECT_FALSE(sel.matches(make_entry("a.md", {"projects"})));
}

TEST(NoteSelectorTest, PropertyMatchesCaseInsensitivelyAndListItems) {
    EXPECT_TRUE(NoteSelector::parse("status:Done").matches(make_entry("a.md", {}, {{"status", "done"}})));
    EXPECT_TRUE(NoteSelector::parse("aliases:beta").matches(make_entry("a.md", {}, {{"aliases", "alpha, beta"}})));
    EXPECT_FALSE(NoteSelector::parse("status:done").matches(make_entry("a.md")));
}

TEST(NoteSelectorTest, IncludeAndExclude) {
    auto include = parse_selectors({"Projects"});
    auto exclude = parse_selectors({"tag:draft"});

    EXPECT_TRUE(passes_filters(include, exclude, make_entry("Projects/a.md")));
    EXPECT_FALSE(passes_filters(include, exclude, make_entry("Projects/b.md", {"draft"})));
    EXPECT_FALSE(passes_filters(include, exclude, make_entry("Inbox/c.md")));
    EXPECT_TRUE(passes_filters({}, {}, make_entry("Inbox/c.md")));
}

// ==========================================
// Ignore Rule Tests
// ==========================================

TEST(IgnorePathTest, HiddenAndPrefixes) {
    EXPECT_TRUE(should_ignore_path(".obsidian/workspace.md", {}));
    EXPECT_TRUE(should_ignore_path("Notes/.trash/old.md", {}));
    EXPECT_TRUE(should_ignore_path("Templates/daily.md", {"Templates/"}));
    EXPECT_FALSE(should_ignore_path("Notes/a.md", {"Templates"}));
    EXPECT_FALSE(should_ignore_path("Notes/a.md", {"  "}));
}

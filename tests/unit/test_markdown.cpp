#include <gtest/gtest.h>
#include "vault/markdown.hpp"

using namespace vgraph;

namespace {

TimePoint at(const std::string& iso) {
    return *parse_timestamp(iso);
}

} // namespace

// ==========================================
// Wikilink Tests
// ==========================================

TEST(WikilinkTest, ClassifiesEveryKind) {
    auto links = scan_wikilinks("See [[A]], [[B|bee]], [[C#Intro]], [[D#^blk]] and ![[E]].");
    ASSERT_EQ(links.size(), 5);

    // Embeds are reported first
    EXPECT_EQ(links[0].target, "E");
    EXPECT_EQ(links[0].kind, LinkKind::EMBED);

    EXPECT_EQ(links[1].target, "A");
    EXPECT_EQ(links[1].kind, LinkKind::BASIC);
    EXPECT_FALSE(links[1].anchored);

    EXPECT_EQ(links[2].target, "B");
    EXPECT_EQ(links[2].kind, LinkKind::ALIAS);

    EXPECT_EQ(links[3].target, "C#Intro");
    EXPECT_EQ(links[3].kind, LinkKind::HEADING);
    EXPECT_TRUE(links[3].anchored);

    EXPECT_EQ(links[4].target, "D#^blk");
    EXPECT_EQ(links[4].kind, LinkKind::BLOCK);
}

TEST(WikilinkTest, EmbedsAreNotCountedTwice) {
    auto links = scan_wikilinks("![[Diagram]] and [[Diagram]]");
    ASSERT_EQ(links.size(), 2);
    EXPECT_EQ(links[0].kind, LinkKind::EMBED);
    EXPECT_EQ(links[1].kind, LinkKind::BASIC);
}

TEST(WikilinkTest, NoLinks) {
    EXPECT_TRUE(scan_wikilinks("plain [text](url) only").empty());
}

// ==========================================
// Frontmatter Tests
// ==========================================

TEST(FrontmatterTest, ScalarsAndLists) {
    std::string content =
        "---\n"
        "title: \"Hello\"\n"
        "tags: [Project, idea]\n"
        "aliases:\n"
        "  - first\n"
        "  - second\n"
        "empty:\n"
        "---\n"
        "body\n";

    Frontmatter fm = parse_frontmatter(content);
    EXPECT_EQ(fm.scalars.at("title"), "Hello");
    EXPECT_EQ(fm.lists.at("tags"), (std::vector<std::string>{"Project", "idea"}));
    EXPECT_EQ(fm.lists.at("aliases"), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(fm.lists.count("empty"), 0);
    EXPECT_EQ(fm.get("aliases"), "first");
}

TEST(FrontmatterTest, MissingOrUnterminated) {
    EXPECT_TRUE(parse_frontmatter("no frontmatter here").empty());
    EXPECT_TRUE(parse_frontmatter("---\ntitle: x\nnever closed").empty());
}

// ==========================================
// Tag Tests
// ==========================================

TEST(TagTest, HashtagsSkipCode) {
    std::string content =
        "#one text #two\n"
        "```\n"
        "#code\n"
        "```\n"
        "`#inline` #three and a#notatag\n";

    auto tags = extract_hashtags(content);
    EXPECT_EQ(tags, (std::vector<std::string>{"#one", "#two", "#three"}));
}

TEST(TagTest, FrontmatterAndBodyMerged) {
    std::string content =
        "---\n"
        "tags: [Project, idea]\n"
        "---\n"
        "Body #Idea #new-thing\n";

    auto tags = extract_tags(content, parse_frontmatter(content));
    EXPECT_EQ(tags, (std::vector<std::string>{"idea", "new-thing", "project"}));
}

TEST(TagTest, CommaSeparatedScalar) {
    std::string content = "---\ntags: alpha, #Beta\n---\n";
    auto tags = extract_tags(content, parse_frontmatter(content));
    EXPECT_EQ(tags, (std::vector<std::string>{"alpha", "beta"}));
}

// ==========================================
// Content Time Tests
// ==========================================

class ContentTimeTest : public ::testing::Test {
protected:
    TimePoint now;

    void SetUp() override {
        now = at("2024-06-01T00:00:00Z");
    }
};

TEST_F(ContentTimeTest, FrontmatterKeyWins) {
    std::string content = "---\ncreated: 2023-01-01\nupdated: 2024-01-15\n---\n## 2024-05-05\n";
    auto ts = resolve_content_time("Daily/2024-02-03.md", content, parse_frontmatter(content), now);
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-01-15T00:00:00Z");
}

TEST_F(ContentTimeTest, DateInPath) {
    auto ts = resolve_content_time("Daily/2024-02-03.md", "text", Frontmatter{}, now);
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-02-03T00:00:00Z");
}

TEST_F(ContentTimeTest, MostRecentHeading) {
    std::string content = "# Log\n## 2024-03-01\nfirst\n## 2024-04-05\nsecond\n";
    auto ts = resolve_content_time("log.md", content, Frontmatter{}, now);
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-04-05T00:00:00Z");
}

TEST_F(ContentTimeTest, NearFutureIsClamped) {
    std::string content = "---\ndate: 2024-07-01\n---\n";
    auto ts = resolve_content_time("x.md", content, parse_frontmatter(content), now);
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, now);
}

TEST_F(ContentTimeTest, ImplausibleDatesRejected) {
    std::string content = "---\ndate: 1850-01-01\nupdated: 2031-01-01\n---\nno dates below\n";
    EXPECT_FALSE(resolve_content_time("x.md", content, parse_frontmatter(content), now).has_value());
}

#include "vault/markdown.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <regex>
#include <set>
#include <sstream>

namespace vgraph {

namespace {

const std::regex wikilink_re(R"(\[\[(.*?)(?:\|.*?)?\]\])");
const std::regex embed_re(R"(!\[\[(.*?)(?:\|.*?)?\]\])");
const std::regex hashtag_re(R"((^|\s)#([A-Za-z0-9_\-]+))");
const std::regex iso_date_re(R"(\d{4}-\d{2}-\d{2}(?:[T _]?\d{2}:?\d{2}(?::?\d{2})?)?)");
const std::regex heading_date_re(R"(^\s{0,3}#*\s*(\d{4}-\d{2}-\d{2}(?:[T ]\d{2}:\d{2}(?::\d{2})?)?)\b)");

constexpr int kMinSaneYear = 1900;
constexpr int kTopLinesForDates = 20;
const auto kMaxFutureTolerance = std::chrono::hours(24 * 365);

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                          (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_tag(const std::string& raw) {
    std::string tag = trim(raw);
    if (!tag.empty() && tag[0] == '#') tag.erase(0, 1);
    return to_lower(tag);
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::stringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string strip_code(const std::string& content) {
    std::string result;
    bool in_block = false;
    for (const auto& line : split_lines(content)) {
        if (trim(line).rfind("```", 0) == 0) {
            in_block = !in_block;
            continue;
        }
        if (in_block) continue;

        // Keep only the even segments between backticks
        bool in_inline = false;
        for (char c : line) {
            if (c == '`') {
                in_inline = !in_inline;
                continue;
            }
            if (!in_inline) result += c;
        }
        result += '\n';
    }
    return result;
}

bool sane_timestamp(TimePoint ts, TimePoint now) {
    std::time_t t = Clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    if (tm.tm_year + 1900 < kMinSaneYear) return false;
    return ts <= now + kMaxFutureTolerance;
}

std::optional<TimePoint> parse_sane(const std::string& value, TimePoint now) {
    auto ts = parse_timestamp(trim(value));
    if (ts && sane_timestamp(*ts, now)) return ts;
    return std::nullopt;
}

} // namespace

// ==========================================
// Wikilinks
// ==========================================

std::vector<RawWikilink> scan_wikilinks(const std::string& content) {
    std::vector<RawWikilink> links;

    for (auto it = std::sregex_iterator(content.begin(), content.end(), embed_re);
         it != std::sregex_iterator(); ++it) {
        RawWikilink link;
        link.target = (*it)[1].str();
        std::replace(link.target.begin(), link.target.end(), '\\', '/');
        link.kind = LinkKind::EMBED;
        link.anchored = link.target.find('#') != std::string::npos;
        links.push_back(link);
    }

    // Embeds are removed so they are not counted twice
    std::string without_embeds = std::regex_replace(content, embed_re, "");
    for (auto it = std::sregex_iterator(without_embeds.begin(), without_embeds.end(), wikilink_re);
         it != std::sregex_iterator(); ++it) {
        RawWikilink link;
        std::string whole = (*it)[0].str();
        link.target = (*it)[1].str();
        std::replace(link.target.begin(), link.target.end(), '\\', '/');
        link.anchored = link.target.find('#') != std::string::npos;

        if (whole.find('|') != std::string::npos) {
            link.kind = LinkKind::ALIAS;
        } else if (link.target.find("#^") != std::string::npos) {
            link.kind = LinkKind::BLOCK;
        } else if (link.anchored) {
            link.kind = LinkKind::HEADING;
        }
        links.push_back(link);
    }

    return links;
}

// ==========================================
// Frontmatter
// ==========================================

std::optional<std::string> Frontmatter::get(const std::string& key) const {
    auto it = scalars.find(key);
    if (it != scalars.end()) return it->second;
    auto lit = lists.find(key);
    if (lit != lists.end() && !lit->second.empty()) return lit->second.front();
    return std::nullopt;
}

Frontmatter parse_frontmatter(const std::string& content) {
    Frontmatter fm;
    auto lines = split_lines(content);
    if (lines.empty() || trim(lines[0]) != "---") {
        return fm;
    }

    size_t end = 1;
    while (end < lines.size() && trim(lines[end]) != "---") ++end;
    if (end >= lines.size()) {
        return fm;  // Unterminated block is treated as body text
    }

    std::string current_key;
    for (size_t i = 1; i < end; ++i) {
        const std::string& line = lines[i];
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        if (trimmed.rfind("- ", 0) == 0 || trimmed == "-") {
            if (!current_key.empty()) {
                std::string item = unquote(trim(trimmed.substr(1)));
                if (!item.empty()) fm.lists[current_key].push_back(item);
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || std::isspace(static_cast<unsigned char>(line[0]))) {
            continue;
        }

        current_key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (value.empty()) {
            fm.lists[current_key];
            continue;
        }

        if (value.front() == '[' && value.back() == ']') {
            auto& items = fm.lists[current_key];
            std::stringstream ss(value.substr(1, value.size() - 2));
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = unquote(trim(item));
                if (!item.empty()) items.push_back(item);
            }
        } else {
            fm.scalars[current_key] = unquote(value);
        }
    }

    // Keys that never received items are dropped
    for (auto it = fm.lists.begin(); it != fm.lists.end();) {
        if (it->second.empty()) it = fm.lists.erase(it);
        else ++it;
    }
    return fm;
}

// ==========================================
// Tags
// ==========================================

std::vector<std::string> extract_hashtags(const std::string& content) {
    std::vector<std::string> tags;
    std::set<std::string> seen;
    std::string body = strip_code(content);
    for (auto it = std::sregex_iterator(body.begin(), body.end(), hashtag_re);
         it != std::sregex_iterator(); ++it) {
        std::string tag = "#" + (*it)[2].str();
        if (seen.insert(tag).second) {
            tags.push_back(tag);
        }
    }
    return tags;
}

std::vector<std::string> extract_tags(const std::string& content, const Frontmatter& frontmatter) {
    std::set<std::string> tags;

    auto lit = frontmatter.lists.find("tags");
    if (lit != frontmatter.lists.end()) {
        for (const auto& t : lit->second) {
            auto tag = normalize_tag(t);
            if (!tag.empty()) tags.insert(tag);
        }
    }
    auto sit = frontmatter.scalars.find("tags");
    if (sit != frontmatter.scalars.end()) {
        std::stringstream ss(sit->second);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto tag = normalize_tag(item);
            if (!tag.empty()) tags.insert(tag);
        }
    }

    // Skip the frontmatter block so "tags: #x" is not read twice
    std::string body = content;
    if (!frontmatter.empty()) {
        auto close = content.find("\n---", 3);
        if (close != std::string::npos) body = content.substr(close + 4);
    }
    for (const auto& ht : extract_hashtags(body)) {
        auto tag = normalize_tag(ht);
        if (!tag.empty()) tags.insert(tag);
    }

    return {tags.begin(), tags.end()};
}

// ==========================================
// Content time
// ==========================================

std::optional<TimePoint> resolve_content_time(const std::string& path,
                                              const std::string& content,
                                              const Frontmatter& frontmatter,
                                              TimePoint now) {
    auto clamp = [&](TimePoint ts) { return ts > now ? now : ts; };

    static const std::vector<std::string> keys = {
        "event_date", "meeting_date", "updated", "modified", "date", "created"
    };
    for (const auto& key : keys) {
        auto sit = frontmatter.scalars.find(key);
        if (sit != frontmatter.scalars.end()) {
            if (auto ts = parse_sane(sit->second, now)) return clamp(*ts);
        }
        auto lit = frontmatter.lists.find(key);
        if (lit != frontmatter.lists.end()) {
            for (const auto& item : lit->second) {
                if (auto ts = parse_sane(item, now)) return clamp(*ts);
            }
        }
    }

    std::smatch m;
    if (std::regex_search(path, m, iso_date_re)) {
        if (auto ts = parse_sane(m[0].str(), now)) return clamp(*ts);
    }

    auto lines = split_lines(content);
    std::optional<TimePoint> latest;
    for (const auto& line : lines) {
        if (std::regex_search(line, m, heading_date_re)) {
            if (auto ts = parse_sane(m[1].str(), now)) {
                if (!latest || *ts > *latest) latest = ts;
            }
        }
    }
    if (latest) return clamp(*latest);

    size_t limit = std::min(lines.size(), static_cast<size_t>(kTopLinesForDates));
    for (size_t i = 0; i < limit; ++i) {
        if (trim(lines[i]).empty()) continue;
        if (std::regex_search(lines[i], m, iso_date_re)) {
            if (auto ts = parse_sane(m[0].str(), now)) return clamp(*ts);
        }
    }

    return std::nullopt;
}

} // namespace vgraph

#include "vault/note_selector.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace vgraph {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool has_wildcards(const std::string& s) {
    return s.find_first_of("*?") != std::string::npos;
}

bool is_delimiter(char c) {
    switch (c) {
        case '/': case '-': case '_': case ' ': case '.': case ',': case '(': case ')':
            return true;
        default:
            return false;
    }
}

bool is_word_boundary(const std::string& text, size_t pos) {
    if (pos == 0) return true;
    if (pos >= text.size()) return false;
    return is_delimiter(text[pos - 1]);
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') {
            if (!current.empty()) words.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        parts.push_back(part);
    }
    if (parts.empty()) parts.push_back("");
    return parts;
}

// Words must occur in order, each starting at a word boundary
bool words_in_order(const std::vector<std::string>& words, std::string text) {
    for (const auto& word : words) {
        while (true) {
            auto idx = text.find(word);
            if (idx == std::string::npos) return false;
            if (is_word_boundary(text, idx)) {
                text = text.substr(idx + word.size());
                break;
            }
            text = text.substr(idx + 1);
        }
    }
    return true;
}

bool matches_directory(const std::string& dir_pattern, const std::string& path) {
    std::string first = split_segments(path).front();
    if (has_wildcards(dir_pattern)) {
        return wildcard_match(dir_pattern, first);
    }
    if (dir_pattern.size() == 1) {
        return first.rfind(dir_pattern, 0) == 0;
    }
    return first == dir_pattern;
}

bool matches_content(const std::string& pattern, const std::string& content) {
    if (has_wildcards(pattern)) {
        return wildcard_match(pattern, content);
    }
    return words_in_order(split_words(pattern), content);
}

bool matches_content_only(const std::string& pattern, const std::string& path) {
    if (has_wildcards(pattern)) {
        return wildcard_match(pattern, path, true);
    }
    return words_in_order(split_words(pattern), path);
}

} // namespace

// ==========================================
// Fuzzy matching
// ==========================================

bool wildcard_match(const std::string& pattern, const std::string& text, bool anywhere) {
    std::string rx;
    if (!anywhere) rx += '^';
    for (char c : pattern) {
        switch (c) {
            case '*': rx += ".*"; break;
            case '?': rx += '.'; break;
            case '.': case '+': case '(': case ')': case '|': case '[': case ']':
            case '{': case '}': case '^': case '$': case '\\':
                rx += '\\';
                rx += c;
                break;
            default:
                rx += c;
        }
    }
    if (!anywhere) rx += '$';
    return std::regex_search(text, std::regex(rx));
}

bool fuzzy_match(const std::string& pattern, const std::string& path) {
    if (pattern.empty() || path.empty()) {
        return false;
    }

    auto slashes = std::count(pattern.begin(), pattern.end(), '/');
    if (slashes > 1) {
        return false;
    }

    std::string pat = lower(pattern);
    std::string p = lower(path);

    if (slashes == 1) {
        auto slash = pat.find('/');
        std::string dir_pattern = pat.substr(0, slash);
        std::string content_pattern = pat.substr(slash + 1);

        if (!matches_directory(dir_pattern, p)) {
            return false;
        }
        if (content_pattern.empty()) {
            return true;
        }
        auto first_slash = p.find('/');
        if (first_slash == std::string::npos) {
            return false;
        }
        return matches_content(content_pattern, p.substr(first_slash + 1));
    }

    if (pat.find('.') != std::string::npos) {
        for (const auto& segment : split_segments(p)) {
            if (matches_content_only(pat, segment)) return true;
        }
        return false;
    }
    return matches_content_only(pat, p);
}

// ==========================================
// NoteSelector
// ==========================================

NoteSelector NoteSelector::parse(const std::string& raw) {
    NoteSelector sel;
    std::string arg = trim(raw);

    if (arg.rfind("tag:", 0) == 0) {
        sel.type = Type::TAG;
        sel.value = strip_quotes(arg.substr(4));
        if (!sel.value.empty() && sel.value[0] == '#') sel.value.erase(0, 1);
        if (sel.value.empty() || sel.value == "*") {
            throw std::runtime_error("invalid tag value in \"" + raw + "\": tag cannot be empty or a wildcard (*)");
        }
        sel.value = lower(sel.value);
        return sel;
    }

    if (arg.rfind("find:", 0) == 0) {
        sel.type = Type::FIND;
        sel.value = strip_quotes(arg.substr(5));
        if (sel.value.empty() || sel.value == "*") {
            throw std::runtime_error("invalid find value in \"" + raw + "\": find cannot be empty or a wildcard (*)");
        }
        return sel;
    }

    auto colon = arg.find(':');
    if (colon != std::string::npos) {
        sel.type = Type::PROPERTY;
        sel.property = trim(arg.substr(0, colon));
        sel.value = strip_quotes(trim(arg.substr(colon + 1)));
        if (sel.property.empty() || sel.value.empty() || sel.value == "*") {
            throw std::runtime_error("invalid property input \"" + raw + "\": both key and value are required");
        }
        return sel;
    }

    if (arg.empty()) {
        throw std::runtime_error("empty note pattern");
    }
    sel.type = Type::FILE;
    sel.value = normalize_path(arg);
    while (sel.value.size() > 1 && sel.value.back() == '/') sel.value.pop_back();
    return sel;
}

bool NoteSelector::matches(const NoteEntry& entry) const {
    switch (type) {
        case Type::FILE: {
            if (value == "*") return true;
            const std::string& path = entry.path;
            return path == value || path == add_md_suffix(value) ||
                   path.rfind(value + "/", 0) == 0;
        }
        case Type::FIND:
            return fuzzy_match(value, entry.path);
        case Type::TAG:
            for (const auto& tag : entry.tags) {
                // Nested tags match their parent: "project" selects "project/alpha"
                if (tag == value || tag.rfind(value + "/", 0) == 0) return true;
            }
            return false;
        case Type::PROPERTY: {
            auto it = entry.frontmatter.find(property);
            if (it == entry.frontmatter.end()) return false;
            std::string want = lower(value);
            std::string have = lower(it->second);
            if (have == want) return true;
            // Inline lists are stored comma-joined
            std::stringstream ss(have);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (trim(item) == want) return true;
            }
            return false;
        }
    }
    return false;
}

std::vector<NoteSelector> parse_selectors(const std::vector<std::string>& raw) {
    std::vector<NoteSelector> result;
    result.reserve(raw.size());
    for (const auto& r : raw) {
        result.push_back(NoteSelector::parse(r));
    }
    return result;
}

bool matches_any(const std::vector<NoteSelector>& selectors, const NoteEntry& entry) {
    return std::any_of(selectors.begin(), selectors.end(),
                       [&](const NoteSelector& s) { return s.matches(entry); });
}

bool passes_filters(const std::vector<NoteSelector>& include,
                    const std::vector<NoteSelector>& exclude,
                    const NoteEntry& entry) {
    if (!include.empty() && !matches_any(include, entry)) {
        return false;
    }
    return !matches_any(exclude, entry);
}

// ==========================================
// Ignore rules
// ==========================================

bool should_ignore_path(const std::string& rel_path, const std::vector<std::string>& ignored) {
    std::string rel = normalize_path(rel_path);
    if (rel.empty() || rel == ".") {
        return false;
    }

    for (const auto& segment : split_segments(rel)) {
        if (!segment.empty() && segment[0] == '.') {
            return true;
        }
    }

    for (const auto& raw : ignored) {
        std::string ig = normalize_path(trim(raw));
        if (ig.empty()) continue;
        if (rel.rfind(ig, 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace vgraph

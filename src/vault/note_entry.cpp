#include "vault/note_entry.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace vgraph {

// ==========================================
// LinkKind
// ==========================================

std::string link_kind_to_string(LinkKind kind) {
    switch (kind) {
        case LinkKind::BASIC: return "basic";
        case LinkKind::ALIAS: return "alias";
        case LinkKind::HEADING: return "heading";
        case LinkKind::BLOCK: return "block";
        case LinkKind::EMBED: return "embed";
    }
    return "basic";
}

LinkKind link_kind_from_string(const std::string& s) {
    if (s == "basic") return LinkKind::BASIC;
    if (s == "alias") return LinkKind::ALIAS;
    if (s == "heading") return LinkKind::HEADING;
    if (s == "block") return LinkKind::BLOCK;
    if (s == "embed") return LinkKind::EMBED;
    throw VaultError("Unknown link kind: " + s);
}

// ==========================================
// NoteLink / NoteEntry JSON
// ==========================================

nlohmann::json NoteLink::to_json() const {
    nlohmann::json j;
    j["target"] = target;
    j["kind"] = link_kind_to_string(kind);
    if (anchored) {
        j["anchored"] = true;
    }
    return j;
}

NoteLink NoteLink::from_json(const nlohmann::json& j) {
    NoteLink link;
    // Bare strings are accepted as basic links
    if (j.is_string()) {
        link.target = normalize_path(add_md_suffix(j.get<std::string>()));
        return link;
    }
    link.target = normalize_path(add_md_suffix(j.at("target").get<std::string>()));
    link.kind = link_kind_from_string(j.value("kind", std::string("basic")));
    link.anchored = j.value("anchored", link.kind == LinkKind::HEADING || link.kind == LinkKind::BLOCK);
    return link;
}

nlohmann::json NoteEntry::to_json() const {
    nlohmann::json j;
    j["path"] = path;
    j["title"] = title;
    j["tags"] = tags;
    j["links"] = nlohmann::json::array();
    for (const auto& link : links) {
        j["links"].push_back(link.to_json());
    }
    j["frontmatter"] = frontmatter;
    if (modified) {
        j["modified"] = format_timestamp(*modified);
    }
    return j;
}

NoteEntry NoteEntry::from_json(const nlohmann::json& j) {
    NoteEntry entry;
    entry.path = normalize_path(add_md_suffix(j.at("path").get<std::string>()));
    entry.title = j.value("title", path_basename(strip_extension(entry.path)));

    if (j.contains("tags")) {
        for (const auto& t : j["tags"]) {
            std::string tag = t.get<std::string>();
            if (!tag.empty() && tag[0] == '#') tag.erase(0, 1);
            std::transform(tag.begin(), tag.end(), tag.begin(), ::tolower);
            if (!tag.empty()) entry.tags.push_back(tag);
        }
    }
    if (j.contains("links")) {
        for (const auto& l : j["links"]) {
            entry.links.push_back(NoteLink::from_json(l));
        }
    }
    if (j.contains("frontmatter")) {
        for (const auto& [key, value] : j["frontmatter"].items()) {
            entry.frontmatter[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    if (j.contains("modified") && !j["modified"].is_null()) {
        auto raw = j["modified"].get<std::string>();
        entry.modified = parse_timestamp(raw);
        if (!entry.modified) {
            throw VaultError("Invalid timestamp for " + entry.path + ": " + raw);
        }
    }
    return entry;
}

// ==========================================
// Path helpers
// ==========================================

std::string normalize_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    while (result.rfind("./", 0) == 0) {
        result.erase(0, 2);
    }
    while (!result.empty() && result.front() == '/') {
        result.erase(0, 1);
    }
    return result;
}

std::string add_md_suffix(const std::string& path) {
    if (path.size() >= 3 && path.compare(path.size() - 3, 3, ".md") == 0) {
        return path;
    }
    return path + ".md";
}

std::string strip_extension(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path;
    }
    return path.substr(0, dot);
}

std::string path_basename(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ==========================================
// Timestamps
// ==========================================

std::string format_timestamp(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::optional<TimePoint> parse_timestamp(const std::string& value) {
    static const std::regex iso_re(
        R"((\d{4})-(\d{2})-(\d{2})(?:[T _]?(\d{2}):?(\d{2})(?::?(\d{2}))?(Z|[+-]\d{2}:?\d{2})?)?)");

    std::smatch m;
    if (!std::regex_search(value, m, iso_re)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(m[1].str()) - 1900;
    tm.tm_mon = std::stoi(m[2].str()) - 1;
    tm.tm_mday = std::stoi(m[3].str());
    tm.tm_hour = m[4].matched ? std::stoi(m[4].str()) : 0;
    tm.tm_min = m[5].matched ? std::stoi(m[5].str()) : 0;
    tm.tm_sec = m[6].matched ? std::stoi(m[6].str()) : 0;

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    std::time_t t = timegm(&tm);
    if (m[7].matched && m[7].str() != "Z") {
        std::string off = m[7].str();
        int sign = off[0] == '-' ? -1 : 1;
        off.erase(std::remove(off.begin(), off.end(), ':'), off.end());
        int hours = std::stoi(off.substr(1, 2));
        int minutes = std::stoi(off.substr(3, 2));
        t -= sign * (hours * 3600 + minutes * 60);
    }
    return Clock::from_time_t(t);
}

} // namespace vgraph

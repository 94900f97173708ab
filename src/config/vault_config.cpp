#include "config/vault_config.hpp"
#include "vault/note_entry.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace vgraph {

namespace {

std::string clean_prefix(const std::string& raw) {
    std::string p = raw;
    while (!p.empty() && (p.back() == ' ' || p.back() == '\t')) p.pop_back();
    while (!p.empty() && (p.front() == ' ' || p.front() == '\t')) p.erase(0, 1);
    return normalize_path(p);
}

} // namespace

// ============================================================================
// VaultConfig
// ============================================================================

std::string VaultConfig::path_for(const std::string& vault_root) {
    return (fs::path(vault_root) / ".vgraph" / "config.json").string();
}

VaultConfig VaultConfig::from_json_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return VaultConfig{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    VaultConfig config;
    try {
        json j;
        file >> j;
        config = from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid config file " + path + ": " + error);
    }
    return config;
}

VaultConfig VaultConfig::load_for_vault(const std::string& vault_root) {
    return from_json_file(path_for(vault_root));
}

void VaultConfig::to_json_file(const std::string& path) const {
    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create config directory " +
                                     p.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2) << "\n";
}

json VaultConfig::to_json() const {
    json j;
    j["graphIgnore"] = graph_ignore;

    json analysis = json::object();
    if (min_degree) analysis["minDegree"] = *min_degree;
    if (mutual_only) analysis["mutualOnly"] = *mutual_only;
    if (recency_cascade) analysis["recencyCascade"] = *recency_cascade;
    if (include_singletons) analysis["includeSingletons"] = *include_singletons;
    if (recent_window_days) analysis["recentWindowDays"] = *recent_window_days;
    if (!analysis.empty()) {
        j["analysis"] = analysis;
    }
    return j;
}

VaultConfig VaultConfig::from_json(const json& j) {
    VaultConfig config;
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }

    if (j.contains("graphIgnore")) {
        for (const auto& item : j["graphIgnore"]) {
            auto prefix = clean_prefix(item.get<std::string>());
            if (!prefix.empty()) config.graph_ignore.push_back(prefix);
        }
    }

    if (j.contains("analysis")) {
        const auto& a = j["analysis"];
        if (a.contains("minDegree")) config.min_degree = a["minDegree"].get<int>();
        if (a.contains("mutualOnly")) config.mutual_only = a["mutualOnly"].get<bool>();
        if (a.contains("recencyCascade")) config.recency_cascade = a["recencyCascade"].get<bool>();
        if (a.contains("includeSingletons")) config.include_singletons = a["includeSingletons"].get<bool>();
        if (a.contains("recentWindowDays")) config.recent_window_days = a["recentWindowDays"].get<int>();
    }
    return config;
}

bool VaultConfig::validate(std::string& error_message) const {
    if (min_degree && *min_degree < 0) {
        error_message = "minDegree must be >= 0";
        return false;
    }
    if (recent_window_days && *recent_window_days <= 0) {
        error_message = "recentWindowDays must be > 0";
        return false;
    }
    for (const auto& prefix : graph_ignore) {
        if (prefix.find("..") != std::string::npos) {
            error_message = "graphIgnore entries must stay inside the vault: " + prefix;
            return false;
        }
    }
    return true;
}

// ============================================================================
// EnvironmentConfig
// ============================================================================

EnvironmentConfig EnvironmentConfig::from_environment() {
    EnvironmentConfig config;

    const char* vault = std::getenv("VGRAPH_VAULT");
    if (vault) config.vault = vault;

    const char* snapshot = std::getenv("VGRAPH_SNAPSHOT");
    if (snapshot) config.snapshot = snapshot;

    const char* no_color = std::getenv("VGRAPH_NO_COLOR");
    if (no_color && *no_color) config.no_color = true;

    return config;
}

// ============================================================================
// Ignore list edits
// ============================================================================

bool add_graph_ignore(VaultConfig& config, const std::string& prefix) {
    auto p = clean_prefix(prefix);
    if (p.empty()) {
        throw std::runtime_error("ignore prefix cannot be empty");
    }
    if (std::find(config.graph_ignore.begin(), config.graph_ignore.end(), p) != config.graph_ignore.end()) {
        return false;
    }
    config.graph_ignore.push_back(p);
    std::sort(config.graph_ignore.begin(), config.graph_ignore.end());
    return true;
}

bool remove_graph_ignore(VaultConfig& config, const std::string& prefix) {
    auto p = clean_prefix(prefix);
    auto it = std::find(config.graph_ignore.begin(), config.graph_ignore.end(), p);
    if (it == config.graph_ignore.end()) {
        return false;
    }
    config.graph_ignore.erase(it);
    return true;
}

} // namespace vgraph

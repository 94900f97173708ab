#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace vgraph {

/**
 * @brief Per-vault settings stored in <vault>/.vgraph/config.json
 *
 * File format:
 * {
 *   "graphIgnore": ["Templates/", "Archive/old"],
 *   "analysis": {
 *     "minDegree": 2,
 *     "mutualOnly": false,
 *     "recencyCascade": true,
 *     "includeSingletons": true,
 *     "recentWindowDays": 30
 *   }
 * }
 *
 * Every analysis key is optional; unset keys fall back to built-in defaults.
 */
struct VaultConfig {
    std::vector<std::string> graph_ignore;      ///< Vault-relative prefixes skipped by the loader

    std::optional<int> min_degree;
    std::optional<bool> mutual_only;
    std::optional<bool> recency_cascade;
    std::optional<bool> include_singletons;
    std::optional<int> recent_window_days;

    /**
     * @brief Location of the config file for a vault
     */
    static std::string path_for(const std::string& vault_root);

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file yields an empty config; an unparsable one throws.
     */
    static VaultConfig from_json_file(const std::string& path);

    /**
     * @brief Load the config belonging to a vault
     */
    static VaultConfig load_for_vault(const std::string& vault_root);

    /**
     * @brief Save configuration to JSON file, creating the parent directory
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;
    static VaultConfig from_json(const nlohmann::json& j);

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Process-level defaults read from the environment
 *
 *   VGRAPH_VAULT     default vault root
 *   VGRAPH_SNAPSHOT  default snapshot file
 *   VGRAPH_NO_COLOR  disables ANSI color when set
 */
struct EnvironmentConfig {
    std::string vault;
    std::string snapshot;
    bool no_color = false;

    static EnvironmentConfig from_environment();
};

// Add/remove ignore prefixes; returns true when the list changed
bool add_graph_ignore(VaultConfig& config, const std::string& prefix);
bool remove_graph_ignore(VaultConfig& config, const std::string& prefix);

} // namespace vgraph

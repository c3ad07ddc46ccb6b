/**
 * Arena Tracker - Configuration
 *
 * Defaults live in the struct; a JSON file and then command-line flags
 * override them. Example file:
 *
 *   {
 *     "card_db_path": "data/cards.json",
 *     "trace_dir": "replays",
 *     "verbose": false,
 *     "quiet": false,
 *     "significant_action_types": ["ActionType_Cast", "ActionType_Play"]
 *   }
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>

namespace arena {

struct TrackerConfig {
    std::string card_db_path;             // Empty: no card database
    std::string trace_dir = "replays";
    bool verbose = false;
    bool quiet = false;
    std::vector<std::string> significant_action_types;

    TrackerConfig();
};

/**
 * Overlay the keys present in a parsed document. Unknown keys are ignored.
 *
 * Throws ConfigError when the document is not an object or a known key has
 * the wrong type; the config is left unchanged in that case.
 */
void apply_config_document(TrackerConfig& config, const nlohmann::json& document);

/**
 * Overlay a config file.
 *
 * Returns false (and logs) if the file cannot be opened or parsed.
 * Type errors in the file still throw ConfigError.
 */
bool apply_config_file(TrackerConfig& config, const std::string& path);

} // namespace arena

/**
 * Arena Tracker - Configuration Implementation
 */

#include "config.hpp"
#include "errors.hpp"
#include "match_export.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace arena {

namespace {

void expect(bool ok, const std::string& key, const char* expected) {
    if (!ok) {
        throw ConfigError("config key '" + key + "' must be " + expected);
    }
}

} // namespace

TrackerConfig::TrackerConfig()
    : significant_action_types(default_significant_action_types()) {}

void apply_config_document(TrackerConfig& config, const json& document) {
    if (!document.is_object()) {
        throw ConfigError("config document must be a JSON object");
    }

    // Validate into a copy so a bad key leaves the caller's config untouched
    TrackerConfig updated = config;

    for (const auto& [key, value] : document.items()) {
        if (key == "card_db_path") {
            expect(value.is_string(), key, "a string");
            updated.card_db_path = value.get<std::string>();
        } else if (key == "trace_dir") {
            expect(value.is_string(), key, "a string");
            updated.trace_dir = value.get<std::string>();
        } else if (key == "verbose") {
            expect(value.is_boolean(), key, "a boolean");
            updated.verbose = value.get<bool>();
        } else if (key == "quiet") {
            expect(value.is_boolean(), key, "a boolean");
            updated.quiet = value.get<bool>();
        } else if (key == "significant_action_types") {
            expect(value.is_array(), key, "an array of strings");
            std::vector<std::string> types;
            for (const auto& item : value) {
                expect(item.is_string(), key, "an array of strings");
                types.push_back(item.get<std::string>());
            }
            updated.significant_action_types = std::move(types);
        }
    }

    config = std::move(updated);
}

bool apply_config_file(TrackerConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << std::endl;
        return false;
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] JSON parse error: " << e.what() << std::endl;
        return false;
    }

    apply_config_document(config, document);
    return true;
}

} // namespace arena

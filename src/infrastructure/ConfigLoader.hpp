/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving render options (JSON).
 *
 * Keeps JSON handling for link rewriting and extension settings in one place
 * so hosts can share a config file instead of building ParseOptions by hand.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/ParseOptions.hpp"

namespace doctave::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads url_root, link_rewrite_rules and extensions from a JSON file.
     * @param configPath Path to the JSON file.
     * @return The options found, with defaults for anything missing. A missing
     *         or malformed file yields defaults.
     */
    static domain::ParseOptions LoadParseOptions(const std::string& configPath);

    /**
     * @brief Builds options from an already parsed JSON object.
     * @throws nlohmann::json::exception when a key holds the wrong type.
     */
    static domain::ParseOptions FromJson(const nlohmann::json& j);

    /**
     * @brief Writes the options to a JSON file, preserving other keys if possible.
     */
    static void SaveParseOptions(const std::string& configPath, const domain::ParseOptions& options);
};

} // namespace doctave::infrastructure

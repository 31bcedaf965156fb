/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace doctave::infrastructure {

using json = nlohmann::json;

domain::ParseOptions ConfigLoader::FromJson(const json& j) {
    domain::ParseOptions options;

    if (j.contains("url_root")) {
        options.urlRoot = j["url_root"].get<std::string>();
    }

    if (j.contains("link_rewrite_rules")) {
        for (const auto& rule : j["link_rewrite_rules"].items()) {
            options.linkRewriteRules[rule.key()] = rule.value().get<std::string>();
        }
    }

    if (j.contains("extensions")) {
        const auto& ext = j["extensions"];
        options.enableTables = ext.value("tables", options.enableTables);
        options.enableStrikethrough = ext.value("strikethrough", options.enableStrikethrough);
        options.enableTasklists = ext.value("tasklists", options.enableTasklists);
    }

    return options;
}

domain::ParseOptions ConfigLoader::LoadParseOptions(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return domain::ParseOptions();
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    return domain::ParseOptions();
}

void ConfigLoader::SaveParseOptions(const std::string& configPath, const domain::ParseOptions& options) {
    json j;

    // Load the existing file so unrelated keys survive.
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
            j = json::object();
        }
    }

    j["url_root"] = options.urlRoot;
    j["link_rewrite_rules"] = options.linkRewriteRules;
    j["extensions"] = {
        {"tables", options.enableTables},
        {"strikethrough", options.enableStrikethrough},
        {"tasklists", options.enableTasklists}
    };

    std::ofstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return;
    }
    f << j.dump(4);
}

} // namespace doctave::infrastructure

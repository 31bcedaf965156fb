/**
 * @file RenderResultSerializer.hpp
 * @brief JSON form of render results for hosts that ship or cache them.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/RenderResult.hpp"

namespace doctave::infrastructure {

class RenderResultSerializer {
public:
    /** @brief {"level": n, "text": "...", "id": "..."} */
    static nlohmann::json ToJson(const domain::OutlineEntry& entry);

    /** @brief {"html": "...", "outline": [...]} */
    static nlohmann::json ToJson(const domain::RenderResult& result);

    static domain::RenderResult FromJson(const nlohmann::json& j);

    /** @brief Serialized result; indent -1 means compact. */
    static std::string Dump(const domain::RenderResult& result, int indent = -1);
};

} // namespace doctave::infrastructure

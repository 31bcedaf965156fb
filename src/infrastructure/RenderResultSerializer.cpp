#include "infrastructure/RenderResultSerializer.hpp"

namespace doctave::infrastructure {

using json = nlohmann::json;

json RenderResultSerializer::ToJson(const domain::OutlineEntry& entry) {
    return json{
        {"level", entry.level},
        {"text", entry.text},
        {"id", entry.id}
    };
}

json RenderResultSerializer::ToJson(const domain::RenderResult& result) {
    json outline = json::array();
    for (const auto& entry : result.outline) {
        outline.push_back(ToJson(entry));
    }
    return json{
        {"html", result.html},
        {"outline", outline}
    };
}

domain::RenderResult RenderResultSerializer::FromJson(const json& j) {
    domain::RenderResult result;
    result.html = j.value("html", "");
    if (j.contains("outline")) {
        for (const auto& item : j["outline"]) {
            result.outline.emplace_back(
                item.value("level", 1),
                item.value("text", ""),
                item.value("id", ""));
        }
    }
    return result;
}

std::string RenderResultSerializer::Dump(const domain::RenderResult& result, int indent) {
    return ToJson(result).dump(indent);
}

} // namespace doctave::infrastructure

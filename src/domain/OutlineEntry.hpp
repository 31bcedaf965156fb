/**
 * @file OutlineEntry.hpp
 * @brief Value object describing one heading of a rendered document.
 */

#pragma once
#include <string>
#include <utility>

namespace doctave::domain {

/**
 * @struct OutlineEntry
 * @brief A heading summary used to build a table of contents.
 */
struct OutlineEntry {
    int level = 1; ///< Heading level, 1 to 6.
    std::string text; ///< Heading content with inline formatting stripped.
    std::string id; ///< Slug, also present as the heading element's id attribute.

    OutlineEntry() = default;
    OutlineEntry(int lvl, std::string txt, std::string anchor)
        : level(lvl), text(std::move(txt)), id(std::move(anchor)) {}

    bool operator==(const OutlineEntry& other) const {
        return level == other.level && text == other.text && id == other.id;
    }
    bool operator!=(const OutlineEntry& other) const { return !(*this == other); }
};

} // namespace doctave::domain

/**
 * @file RenderResult.hpp
 * @brief Output bundle of a single render pass.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/OutlineEntry.hpp"

namespace doctave::domain {

/**
 * @struct RenderResult
 * @brief HTML fragment plus the outline of every heading, in document order.
 */
struct RenderResult {
    std::string html; ///< HTML fragment (no html/body wrapper).
    std::vector<OutlineEntry> outline; ///< One entry per heading.

    bool operator==(const RenderResult& other) const {
        return html == other.html && outline == other.outline;
    }
    bool operator!=(const RenderResult& other) const { return !(*this == other); }
};

} // namespace doctave::domain

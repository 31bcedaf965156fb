/**
 * @file MermaidRewriter.hpp
 * @brief Turns ```mermaid fenced blocks into diagram containers.
 */

#pragma once

#include <string>
#include "infrastructure/MarkdownDocument.hpp"

namespace doctave::application {

/**
 * @class MermaidRewriter
 * @brief Replaces Mermaid code blocks with <div class="mermaid"> holding the
 * escaped diagram source, ready for the client-side Mermaid library.
 *
 * Other code blocks, tagged or not, are left for normal rendering.
 */
class MermaidRewriter {
public:
    static constexpr const char* kLanguageTag = "mermaid";
    static constexpr const char* kContainerOpen = "<div class=\"mermaid\">";
    static constexpr const char* kContainerClose = "</div>";

    /**
     * @brief True when the first word of the fence info string is exactly "mermaid".
     */
    static bool IsMermaid(const std::string& fenceInfo);

    /**
     * @brief Rewrites every Mermaid block in the document.
     * @return Number of blocks rewritten.
     */
    static int Apply(infrastructure::MarkdownDocument& document);
};

} // namespace doctave::application

/**
 * @file HeadingAnnotator.hpp
 * @brief Gives every heading an id and records it in the outline.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/OutlineEntry.hpp"
#include "domain/SlugRegistry.hpp"
#include "infrastructure/MarkdownDocument.hpp"

namespace doctave::application {

/**
 * @class HeadingAnnotator
 * @brief Walks all headings (including those nested in quotes and lists) in
 * document order, claims a slug for each and swaps the heading for its own
 * HTML carrying the id attribute.
 *
 * Never skips a heading: empty or symbol-only text still gets the fallback slug.
 */
class HeadingAnnotator {
public:
    explicit HeadingAnnotator(domain::SlugRegistry& registry) : m_registry(registry) {}

    /**
     * @brief Annotates the document in place.
     * @return One outline entry per heading, in document order.
     */
    std::vector<domain::OutlineEntry> annotate(infrastructure::MarkdownDocument& document);

    /**
     * @brief Literal characters of a heading (text and code spans). Line breaks
     * become single spaces; emphasis, links and raw HTML markup are dropped.
     */
    static std::string PlainText(cmark_node* heading);

    /**
     * @brief Swaps the heading for its rendered markup (already carrying the id).
     *
     * If the heading cannot be replaced (it has no parent), it is kept and an
     * empty <a id="..."> is prepended to its content, so the outline id still
     * resolves to an element.
     * @return True if the heading was replaced and freed.
     */
    static bool AttachId(cmark_node* heading, const std::string& markup, const std::string& id);

private:
    domain::SlugRegistry& m_registry;
};

} // namespace doctave::application

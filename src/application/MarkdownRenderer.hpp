/**
 * @file MarkdownRenderer.hpp
 * @brief Entry point: Markdown text in, HTML plus heading outline out.
 */

#pragma once

#include <string>
#include <utility>
#include "domain/ParseOptions.hpp"
#include "domain/RenderResult.hpp"

namespace doctave::application {

/**
 * @class MarkdownRenderer
 * @brief Runs one render pass per call: parse, rewrite links, annotate headings,
 * rewrite Mermaid blocks, serialize.
 *
 * Holds only read-only options; every call gets its own tree and slug registry,
 * so one renderer can be used from several threads. The parse step itself is
 * serialized inside MarkdownDocument.
 */
class MarkdownRenderer {
public:
    explicit MarkdownRenderer(domain::ParseOptions options = domain::ParseOptions())
        : m_options(std::move(options)) {}

    /**
     * @brief Renders a document. Never throws; any input yields a result.
     * @param input UTF-8 Markdown text.
     */
    domain::RenderResult render(const std::string& input) const;

    const domain::ParseOptions& getOptions() const { return m_options; }

private:
    domain::ParseOptions m_options;
};

/** @brief Renders with default options. */
domain::RenderResult Render(const std::string& input);

} // namespace doctave::application

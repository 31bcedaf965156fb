/**
 * @file MarkdownRenderer.cpp
 * @brief Implementation of the render pipeline.
 */

#include "application/MarkdownRenderer.hpp"
#include "application/HeadingAnnotator.hpp"
#include "application/LinkRewriter.hpp"
#include "application/MermaidRewriter.hpp"
#include "domain/SlugRegistry.hpp"
#include "infrastructure/MarkdownDocument.hpp"
#include <iostream>
#include <stdexcept>

namespace doctave::application {

domain::RenderResult MarkdownRenderer::render(const std::string& input) const {
    domain::RenderResult result;

    try {
        infrastructure::MarkdownDocument document(input, m_options);

        // Links first: headings are rendered to HTML while being annotated.
        LinkRewriter(m_options).apply(document);

        domain::SlugRegistry registry;
        HeadingAnnotator annotator(registry);
        result.outline = annotator.annotate(document);

        MermaidRewriter::Apply(document);

        result.html = document.renderHtml();
    } catch (const std::exception& e) {
        std::cerr << "[MarkdownRenderer] Render failed: " << e.what() << std::endl;
        return domain::RenderResult();
    }

    return result;
}

domain::RenderResult Render(const std::string& input) {
    return MarkdownRenderer().render(input);
}

} // namespace doctave::application

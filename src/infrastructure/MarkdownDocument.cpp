/**
 * @file MarkdownDocument.cpp
 * @brief Implementation of MarkdownDocument on top of cmark-gfm.
 */

#include "infrastructure/MarkdownDocument.hpp"
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <cmark-gfm-extension_api.h>
#include <cmark-gfm-core-extensions.h>

namespace doctave::infrastructure {

namespace {

// Raw HTML in the source is passed through; the renderer also relies on this
// to emit the annotated headings.
constexpr int CMARK_OPTIONS = CMARK_OPT_DEFAULT | CMARK_OPT_UNSAFE;

std::once_flag g_extensionsRegistered;

// cmark-gfm toggles inline extension trigger characters in a process-wide
// table while finishing a parse, so parses must not overlap.
std::mutex g_parseMutex;

void AttachExtension(cmark_parser* parser, const char* name) {
    cmark_syntax_extension* extension = cmark_find_syntax_extension(name);
    if (!extension) {
        std::cerr << "[MarkdownDocument] Syntax extension not available: " << name << std::endl;
        return;
    }
    cmark_parser_attach_syntax_extension(parser, extension);
}

} // namespace

MarkdownDocument::MarkdownDocument(const std::string& markdown, const domain::ParseOptions& options) {
    std::call_once(g_extensionsRegistered, []() { cmark_gfm_core_extensions_ensure_registered(); });

    m_parser = cmark_parser_new(CMARK_OPTIONS);
    if (!m_parser) {
        throw std::runtime_error("MarkdownDocument: could not create parser");
    }

    if (options.enableTables) AttachExtension(m_parser, "table");
    if (options.enableStrikethrough) AttachExtension(m_parser, "strikethrough");
    if (options.enableTasklists) AttachExtension(m_parser, "tasklist");

    {
        std::lock_guard<std::mutex> lock(g_parseMutex);
        cmark_parser_feed(m_parser, markdown.data(), markdown.size());
        m_root = cmark_parser_finish(m_parser);
    }

    if (!m_root) {
        cmark_parser_free(m_parser);
        m_parser = nullptr;
        throw std::runtime_error("MarkdownDocument: parser returned no document");
    }
}

MarkdownDocument::~MarkdownDocument() {
    if (m_root) cmark_node_free(m_root);
    if (m_parser) cmark_parser_free(m_parser);
}

std::vector<cmark_node*> MarkdownDocument::collect(cmark_node_type type) const {
    std::vector<cmark_node*> nodes;

    cmark_iter* iter = cmark_iter_new(m_root);
    cmark_event_type ev;
    while ((ev = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
        if (ev != CMARK_EVENT_ENTER) continue;
        cmark_node* node = cmark_iter_get_node(iter);
        if (cmark_node_get_type(node) == type) {
            nodes.push_back(node);
        }
    }
    cmark_iter_free(iter);

    return nodes;
}

std::string MarkdownDocument::renderHtml() const {
    return renderHtml(m_root);
}

std::string MarkdownDocument::renderHtml(cmark_node* node) const {
    // The extension list is owned by the parser and is needed for table and
    // strikethrough output.
    char* html = cmark_render_html(node, CMARK_OPTIONS, cmark_parser_get_syntax_extensions(m_parser));
    if (!html) return "";

    std::string result(html);
    free(html);
    return result;
}

} // namespace doctave::infrastructure

/**
 * @file MarkdownDocument.hpp
 * @brief RAII owner of one cmark-gfm parse (parser, extensions and syntax tree).
 */

#pragma once

#include <string>
#include <vector>
#include <cmark-gfm.h>
#include "domain/ParseOptions.hpp"

namespace doctave::infrastructure {

/**
 * @class MarkdownDocument
 * @brief Parses Markdown into a CommonMark tree and renders it back to HTML.
 *
 * The tree belongs to this object. Callers may mutate nodes through the raw
 * cmark API, but should collect the nodes they need first and mutate afterwards,
 * never while an iterator is walking the tree.
 */
class MarkdownDocument {
public:
    /**
     * @brief Parses the given UTF-8 text.
     * @param markdown Raw document text.
     * @param options Selects the GitHub-flavoured extensions to attach.
     * @throws std::runtime_error if the parser cannot be created or returns no tree.
     */
    MarkdownDocument(const std::string& markdown, const domain::ParseOptions& options);
    ~MarkdownDocument();

    MarkdownDocument(const MarkdownDocument&) = delete;
    MarkdownDocument& operator=(const MarkdownDocument&) = delete;

    /** @brief Document node of the tree. */
    cmark_node* root() const { return m_root; }

    /**
     * @brief Returns every node of the given type in document (pre-)order.
     */
    std::vector<cmark_node*> collect(cmark_node_type type) const;

    /** @brief Renders the whole document as an HTML fragment. */
    std::string renderHtml() const;

    /** @brief Renders a single subtree, e.g. one heading. */
    std::string renderHtml(cmark_node* node) const;

private:
    cmark_parser* m_parser = nullptr;
    cmark_node* m_root = nullptr;
};

} // namespace doctave::infrastructure

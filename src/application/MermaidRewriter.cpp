#include "application/MermaidRewriter.hpp"
#include <iostream>

namespace doctave::application {

bool MermaidRewriter::IsMermaid(const std::string& fenceInfo) {
    std::string language = fenceInfo.substr(0, fenceInfo.find_first_of(" \t"));
    return language == kLanguageTag;
}

int MermaidRewriter::Apply(infrastructure::MarkdownDocument& document) {
    int rewritten = 0;

    for (cmark_node* block : document.collect(CMARK_NODE_CODE_BLOCK)) {
        int fenceLength = 0, fenceOffset = 0;
        char fenceChar = 0;
        if (!cmark_node_get_fenced(block, &fenceLength, &fenceOffset, &fenceChar)) continue;

        const char* info = cmark_node_get_fence_info(block);
        if (!info || !IsMermaid(info)) continue;

        const char* body = cmark_node_get_literal(block);

        // The body goes into a text node so the HTML renderer escapes it.
        cmark_node* container = cmark_node_new(CMARK_NODE_CUSTOM_BLOCK);
        cmark_node_set_on_enter(container, kContainerOpen);
        cmark_node_set_on_exit(container, kContainerClose);

        cmark_node* source = cmark_node_new(CMARK_NODE_TEXT);
        cmark_node_set_literal(source, body ? body : "");
        cmark_node_append_child(container, source);

        if (!cmark_node_replace(block, container)) {
            std::cerr << "[MermaidRewriter] Could not replace code block" << std::endl;
            cmark_node_free(container);
            continue;
        }
        cmark_node_free(block);
        ++rewritten;
    }

    return rewritten;
}

} // namespace doctave::application

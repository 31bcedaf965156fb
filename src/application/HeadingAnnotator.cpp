#include "application/HeadingAnnotator.hpp"
#include <iostream>

namespace doctave::application {

namespace {

// "<h2>Title</h2>\n" -> "<h2 id=\"slug\">Title</h2>\n"
std::string WithIdAttribute(std::string markup, const std::string& id) {
    size_t tagEnd = markup.find('>');
    if (tagEnd == std::string::npos) return markup;
    markup.insert(tagEnd, " id=\"" + id + "\"");
    return markup;
}

} // namespace

std::string HeadingAnnotator::PlainText(cmark_node* heading) {
    std::string text;

    cmark_iter* iter = cmark_iter_new(heading);
    cmark_event_type ev;
    while ((ev = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
        if (ev != CMARK_EVENT_ENTER) continue;

        cmark_node* node = cmark_iter_get_node(iter);
        switch (cmark_node_get_type(node)) {
            case CMARK_NODE_TEXT:
            case CMARK_NODE_CODE: {
                const char* literal = cmark_node_get_literal(node);
                if (literal) text += literal;
                break;
            }
            case CMARK_NODE_SOFTBREAK:
            case CMARK_NODE_LINEBREAK:
                text += ' ';
                break;
            default:
                break;
        }
    }
    cmark_iter_free(iter);

    return text;
}

bool HeadingAnnotator::AttachId(cmark_node* heading, const std::string& markup, const std::string& id) {
    cmark_node* annotated = cmark_node_new(CMARK_NODE_HTML_BLOCK);
    cmark_node_set_literal(annotated, markup.c_str());
    if (cmark_node_replace(heading, annotated)) {
        cmark_node_free(heading);
        return true;
    }
    cmark_node_free(annotated);

    // Heading stays in place; an empty anchor still carries the id.
    std::cerr << "[HeadingAnnotator] Could not replace heading, adding anchor: " << id << std::endl;
    std::string anchorMarkup = "<a id=\"" + id + "\"></a>";
    cmark_node* anchor = cmark_node_new(CMARK_NODE_HTML_INLINE);
    cmark_node_set_literal(anchor, anchorMarkup.c_str());
    cmark_node_prepend_child(heading, anchor);
    return false;
}

std::vector<domain::OutlineEntry> HeadingAnnotator::annotate(infrastructure::MarkdownDocument& document) {
    std::vector<domain::OutlineEntry> outline;

    // Collect first; the loop below replaces nodes.
    for (cmark_node* heading : document.collect(CMARK_NODE_HEADING)) {
        domain::OutlineEntry entry;
        entry.level = cmark_node_get_heading_level(heading);
        entry.text = PlainText(heading);
        entry.id = m_registry.claim(entry.text);

        AttachId(heading, WithIdAttribute(document.renderHtml(heading), entry.id), entry.id);
        outline.push_back(std::move(entry));
    }

    return outline;
}

} // namespace doctave::application

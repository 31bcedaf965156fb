#include "application/LinkRewriter.hpp"
#include <filesystem>
#include <initializer_list>

namespace doctave::application {

std::string LinkRewriter::rewrite(const std::string& url) const {
    auto rule = m_options.linkRewriteRules.find(url);
    if (rule != m_options.linkRewriteRules.end()) {
        return rule->second;
    }

    if (!url.empty() && url.front() == '/') {
        std::filesystem::path rooted = std::filesystem::path(m_options.urlRoot) / url.substr(1);
        return rooted.generic_string();
    }

    return url;
}

int LinkRewriter::apply(infrastructure::MarkdownDocument& document) const {
    int changed = 0;

    for (cmark_node_type type : {CMARK_NODE_LINK, CMARK_NODE_IMAGE}) {
        for (cmark_node* node : document.collect(type)) {
            const char* current = cmark_node_get_url(node);
            std::string url = current ? current : "";
            std::string rewritten = rewrite(url);
            if (rewritten != url) {
                cmark_node_set_url(node, rewritten.c_str());
                ++changed;
            }
        }
    }

    return changed;
}

} // namespace doctave::application

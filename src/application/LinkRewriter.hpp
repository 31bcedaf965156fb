/**
 * @file LinkRewriter.hpp
 * @brief Rewrites link and image targets according to ParseOptions.
 */

#pragma once

#include <string>
#include <utility>
#include "domain/ParseOptions.hpp"
#include "infrastructure/MarkdownDocument.hpp"

namespace doctave::application {

/**
 * @class LinkRewriter
 * @brief Applies explicit rewrite rules, then re-roots absolute paths.
 *
 * Relative and external URLs are left alone.
 */
class LinkRewriter {
public:
    explicit LinkRewriter(domain::ParseOptions options) : m_options(std::move(options)) {}

    /** @brief Returns the rewritten form of a single URL. */
    std::string rewrite(const std::string& url) const;

    /**
     * @brief Rewrites every link and image in the document.
     * @return Number of URLs that changed.
     */
    int apply(infrastructure::MarkdownDocument& document) const;

private:
    domain::ParseOptions m_options;
};

} // namespace doctave::application

/**
 * @file ParseOptions.hpp
 * @brief Caller-supplied knobs for a render pass.
 */

#pragma once
#include <map>
#include <string>

namespace doctave::domain {

/**
 * @struct ParseOptions
 * @brief Link rewriting rules and the GitHub-flavoured extensions to enable.
 *
 * Read-only during a render, so one instance may back concurrent renders.
 */
struct ParseOptions {
    /// Root prepended to absolute links and images ("/foo" -> urlRoot + "foo").
    std::string urlRoot = "/";
    /// Exact URL replacements. Checked before the root rewrite.
    std::map<std::string, std::string> linkRewriteRules;

    bool enableTables = true;
    bool enableStrikethrough = true;
    bool enableTasklists = true;
};

} // namespace doctave::domain

/**
 * @file SlugRegistry.hpp
 * @brief Turns heading text into unique, URL-safe identifiers.
 */

#pragma once
#include <string>
#include <unordered_map>

namespace doctave::domain {

/**
 * @class SlugRegistry
 * @brief Slug generator plus the set of slugs already handed out in one render.
 *
 * A registry lives for exactly one render call. Slugs must be claimed in document
 * order for the output to be deterministic.
 */
class SlugRegistry {
public:
    /// Used when the heading text has no letters or digits left after normalization.
    static constexpr const char* kFallbackSlug = "section";

    /**
     * @brief Keeps ASCII letters, digits, hyphens and whitespace, lowercases letters
     * and turns each whitespace run into a single hyphen. Leading and trailing
     * whitespace is dropped. Returns kFallbackSlug when nothing survives.
     */
    static std::string Normalize(const std::string& text);

    /**
     * @brief Normalizes the text and returns a slug not handed out before.
     *
     * The first claim of a slug returns it unchanged; later claims return
     * "slug-1", "slug-2", ... skipping any suffixed form already taken.
     */
    std::string claim(const std::string& text);

    bool contains(const std::string& slug) const;
    size_t size() const { return m_counters.size(); }

private:
    std::unordered_map<std::string, int> m_counters; ///< Slug -> last suffix used.
};

} // namespace doctave::domain

#include "domain/SlugRegistry.hpp"

namespace doctave::domain {

namespace {

bool IsAsciiAlnum(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool IsAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

char ToLowerAscii(unsigned char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

} // namespace

std::string SlugRegistry::Normalize(const std::string& text) {
    std::string slug;
    slug.reserve(text.size());
    bool pendingSeparator = false;

    for (unsigned char c : text) {
        if (IsAsciiSpace(c)) {
            pendingSeparator = true;
            continue;
        }
        if (!IsAsciiAlnum(c) && c != '-') continue;

        if (pendingSeparator && !slug.empty()) slug += '-';
        pendingSeparator = false;
        slug += ToLowerAscii(c);
    }

    if (slug.empty()) return kFallbackSlug;
    return slug;
}

std::string SlugRegistry::claim(const std::string& text) {
    std::string candidate = Normalize(text);

    auto it = m_counters.find(candidate);
    if (it == m_counters.end()) {
        m_counters.emplace(candidate, 0);
        return candidate;
    }

    int suffix = it->second;
    std::string slug;
    do {
        ++suffix;
        slug = candidate + "-" + std::to_string(suffix);
    } while (m_counters.count(slug) > 0);

    // Update before emplace: a rehash would invalidate `it`.
    it->second = suffix;
    m_counters.emplace(slug, 0);
    return slug;
}

bool SlugRegistry::contains(const std::string& slug) const {
    return m_counters.find(slug) != m_counters.end();
}

} // namespace doctave::domain

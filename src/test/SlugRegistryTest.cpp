#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "domain/SlugRegistry.hpp"

using doctave::domain::SlugRegistry;

static void testNormalize() {
    assert(SlugRegistry::Normalize("Getting Started") == "getting-started");
    assert(SlugRegistry::Normalize("  Hello,   World!  ") == "hello-world");
    assert(SlugRegistry::Normalize("C++ & Rust") == "c-rust");
    assert(SlugRegistry::Normalize("already-hyphenated") == "already-hyphenated");
    assert(SlugRegistry::Normalize("Tabs\tand\nnewlines") == "tabs-and-newlines");
    assert(SlugRegistry::Normalize("Version 2.0") == "version-20");
    // Non-ASCII bytes are dropped.
    assert(SlugRegistry::Normalize("\xC3\x9C" "ber cool") == "ber-cool");
    std::cout << "[PASS] Normalize." << std::endl;
}

static void testFallback() {
    assert(SlugRegistry::Normalize("") == SlugRegistry::kFallbackSlug);
    assert(SlugRegistry::Normalize("   ") == "section");
    assert(SlugRegistry::Normalize("!!! ???") == "section");
    assert(SlugRegistry::Normalize("\xF0\x9F\x8E\x89") == "section"); // emoji

    SlugRegistry registry;
    assert(registry.claim("\xF0\x9F\x8E\x89") == "section");
    assert(registry.claim("***") == "section-1");
    std::cout << "[PASS] Fallback slug." << std::endl;
}

static void testDisambiguation() {
    SlugRegistry registry;
    assert(registry.claim("Intro") == "intro");
    assert(registry.claim("Intro") == "intro-1");
    assert(registry.claim("intro") == "intro-2");
    // Different text, same normalized value: collides the same way.
    assert(registry.claim("INTRO!") == "intro-3");
    assert(registry.claim("Other") == "other");
    assert(registry.contains("intro-2"));
    assert(!registry.contains("other-1"));
    std::cout << "[PASS] Disambiguation." << std::endl;
}

static void testSuffixCollisions() {
    SlugRegistry registry;
    std::set<std::string> seen;
    const char* headings[] = {"Intro", "Intro", "Intro 1", "intro-1", "Intro 1", "Intro"};
    for (const char* text : headings) {
        std::string slug = registry.claim(text);
        assert(seen.insert(slug).second && "slug handed out twice");
    }
    assert(seen.count("intro") == 1);
    assert(seen.count("intro-1") == 1);

    SlugRegistry reversed;
    assert(reversed.claim("Intro 1") == "intro-1");
    assert(reversed.claim("Intro") == "intro");
    assert(reversed.claim("Intro") == "intro-2");
    std::cout << "[PASS] Suffix collisions stay unique." << std::endl;
}

static void testFreshRegistryIsIndependent() {
    SlugRegistry first;
    first.claim("Overview");
    SlugRegistry second;
    assert(second.claim("Overview") == "overview");
    assert(second.size() == 1);
    std::cout << "[PASS] Registries are independent." << std::endl;
}

int main() {
    std::cout << "[Test] Starting SlugRegistry Test..." << std::endl;
    testNormalize();
    testFallback();
    testDisambiguation();
    testSuffixCollisions();
    testFreshRegistryIsIndependent();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

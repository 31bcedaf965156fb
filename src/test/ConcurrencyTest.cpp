#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "application/MarkdownRenderer.hpp"

using doctave::application::MarkdownRenderer;
using doctave::domain::RenderResult;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    const std::string document =
        "# Overview\n"
        "\n"
        "Intro with a [link](/guide) and ~~struck~~ text.\n"
        "\n"
        "## Overview\n"
        "\n"
        "> ## Quoted\n"
        "\n"
        "```mermaid\n"
        "graph TD; A-->B;\n"
        "```\n"
        "\n"
        "| a | b |\n"
        "|---|---|\n"
        "| 1 | 2 |\n";

    doctave::domain::ParseOptions options;
    options.urlRoot = "/root";
    // One renderer shared by all threads.
    const MarkdownRenderer renderer(options);
    const RenderResult baseline = renderer.render(document);
    assert(baseline.outline.size() == 3);
    assert(baseline.html.find("<del>struck</del>") != std::string::npos);

    const int NUM_THREADS = 8;
    const int RENDERS_PER_THREAD = 50;
    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    std::atomic<int> completed{0};
    std::atomic<int> missingStrikethrough{0};

    std::cout << "[Test] Spawning " << NUM_THREADS << " threads rendering concurrently..." << std::endl;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            for (int n = 0; n < RENDERS_PER_THREAD; ++n) {
                RenderResult result = renderer.render(document);
                if (result != baseline) mismatches++;
                if (result.html.find("<del>struck</del>") == std::string::npos) missingStrikethrough++;
                completed++;
            }
        });
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    std::cout << "[Test] Renders completed: " << completed.load() << std::endl;
    assert(completed.load() == NUM_THREADS * RENDERS_PER_THREAD);

    if (missingStrikethrough.load() != 0) {
        std::cout << "[FAIL] " << missingStrikethrough.load() << " renders lost the strikethrough." << std::endl;
        return 1;
    }

    if (mismatches.load() != 0) {
        std::cout << "[FAIL] " << mismatches.load() << " renders differed from the baseline." << std::endl;
        return 1;
    }

    std::cout << "[PASS] All concurrent renders matched the baseline." << std::endl;
    return 0;
}

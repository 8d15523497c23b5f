// filename: engine_benchmark.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/scrollfx.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::vector<int> entityCounts{1, 12, 64, 256, 1024};
    std::size_t frames{2000};
    double fps{60.0};
    double budgetMs{1.0};
};

void printUsage() {
    std::cout << "engine_benchmark options:\n"
              << "  --frames <int>         Ticks per engine (default 2000)\n"
              << "  --fps <float>          Synthetic display rate (default 60)\n"
              << "  --entities <int>       Benchmark a single entity count\n"
              << "  --budget-ms <float>    Per-tick budget used for the exit status (default 1)\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--frames" && i + 1 < argc) {
                cfg.frames = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--fps" && i + 1 < argc) {
                cfg.fps = std::stod(argv[++i]);
            } else if (arg == "--entities" && i + 1 < argc) {
                cfg.entityCounts = {std::stoi(argv[++i])};
            } else if (arg == "--budget-ms" && i + 1 < argc) {
                cfg.budgetMs = std::stod(argv[++i]);
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                printUsage();
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Invalid value for " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    if (cfg.frames == 0 || !(cfg.fps > 0.0)) {
        std::cerr << "--frames and --fps must be positive\n";
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg;
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }

    const std::vector<double> script = scrollfx::sweepProgress(cfg.frames);
    const double frameMs = 1000.0 / cfg.fps;
    bool overBudget = false;

    std::cout << std::fixed << std::setprecision(4);
    for (int entities : cfg.entityCounts) {
        scrollfx::EngineConfig config = scrollfx::defaultEngineConfig();
        config.entityCount = entities;
        config.seed = 1234U;

        scrollfx::ManualFrameScheduler scheduler;
        std::vector<double> tickMs;
        tickMs.reserve(cfg.frames);
        try {
            scrollfx::Engine engine(config, scheduler);
            engine.start();
            for (std::size_t frame = 0; frame < cfg.frames; ++frame) {
                engine.pushProgress(script[frame]);
                const auto start = std::chrono::steady_clock::now();
                scheduler.advanceTo(static_cast<double>(frame) * frameMs);
                const auto end = std::chrono::steady_clock::now();
                tickMs.push_back(std::chrono::duration<double, std::milli>(end - start).count());
            }
            engine.stop();
        } catch (const std::exception& ex) {
            std::cerr << "Benchmark failed for " << entities << " entities: " << ex.what() << "\n";
            return 1;
        }

        const double avgMs =
            std::accumulate(tickMs.begin(), tickMs.end(), 0.0) / static_cast<double>(tickMs.size());
        const double maxMs = *std::max_element(tickMs.begin(), tickMs.end());
        std::cout << "Entities: " << std::setw(5) << entities << "  mean tick " << avgMs
                  << " ms, max tick " << maxMs << " ms\n";
        if (avgMs > cfg.budgetMs) {
            overBudget = true;
        }
    }

    return overBudget ? 2 : 0;
}

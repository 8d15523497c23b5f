#include "scrollfx/color.hpp"
#include "scrollfx/engine.hpp"
#include "scrollfx/frame_clock.hpp"
#include "scrollfx/ingest.hpp"
#include "scrollfx/io_csv.hpp"
#include "scrollfx/io_json.hpp"
#include "scrollfx/progress.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: scroll_engine [--config PATH] [--fps HZ] [--frames N] [--sweep]"
                 " [--csv PATH] [--json PATH] [--realtime] [--quiet]\n";
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

double progressAt(const std::vector<double>& script, std::size_t frame) {
    if (script.empty()) {
        return 0.0;
    }
    return script[std::min(frame, script.size() - 1)];
}

}  // namespace

int main(int argc, char** argv) {
    using namespace scrollfx;

    std::optional<std::string> configPath;
    std::optional<std::string> csvPath;
    std::optional<std::string> jsonPath;
    std::optional<std::size_t> framesOverride;
    double fps = 60.0;
    bool sweep = false;
    bool realtime = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path argument\n";
                printUsage();
                return 1;
            }
            configPath = std::string(argv[++i]);
        } else if (arg == "--fps") {
            if (i + 1 >= argc) {
                std::cerr << "--fps requires a floating-point argument\n";
                printUsage();
                return 1;
            }
            double value = 0.0;
            try {
                value = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--fps requires a valid floating-point argument\n";
                return 1;
            }
            if (!(value > 0.0) || !std::isfinite(value)) {
                std::cerr << "--fps must be positive\n";
                return 1;
            }
            fps = value;
        } else if (arg == "--frames") {
            if (i + 1 >= argc) {
                std::cerr << "--frames requires an integer argument\n";
                printUsage();
                return 1;
            }
            long value = 0;
            try {
                value = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--frames requires a valid integer argument\n";
                return 1;
            }
            if (value <= 0) {
                std::cerr << "--frames must be positive\n";
                return 1;
            }
            framesOverride = static_cast<std::size_t>(value);
        } else if (arg == "--sweep") {
            sweep = true;
        } else if (arg == "--csv") {
            if (i + 1 >= argc) {
                std::cerr << "--csv requires a path argument\n";
                printUsage();
                return 1;
            }
            csvPath = std::string(argv[++i]);
        } else if (arg == "--json") {
            if (i + 1 >= argc) {
                std::cerr << "--json requires a path argument\n";
                printUsage();
                return 1;
            }
            jsonPath = std::string(argv[++i]);
        } else if (arg == "--realtime") {
            realtime = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    EngineScenario scenario{};
    if (configPath) {
        try {
            scenario = loadScenarioFromJson(*configPath);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to load scenario: " << ex.what() << "\n";
            return 1;
        }
    } else {
        scenario.version = "0.1";
        scenario.engine = defaultEngineConfig();
    }

    std::vector<double> script;
    if (!scenario.timeline.empty()) {
        script = expandScrollTimeline(scenario.timeline, fps);
    }
    if (script.empty() && sweep) {
        script = sweepProgress(framesOverride.value_or(static_cast<std::size_t>(std::lround(4.0 * fps))));
    }
    const std::size_t frameCount =
        framesOverride.value_or(script.empty() ? static_cast<std::size_t>(std::lround(2.0 * fps))
                                               : script.size());

    std::vector<EngineSnapshot> series;
    series.reserve(frameCount + 1);
    ProgressSignal scroll(progressAt(script, 0));
    double measuredFps = 0.0;

    try {
        if (realtime) {
            SteadyFrameScheduler scheduler(fps);
            Engine engine(scenario.engine, scheduler);
            engine.attach(scroll);
            series.push_back(*engine.snapshot());
            engine.subscribe([&](const EngineSnapshot& snapshot) {
                series.push_back(snapshot);
                if (series.size() > frameCount) {
                    engine.stop();
                    return;
                }
                scroll.set(progressAt(script, series.size() - 1));
            });
            engine.pushProgress(scroll.get());
            engine.start();
            scheduler.runFor(std::chrono::duration<double>(static_cast<double>(frameCount) / fps + 1.0));
            measuredFps = engine.clock().measuredFps();
            engine.stop();
        } else {
            ManualFrameScheduler scheduler;
            Engine engine(scenario.engine, scheduler);
            engine.attach(scroll);
            series.push_back(*engine.snapshot());
            engine.subscribe([&](const EngineSnapshot& snapshot) { series.push_back(snapshot); });
            engine.pushProgress(scroll.get());
            engine.start();
            const double frameMs = 1000.0 / fps;
            for (std::size_t frame = 0; frame < frameCount; ++frame) {
                scroll.set(progressAt(script, frame));
                scheduler.advanceTo(static_cast<double>(frame) * frameMs);
            }
            measuredFps = engine.clock().measuredFps();
            engine.stop();
        }
    } catch (const std::exception& ex) {
        std::cerr << "Engine failed: " << ex.what() << "\n";
        return 1;
    }

    const EngineSnapshot& last = series.back();
    if (!quiet) {
        std::cout << "scroll_engine: " << series.size() - 1 << " frames, " << last.rotationCount()
                  << " entities, final progress=" << last.progress << ", y=" << last.yOffset
                  << ", colours " << formatHslCss(last.colorPair[0]) << " -> "
                  << formatHslCss(last.colorPair[1]);
        if (measuredFps > 0.0) {
            std::cout << ", measured " << measuredFps << " fps";
        }
        std::cout << '\n';
    }

    bool outputFailure = false;
    if (csvPath) {
        try {
            ensureParentDirectory(*csvPath);
            write_csv_snapshot_series(*csvPath, series);
            if (!quiet) {
                std::cout << "Wrote " << series.size() << " snapshots to " << *csvPath << '\n';
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write CSV series: " << ex.what() << '\n';
            outputFailure = true;
        }
    }
    if (jsonPath) {
        try {
            ensureParentDirectory(*jsonPath);
            write_json_snapshot(*jsonPath, last);
            if (!quiet) {
                std::cout << "Wrote final snapshot to " << *jsonPath << '\n';
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write JSON snapshot: " << ex.what() << '\n';
            outputFailure = true;
        }
    }

    return outputFailure ? 1 : 0;
}

// filename: ingest.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "scrollfx/engine.hpp"

namespace scrollfx {

enum class QualityTier { Low, Medium, High };

struct QualityPreset {
    int entityCount{12};
    double frameRateCap{60.0};
};

[[nodiscard]] QualityPreset qualityPreset(QualityTier tier);

[[nodiscard]] QualityTier parseQualityTier(const std::string& value);

struct ScrollKeyframe {
    double time{0.0};  // seconds
    double progress{0.0};
};

/**
 * @brief Scripted scroll trajectory, linear between keyframes and held after the last.
 */
struct ScrollTimeline {
    std::vector<ScrollKeyframe> keyframes;

    [[nodiscard]] bool empty() const { return keyframes.empty(); }
    [[nodiscard]] double duration() const;
    [[nodiscard]] double sample(double timeSeconds) const;
};

struct EngineScenario {
    std::string version;
    EngineConfig engine;
    ScrollTimeline timeline;
};

/**
 * @throws ConfigurationError for unreadable files, malformed JSON or invalid fields.
 */
EngineScenario loadScenarioFromJson(const std::string& path);

EngineScenario parseScenarioJson(const std::string& text);

/**
 * @brief Progress value for every frame at @p fps, covering the timeline duration.
 */
std::vector<double> expandScrollTimeline(const ScrollTimeline& timeline, double fps);

/// Back-and-forth sweep 0 -> 1 -> 0 over @p frames frames.
std::vector<double> sweepProgress(std::size_t frames);

}  // namespace scrollfx

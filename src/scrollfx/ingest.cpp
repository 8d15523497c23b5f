#include "scrollfx/ingest.hpp"

#include "scrollfx/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace scrollfx {
namespace {

double requireFinite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw ConfigurationError(field + " must be a finite number");
    }
    return value;
}

double requireUnitInterval(const std::string& field, double value) {
    requireFinite(field, value);
    if (value < 0.0 || value > 1.0) {
        throw ConfigurationError(field + " must lie in [0, 1]");
    }
    return value;
}

SpeedResponse parseSpeedResponse(const std::string& value) {
    if (value == "steer") {
        return SpeedResponse::Steer;
    }
    if (value == "impulse") {
        return SpeedResponse::Impulse;
    }
    throw ConfigurationError("Unsupported speed.response: " + value);
}

HSLColor parseColor(const nlohmann::json& node, const std::string& field) {
    if (!node.is_object()) {
        throw ConfigurationError(field + " must be an object with h, s and l");
    }
    HSLColor color{};
    color.h = requireFinite(field + ".h", node.at("h").get<double>());
    color.s = requireFinite(field + ".s", node.at("s").get<double>());
    color.l = requireFinite(field + ".l", node.at("l").get<double>());
    return color;
}

std::vector<ColorPair> parseColorStops(const nlohmann::json& node) {
    if (!node.is_array()) {
        throw ConfigurationError("colorStops must be an array of colour pairs");
    }
    if (node.empty()) {
        throw ConfigurationError("colorStops must contain at least one colour pair");
    }
    std::vector<ColorPair> stops;
    stops.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto& pair = node.at(i);
        const std::string field = "colorStops[" + std::to_string(i) + "]";
        if (!pair.is_array() || pair.size() != 2) {
            throw ConfigurationError(field + " must hold exactly two colours");
        }
        stops.push_back({parseColor(pair.at(0), field + "[0]"), parseColor(pair.at(1), field + "[1]")});
    }
    return stops;
}

ScrollTimeline parseTimeline(const nlohmann::json& node) {
    if (!node.is_array()) {
        throw ConfigurationError("timeline must be an array of keyframes");
    }
    ScrollTimeline timeline;
    timeline.keyframes.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto& entry = node.at(i);
        const std::string field = "timeline[" + std::to_string(i) + "]";
        ScrollKeyframe keyframe{};
        keyframe.time = requireFinite(field + ".time", entry.at("time").get<double>());
        keyframe.progress = requireUnitInterval(field + ".progress", entry.at("progress").get<double>());
        if (keyframe.time < 0.0) {
            throw ConfigurationError(field + ".time must be non-negative");
        }
        if (!timeline.keyframes.empty() && !(keyframe.time > timeline.keyframes.back().time)) {
            throw ConfigurationError(field + ".time must be strictly increasing");
        }
        timeline.keyframes.push_back(keyframe);
    }
    return timeline;
}

EngineScenario parseScenario(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigurationError("Scenario JSON must be an object");
    }

    EngineScenario scenario{};
    scenario.version = json.value("version", std::string{});
    if (scenario.version.empty()) {
        throw ConfigurationError("Scenario JSON missing required field: version");
    }
    if (scenario.version != "0.1") {
        throw ConfigurationError("Unsupported scenario version: " + scenario.version);
    }

    EngineConfig& config = scenario.engine;
    config = defaultEngineConfig();

    if (json.contains("quality")) {
        const QualityPreset preset = qualityPreset(parseQualityTier(json.at("quality").get<std::string>()));
        config.entityCount = preset.entityCount;
        config.clock.frameRateCap = preset.frameRateCap;
    }
    if (json.contains("entityCount")) {
        const auto& count = json.at("entityCount");
        if (!count.is_number_integer()) {
            throw ConfigurationError("entityCount must be an integer");
        }
        const auto value = count.get<std::int64_t>();
        if (value <= 0 || value > std::numeric_limits<int>::max()) {
            throw ConfigurationError("entityCount must be a positive integer");
        }
        config.entityCount = static_cast<int>(value);
    }
    if (json.contains("seed")) {
        const auto& seed = json.at("seed");
        if (!seed.is_number_unsigned() || seed.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            throw ConfigurationError("seed must be an unsigned 32-bit integer");
        }
        config.seed = static_cast<std::uint32_t>(seed.get<std::uint64_t>());
    }
    if (json.contains("colorStops")) {
        config.colorStops = parseColorStops(json.at("colorStops"));
    }

    if (json.contains("spring")) {
        const auto& spring = json.at("spring");
        config.spring.stiffness = spring.value("stiffness", config.spring.stiffness);
        config.spring.damping = spring.value("damping", config.spring.damping);
        config.spring.mass = spring.value("mass", config.spring.mass);
        config.springStepFraction = spring.value("stepFraction", config.springStepFraction);
    }

    if (json.contains("position")) {
        const auto& position = json.at("position");
        config.position.base = position.value("base", config.position.base);
        config.position.range = position.value("range", config.position.range);
        config.xOffset = position.value("x", config.xOffset);
    }

    if (json.contains("speed")) {
        const auto& speed = json.at("speed");
        SpeedConfig& out = config.speed;
        out.min = speed.value("min", out.min);
        out.max = speed.value("max", out.max);
        out.multiplier = speed.value("multiplier", out.multiplier);
        out.baseRotationSpeed = speed.value("rotationSpeed", out.baseRotationSpeed);
        out.positionExponent = speed.value("exponent", out.positionExponent);
        out.minRotationSpeed = speed.value("minRotationSpeed", out.minRotationSpeed);
        out.dampingConstant = speed.value("dampingConstant", out.dampingConstant);
        if (speed.contains("response")) {
            out.response = parseSpeedResponse(speed.at("response").get<std::string>());
        }
    }

    if (json.contains("clock")) {
        const auto& clock = json.at("clock");
        config.clock.maxDeltaSeconds = clock.value("maxDeltaSeconds", config.clock.maxDeltaSeconds);
        config.clock.frameRateCap = clock.value("frameRateCap", config.clock.frameRateCap);
    }

    if (json.contains("timeline")) {
        scenario.timeline = parseTimeline(json.at("timeline"));
    }

    validateEngineConfig(config);
    return scenario;
}

}  // namespace

QualityPreset qualityPreset(QualityTier tier) {
    switch (tier) {
    case QualityTier::Low:
        return {6, 20.0};
    case QualityTier::Medium:
        return {9, 30.0};
    case QualityTier::High:
        return {12, 60.0};
    }
    return {};
}

QualityTier parseQualityTier(const std::string& value) {
    if (value == "low") {
        return QualityTier::Low;
    }
    if (value == "medium") {
        return QualityTier::Medium;
    }
    if (value == "high") {
        return QualityTier::High;
    }
    throw ConfigurationError("Unsupported quality tier: " + value);
}

double ScrollTimeline::duration() const {
    return keyframes.empty() ? 0.0 : keyframes.back().time;
}

double ScrollTimeline::sample(double timeSeconds) const {
    if (keyframes.empty()) {
        return 0.0;
    }
    if (!(timeSeconds > keyframes.front().time)) {
        return keyframes.front().progress;
    }
    if (timeSeconds >= keyframes.back().time) {
        return keyframes.back().progress;
    }
    const auto upper = std::upper_bound(
        keyframes.begin(), keyframes.end(), timeSeconds,
        [](double t, const ScrollKeyframe& keyframe) { return t < keyframe.time; });
    const auto lower = upper - 1;
    const double span = upper->time - lower->time;
    const double t = (timeSeconds - lower->time) / span;
    return lower->progress + (upper->progress - lower->progress) * t;
}

EngineScenario loadScenarioFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigurationError("Failed to open scenario JSON: " + path);
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parseScenarioJson(buffer.str());
}

EngineScenario parseScenarioJson(const std::string& text) {
    try {
        return parseScenario(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigurationError(std::string("Malformed scenario JSON: ") + ex.what());
    }
}

std::vector<double> expandScrollTimeline(const ScrollTimeline& timeline, double fps) {
    if (!(fps > 0.0) || !std::isfinite(fps)) {
        throw ConfigurationError("expandScrollTimeline: fps must be positive");
    }
    if (timeline.empty()) {
        return {};
    }
    const auto frames = static_cast<std::size_t>(std::floor(timeline.duration() * fps)) + 1;
    std::vector<double> progress;
    progress.reserve(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        progress.push_back(timeline.sample(static_cast<double>(i) / fps));
    }
    return progress;
}

std::vector<double> sweepProgress(std::size_t frames) {
    std::vector<double> progress;
    progress.reserve(frames);
    if (frames < 2) {
        progress.assign(frames, 0.0);
        return progress;
    }
    const double last = static_cast<double>(frames - 1);
    for (std::size_t i = 0; i < frames; ++i) {
        const double phase = static_cast<double>(i) / last;
        progress.push_back(1.0 - std::abs(2.0 * phase - 1.0));
    }
    return progress;
}

}  // namespace scrollfx

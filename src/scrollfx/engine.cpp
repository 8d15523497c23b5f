#include "scrollfx/engine.hpp"

#include "scrollfx/color.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace scrollfx {

namespace {

void requireFiniteColor(const HSLColor& color, std::size_t stopIndex) {
    if (!std::isfinite(color.h) || !std::isfinite(color.s) || !std::isfinite(color.l)) {
        throw ConfigurationError("colorStops[" + std::to_string(stopIndex) +
                                 "] contains a non-finite component");
    }
    if (color.s < 0.0 || color.s > 100.0 || color.l < 0.0 || color.l > 100.0) {
        throw ConfigurationError("colorStops[" + std::to_string(stopIndex) +
                                 "] saturation and lightness must lie in [0, 100]");
    }
}

EngineConfig validated(EngineConfig config) {
    validateEngineConfig(config);
    for (auto& stop : config.colorStops) {
        stop[0].h = wrapDegrees(stop[0].h);
        stop[1].h = wrapDegrees(stop[1].h);
    }
    return config;
}

std::uint32_t seedFor(const EngineConfig& config) {
    if (config.seed.has_value()) {
        return *config.seed;
    }
    std::random_device device;
    return device();
}

}  // namespace

std::vector<ColorPair> defaultColorStops() {
    return {
        {HSLColor{145.0, 50.0, 30.0}, HSLColor{290.0, 35.0, 10.0}},
        {HSLColor{290.0, 35.0, 10.0}, HSLColor{140.0, 55.0, 26.67}},
        {HSLColor{135.0, 60.0, 23.33}, HSLColor{290.0, 35.0, 10.0}},
        {HSLColor{290.0, 35.0, 10.0}, HSLColor{130.0, 65.0, 20.0}},
    };
}

EngineConfig defaultEngineConfig() {
    EngineConfig config{};
    config.colorStops = defaultColorStops();
    return config;
}

void validateEngineConfig(const EngineConfig& config) {
    if (config.colorStops.empty()) {
        throw ConfigurationError("colorStops must contain at least one colour pair");
    }
    for (std::size_t i = 0; i < config.colorStops.size(); ++i) {
        requireFiniteColor(config.colorStops[i][0], i);
        requireFiniteColor(config.colorStops[i][1], i);
    }
    if (config.entityCount <= 0) {
        throw ConfigurationError("entityCount must be positive");
    }
    validateSpringConfig(config.spring);
    if (!(config.springStepFraction > 0.0) || config.springStepFraction > 1.0) {
        throw ConfigurationError("spring.stepFraction must lie in (0, 1]");
    }
    if (!std::isfinite(config.position.base) || !std::isfinite(config.position.range) ||
        !std::isfinite(config.xOffset)) {
        throw ConfigurationError("position values must be finite");
    }
    validateSpeedConfig(config.speed);
    validateFrameClockOptions(config.clock);
}

std::size_t EngineSnapshot::rotationCount() const {
    if (const auto* many = std::get_if<std::vector<double>>(&rotations)) {
        return many->size();
    }
    return 1;
}

double EngineSnapshot::rotation(std::size_t index) const {
    if (const auto* many = std::get_if<std::vector<double>>(&rotations)) {
        return many->at(index);
    }
    if (index != 0) {
        throw std::out_of_range("EngineSnapshot::rotation index out of range");
    }
    return std::get<double>(rotations);
}

Engine::Engine(EngineConfig config, FrameScheduler& scheduler)
    : config_(validated(std::move(config))),
      rng_(seedFor(config_)),
      spring_(config_.spring, config_.springStepFraction, config_.position),
      clock_(scheduler, [this](double dt, double timestampMs) { tick(dt, timestampMs); },
             config_.clock) {
    rotation_.initialize(static_cast<std::size_t>(config_.entityCount), config_.speed, rng_);
    publish(0.0);
}

Engine::~Engine() {
    stop();
}

void Engine::start() {
    if (stopped_) {
        throw EngineStateError("Engine: a stopped engine cannot be restarted");
    }
    clock_.start();
}

void Engine::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    clock_.stop();
    subscription_.reset();
}

void Engine::pushProgress(double value) {
    if (stopped_) {
        return;
    }
    if (!std::isfinite(value) && !warnedNonFinite_) {
        std::cerr << "Engine: non-finite progress value clamped to [0, 1]\n";
        warnedNonFinite_ = true;
    }
    const double clamped = sanitizeProgress(value);
    const double last = pending_.seen ? pending_.latest : progress_;
    if (clamped == last) {
        return;
    }

    // The first event has no predecessor and counts as its own previous value.
    pending_.previous = pending_.seen ? pending_.latest : clamped;
    pending_.latest = clamped;
    pending_.seen = true;
    pending_.dirty = true;
}

void Engine::attach(ProgressSignal& signal) {
    if (stopped_) {
        return;
    }
    subscription_ = signal.subscribe([this](double value) { pushProgress(value); });
}

void Engine::detach() {
    subscription_.reset();
}

void Engine::applyPendingProgress() {
    if (!pending_.dirty) {
        return;
    }
    pending_.dirty = false;
    progress_ = pending_.latest;
    rotation_.onProgressChange(pending_.previous, pending_.latest);
    spring_.setTargetFromProgress(pending_.latest);
}

void Engine::tick(double dtSeconds, double timestampMs) {
    if (stopped_) {
        return;
    }
    const double dt = (dtSeconds > 0.0 && std::isfinite(dtSeconds)) ? dtSeconds : 0.0;

    applyPendingProgress();
    spring_.tick(dt);
    rotation_.tick(dt);
    ++frameIndex_;
    publish(timestampMs);
}

void Engine::publish(double timestampMs) {
    auto next = std::make_shared<EngineSnapshot>();
    next->frameIndex = frameIndex_;
    next->timestampMs = timestampMs;
    next->progress = progress_;
    next->colorPair = interpolateColorPair(config_.colorStops, progress_);
    std::vector<double> angles = rotation_.rotations();
    if (angles.size() == 1) {
        next->rotations = angles.front();
    } else {
        next->rotations = std::move(angles);
    }
    next->yOffset = spring_.current();
    next->xOffset = config_.xOffset;
    snapshot_ = std::move(next);

    // Listeners may unsubscribe while being notified.
    const SnapshotPtr published = snapshot_;
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        const bool stillSubscribed =
            std::any_of(listeners_.begin(), listeners_.end(),
                        [&](const auto& current) { return current.first == entry.first; });
        if (stillSubscribed) {
            entry.second(*published);
        }
    }
}

Engine::ListenerId Engine::subscribe(SnapshotListener listener) {
    const ListenerId id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void Engine::unsubscribe(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

}  // namespace scrollfx

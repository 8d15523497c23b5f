// filename: color.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/color.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace scrollfx {

double interpolateHue(double h1, double h2, double t) {
    const double from = wrapDegrees(h1);
    const double to = wrapDegrees(h2);
    const double delta = std::fmod(to - from + 540.0, kFullTurnDeg) - 180.0;
    return wrapDegrees(from + t * delta + kFullTurnDeg);
}

HSLColor interpolateHsl(const HSLColor& a, const HSLColor& b, double t) {
    HSLColor out{};
    out.h = interpolateHue(a.h, b.h, t);
    out.s = a.s + (b.s - a.s) * t;
    out.l = a.l + (b.l - a.l) * t;
    return out;
}

ColorPair interpolateColorPair(const std::vector<ColorPair>& stops, double progress) {
    if (stops.empty()) {
        throw ConfigurationError("interpolateColorPair: colour stop list must not be empty");
    }
    if (stops.size() == 1) {
        return stops.front();
    }

    const double p = sanitizeProgress(progress);
    const std::size_t segments = stops.size() - 1;
    const double scaled = p * static_cast<double>(segments);
    const double floored = std::floor(scaled);
    const std::size_t segment =
        std::min(static_cast<std::size_t>(std::max(floored, 0.0)), segments - 1);
    const double t = scaled - static_cast<double>(segment);

    const ColorPair& current = stops[segment];
    const ColorPair& next = stops[segment + 1];
    return {interpolateHsl(current[0], next[0], t), interpolateHsl(current[1], next[1], t)};
}

std::string formatHslCss(const HSLColor& color) {
    std::ostringstream oss;
    oss << "hsl(" << std::lround(color.h) << ", " << std::lround(color.s) << "%, "
        << std::lround(color.l) << "%)";
    return oss.str();
}

std::vector<ColorPair> buildColorRamp(const std::vector<ColorPair>& stops, std::size_t steps) {
    if (stops.empty()) {
        throw ConfigurationError("buildColorRamp: colour stop list must not be empty");
    }
    if (stops.size() == 1) {
        return {stops.front()};
    }

    const std::size_t segments = stops.size() - 1;
    const std::size_t perSegment = std::max<std::size_t>(1, steps / segments);

    std::vector<ColorPair> ramp;
    ramp.reserve(perSegment * segments);
    for (std::size_t seg = 0; seg < segments; ++seg) {
        const ColorPair& current = stops[seg];
        const ColorPair& next = stops[seg + 1];
        for (std::size_t k = 0; k < perSegment; ++k) {
            const double mix = static_cast<double>(k) / static_cast<double>(perSegment);
            ramp.push_back({interpolateHsl(current[0], next[0], mix),
                            interpolateHsl(current[1], next[1], mix)});
        }
    }
    return ramp;
}

std::size_t rampIndexForProgress(std::size_t rampSize, double progress) {
    if (rampSize == 0) {
        return 0;
    }
    const double p = sanitizeProgress(progress);
    const auto index = static_cast<std::size_t>(std::floor(p * static_cast<double>(rampSize - 1)));
    return std::min(index, rampSize - 1);
}

}  // namespace scrollfx

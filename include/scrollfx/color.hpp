// filename: color.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "scrollfx/types.hpp"

namespace scrollfx {

/**
 * @brief Interpolate two hues along the shorter arc of the colour wheel.
 * @param t Blend factor, 0 returns h1 and 1 returns h2 (modulo 360).
 */
[[nodiscard]] double interpolateHue(double h1, double h2, double t);

[[nodiscard]] HSLColor interpolateHsl(const HSLColor& a, const HSLColor& b, double t);

/**
 * @brief Boundary colour pair for a progress value along uniformly spaced stops.
 *
 * Progress outside [0, 1] (and NaN) is clamped to the nearest boundary stop.
 * A single stop is returned unchanged.
 *
 * @throws ConfigurationError if @p stops is empty.
 */
[[nodiscard]] ColorPair interpolateColorPair(const std::vector<ColorPair>& stops, double progress);

// "hsl(145, 50%, 30%)"
[[nodiscard]] std::string formatHslCss(const HSLColor& color);

/**
 * @brief Precompute a fixed palette of colour pairs, floor(steps / (N - 1)) per segment.
 *
 * With a single stop the ramp holds that stop once.
 */
[[nodiscard]] std::vector<ColorPair> buildColorRamp(const std::vector<ColorPair>& stops,
                                                    std::size_t steps);

[[nodiscard]] std::size_t rampIndexForProgress(std::size_t rampSize, double progress);

}  // namespace scrollfx

// filename: color_interpolation_test.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/color.hpp"
#include "scrollfx/engine.hpp"
#include "scrollfx/types.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <vector>

namespace {

bool approxEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

bool sameColor(const scrollfx::HSLColor& a, const scrollfx::HSLColor& b, double tol = 1e-9) {
    return approxEqual(a.h, b.h, tol) && approxEqual(a.s, b.s, tol) && approxEqual(a.l, b.l, tol);
}

double angularDistance(double a, double b) {
    const double d = std::fmod(std::abs(a - b), 360.0);
    return d > 180.0 ? 360.0 - d : d;
}

}  // namespace

int main() {
    using namespace scrollfx;

    const ColorPair only{HSLColor{200.0, 40.0, 50.0}, HSLColor{10.0, 20.0, 30.0}};
    const std::vector<ColorPair> single{only};
    const double singleProgress[] = {0.0, 0.25, 0.5, 1.0, -1.0, 2.0,
                                     std::numeric_limits<double>::quiet_NaN()};
    for (double p : singleProgress) {
        const ColorPair out = interpolateColorPair(single, p);
        if (!sameColor(out[0], only[0], 0.0) || !sameColor(out[1], only[1], 0.0)) {
            std::cerr << "Single stop was not returned unchanged for progress " << p << '\n';
            return 1;
        }
    }

    const std::vector<ColorPair> wrap{
        {HSLColor{350.0, 50.0, 50.0}, HSLColor{0.0, 0.0, 0.0}},
        {HSLColor{10.0, 50.0, 50.0}, HSLColor{0.0, 0.0, 0.0}},
    };
    const ColorPair mid = interpolateColorPair(wrap, 0.5);
    if (!approxEqual(mid[0].h, 0.0)) {
        std::cerr << "Expected hue 0 halfway between 350 and 10, got " << mid[0].h << '\n';
        return 1;
    }

    if (!approxEqual(interpolateHue(10.0, 350.0, 0.25), 5.0)) {
        std::cerr << "Backward short arc not taken: " << interpolateHue(10.0, 350.0, 0.25) << '\n';
        return 1;
    }

    // Interpolated hues lie on the shorter arc between their bounding stops.
    std::mt19937 rng(20240611U);
    std::uniform_real_distribution<double> hue(0.0, 360.0);
    std::uniform_real_distribution<double> percent(0.0, 100.0);
    for (std::size_t trial = 0; trial < 50; ++trial) {
        const std::size_t count = 2 + trial % 4;
        std::vector<ColorPair> stops;
        for (std::size_t i = 0; i < count; ++i) {
            stops.push_back({HSLColor{hue(rng), percent(rng), percent(rng)},
                             HSLColor{hue(rng), percent(rng), percent(rng)}});
        }
        for (int step = 0; step <= 100; ++step) {
            const double p = static_cast<double>(step) / 100.0;
            const double scaled = p * static_cast<double>(count - 1);
            const std::size_t segment =
                std::min(static_cast<std::size_t>(std::floor(scaled)), count - 2);
            const ColorPair out = interpolateColorPair(stops, p);
            for (std::size_t slot = 0; slot < 2; ++slot) {
                const double h1 = stops[segment][slot].h;
                const double h2 = stops[segment + 1][slot].h;
                const double d1 = angularDistance(out[slot].h, h1);
                const double d2 = angularDistance(out[slot].h, h2);
                if (d1 > 180.0 || d2 > 180.0 || !approxEqual(d1 + d2, angularDistance(h1, h2), 1e-6)) {
                    std::cerr << "Hue " << out[slot].h << " is off the short arc between " << h1
                              << " and " << h2 << '\n';
                    return 1;
                }
                if (out[slot].h < 0.0 || out[slot].h >= 360.0) {
                    std::cerr << "Hue outside [0, 360): " << out[slot].h << '\n';
                    return 1;
                }
            }
        }
    }

    const std::vector<ColorPair> stops = defaultColorStops();
    const ColorPair below = interpolateColorPair(stops, -0.5);
    const ColorPair above = interpolateColorPair(stops, 1.5);
    const ColorPair nanPair = interpolateColorPair(stops, std::numeric_limits<double>::quiet_NaN());
    if (!sameColor(below[0], stops.front()[0]) || !sameColor(below[1], stops.front()[1]) ||
        !sameColor(nanPair[0], stops.front()[0])) {
        std::cerr << "Progress below range did not clamp to the first stop\n";
        return 1;
    }
    if (!sameColor(above[0], stops.back()[0]) || !sameColor(above[1], stops.back()[1])) {
        std::cerr << "Progress above range did not clamp to the last stop\n";
        return 1;
    }

    // Saturation and lightness are linear inside a segment.
    const ColorPair third = interpolateColorPair(stops, 1.0 / 6.0);
    if (!approxEqual(third[0].s, 0.5 * (50.0 + 35.0)) || !approxEqual(third[0].l, 0.5 * (30.0 + 10.0))) {
        std::cerr << "Unexpected saturation/lightness at segment midpoint\n";
        return 1;
    }

    bool threw = false;
    try {
        (void)interpolateColorPair({}, 0.5);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Empty stop list should raise ConfigurationError\n";
        return 1;
    }

    if (formatHslCss(HSLColor{145.0, 50.0, 30.0}) != "hsl(145, 50%, 30%)" ||
        formatHslCss(HSLColor{140.0, 55.0, 26.67}) != "hsl(140, 55%, 27%)") {
        std::cerr << "Unexpected CSS formatting: " << formatHslCss(HSLColor{140.0, 55.0, 26.67}) << '\n';
        return 1;
    }

    const std::vector<ColorPair> ramp = buildColorRamp(stops, 64);
    if (ramp.size() != 63) {
        std::cerr << "Expected 63 ramp entries, got " << ramp.size() << '\n';
        return 1;
    }
    if (!sameColor(ramp[0][0], stops[0][0]) || !sameColor(ramp[21][1], stops[1][1])) {
        std::cerr << "Ramp segments do not start at their stops\n";
        return 1;
    }
    if (rampIndexForProgress(ramp.size(), 1.0) != 62 || rampIndexForProgress(ramp.size(), 0.5) != 31 ||
        rampIndexForProgress(ramp.size(), -3.0) != 0) {
        std::cerr << "Unexpected ramp index mapping\n";
        return 1;
    }
    if (buildColorRamp(single, 64).size() != 1) {
        std::cerr << "Single-stop ramp should hold one entry\n";
        return 1;
    }

    std::cout << "ColorInterpolationTest: midpoint hue=" << mid[0].h << " ramp=" << ramp.size() << '\n';
    return 0;
}

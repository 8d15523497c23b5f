#include "scrollfx/engine.hpp"
#include "scrollfx/frame_clock.hpp"
#include "scrollfx/types.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

bool rejectsConfig(const scrollfx::EngineConfig& config) {
    scrollfx::ManualFrameScheduler scheduler;
    try {
        scrollfx::Engine engine(config, scheduler);
    } catch (const scrollfx::ConfigurationError&) {
        return true;
    }
    return false;
}

scrollfx::EngineConfig seededConfig(int entities) {
    scrollfx::EngineConfig config = scrollfx::defaultEngineConfig();
    config.entityCount = entities;
    config.seed = 42U;
    return config;
}

}  // namespace

int main() {
    using namespace scrollfx;

    {
        EngineConfig noStops = seededConfig(3);
        noStops.colorStops.clear();
        EngineConfig noEntities = seededConfig(0);
        EngineConfig negativeEntities = seededConfig(-2);
        EngineConfig badSaturation = seededConfig(3);
        badSaturation.colorStops[1][0].s = 120.0;
        EngineConfig badStep = seededConfig(3);
        badStep.springStepFraction = 0.0;
        EngineConfig badDamping = seededConfig(3);
        badDamping.speed.dampingConstant = 0.9;
        if (!rejectsConfig(noStops) || !rejectsConfig(noEntities) || !rejectsConfig(negativeEntities) ||
            !rejectsConfig(badSaturation) || !rejectsConfig(badStep) || !rejectsConfig(badDamping)) {
            std::cerr << "Invalid engine configuration was accepted\n";
            return 1;
        }
    }

    ManualFrameScheduler scheduler;
    Engine engine(seededConfig(12), scheduler);

    const Engine::SnapshotPtr initial = engine.snapshot();
    if (!initial || initial->frameIndex != 0 || initial->progress != 0.0) {
        std::cerr << "Engine should publish frame 0 at construction\n";
        return 1;
    }
    if (std::abs(initial->yOffset - 0.8) > 1e-12 || initial->xOffset != 0.5 || initial->rotationCount() != 12) {
        std::cerr << "Unexpected initial snapshot layout\n";
        return 1;
    }
    const ColorPair firstStop = engine.config().colorStops.front();
    if (initial->colorPair[0].h != firstStop[0].h || initial->colorPair[1].l != firstStop[1].l) {
        std::cerr << "Initial colours should match the first stop\n";
        return 1;
    }

    // Pushes are recorded only; nothing moves until the next tick.
    engine.pushProgress(0.5);
    if (engine.snapshot() != initial || engine.spring().target() != 0.8 ||
        engine.rotation().direction() != 1.0) {
        std::cerr << "pushProgress mutated state outside a tick\n";
        return 1;
    }

    std::size_t notified = 0;
    const Engine::ListenerId listener = engine.subscribe([&](const EngineSnapshot&) { ++notified; });

    engine.start();
    if (!engine.running() || scheduler.pending() != 1) {
        std::cerr << "start() should schedule a frame\n";
        return 1;
    }
    bool threw = false;
    try {
        engine.start();
    } catch (const EngineStateError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Starting a running engine should fail\n";
        return 1;
    }

    scheduler.advanceTo(0.0);
    const Engine::SnapshotPtr first = engine.snapshot();
    if (first->frameIndex != 1 || first->progress != 0.5 || notified != 1) {
        std::cerr << "First tick did not apply the pending progress\n";
        return 1;
    }
    // The first progress event is its own predecessor, so it keeps direction +1.
    if (std::abs(engine.spring().target() - 0.5) > 1e-12 || engine.rotation().direction() != 1.0) {
        std::cerr << "First progress event should retarget the spring and keep direction +1, got "
                  << engine.rotation().direction() << '\n';
        return 1;
    }
    if (initial->frameIndex != 0 || initial->progress != 0.0) {
        std::cerr << "Published snapshots must not change afterwards\n";
        return 1;
    }

    // The second event compares against the first: growing progress reverses rotation.
    engine.pushProgress(0.7);
    scheduler.advanceTo(8.0);
    if (engine.snapshot()->progress != 0.7 || engine.rotation().direction() != -1.0) {
        std::cerr << "Progress 0.5 -> 0.7 should reverse rotation\n";
        return 1;
    }
    for (const auto& entity : engine.rotation().entities()) {
        if (!(entity.targetSpeed < 0.0)) {
            std::cerr << "Target speeds should turn negative after the reversal\n";
            return 1;
        }
    }

    // Re-pushing the current value is not a scroll event and leaves the direction alone.
    engine.pushProgress(0.7);
    engine.pushProgress(0.7);
    scheduler.advanceTo(12.0);
    if (engine.rotation().direction() != -1.0 || engine.snapshot()->progress != 0.7) {
        std::cerr << "Repeated progress value flipped the direction\n";
        return 1;
    }

    // Several pushes between ticks: the latest wins, direction uses the last two.
    engine.pushProgress(0.2);
    engine.pushProgress(0.6);
    engine.pushProgress(0.4);
    scheduler.advanceTo(16.0);
    if (engine.snapshot()->progress != 0.4 || engine.rotation().direction() != 1.0) {
        std::cerr << "Expected latest progress 0.4 with direction +1\n";
        return 1;
    }
    for (const auto& entity : engine.rotation().entities()) {
        if (!(entity.targetSpeed > 0.0)) {
            std::cerr << "Target speeds should follow the new direction\n";
            return 1;
        }
    }

    // Progress outside [0, 1] is clamped; NaN reads as 0.
    engine.pushProgress(std::numeric_limits<double>::infinity());
    scheduler.advanceTo(32.0);
    if (engine.snapshot()->progress != 1.0) {
        std::cerr << "+inf progress should clamp to 1\n";
        return 1;
    }
    engine.pushProgress(std::numeric_limits<double>::quiet_NaN());
    scheduler.advanceTo(48.0);
    if (engine.snapshot()->progress != 0.0) {
        std::cerr << "NaN progress should clamp to 0\n";
        return 1;
    }
    engine.pushProgress(-4.0);
    scheduler.advanceTo(64.0);
    const EngineSnapshot& clamped = *engine.snapshot();
    for (std::size_t i = 0; i < clamped.rotationCount(); ++i) {
        const double angle = clamped.rotation(i);
        if (!std::isfinite(angle) || angle < 0.0 || angle >= 360.0) {
            std::cerr << "Angle left [0, 360) after clamped progress\n";
            return 1;
        }
    }
    if (!std::isfinite(clamped.colorPair[0].h) || !std::isfinite(clamped.yOffset)) {
        std::cerr << "Non-finite values reached the snapshot\n";
        return 1;
    }

    engine.unsubscribe(listener);
    const std::size_t before = notified;
    scheduler.advanceTo(80.0);
    if (notified != before) {
        std::cerr << "Unsubscribed listener was notified\n";
        return 1;
    }

    // stop() is terminal and freezes the published snapshot.
    engine.stop();
    engine.stop();
    const Engine::SnapshotPtr frozen = engine.snapshot();
    if (engine.running() || !engine.stopped() || scheduler.pending() != 0) {
        std::cerr << "stop() should cancel the scheduled frame\n";
        return 1;
    }
    engine.pushProgress(0.9);
    engine.tick(0.016, 96.0);
    scheduler.advanceTo(96.0);
    if (engine.snapshot() != frozen) {
        std::cerr << "Stopped engine published a new snapshot\n";
        return 1;
    }
    threw = false;
    try {
        engine.start();
    } catch (const EngineStateError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Restarting a stopped engine should fail\n";
        return 1;
    }

    {
        // A single entity is reported as a bare angle.
        ManualFrameScheduler singleScheduler;
        Engine single(seededConfig(1), singleScheduler);
        const Engine::SnapshotPtr snap = single.snapshot();
        if (!std::holds_alternative<double>(snap->rotations) || snap->rotationCount() != 1) {
            std::cerr << "Single entity should produce a scalar rotation\n";
            return 1;
        }
        bool outOfRange = false;
        try {
            (void)snap->rotation(1);
        } catch (const std::out_of_range&) {
            outOfRange = true;
        }
        if (!outOfRange) {
            std::cerr << "Scalar rotation should reject index 1\n";
            return 1;
        }
    }

    {
        // Identical seeds and inputs give identical frames.
        ManualFrameScheduler schedulerA;
        ManualFrameScheduler schedulerB;
        Engine a(seededConfig(5), schedulerA);
        Engine b(seededConfig(5), schedulerB);
        a.start();
        b.start();
        const double script[] = {0.1, 0.3, 0.3, 0.25, 0.7, 1.0, 0.4};
        double t = 0.0;
        for (double p : script) {
            a.pushProgress(p);
            b.pushProgress(p);
            schedulerA.advanceTo(t);
            schedulerB.advanceTo(t);
            t += 16.0;
        }
        const auto& ra = std::get<std::vector<double>>(a.snapshot()->rotations);
        const auto& rb = std::get<std::vector<double>>(b.snapshot()->rotations);
        if (ra != rb || a.snapshot()->yOffset != b.snapshot()->yOffset) {
            std::cerr << "Seeded engines diverged\n";
            return 1;
        }
    }

    {
        // A listener may stop the engine from inside a tick.
        ManualFrameScheduler loopScheduler;
        Engine looped(seededConfig(4), loopScheduler);
        looped.subscribe([&](const EngineSnapshot& snap) {
            if (snap.frameIndex == 3) {
                looped.stop();
            }
        });
        looped.start();
        for (int frame = 0; frame < 10; ++frame) {
            loopScheduler.advanceTo(16.0 * frame);
        }
        if (looped.snapshot()->frameIndex != 3 || loopScheduler.pending() != 0) {
            std::cerr << "Engine kept ticking after a listener stopped it\n";
            return 1;
        }
    }

    std::cout << "EngineLifecycleTest: final frame=" << frozen->frameIndex << '\n';
    return 0;
}

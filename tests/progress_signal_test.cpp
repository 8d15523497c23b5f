#include "scrollfx/engine.hpp"
#include "scrollfx/frame_clock.hpp"
#include "scrollfx/progress.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

int main() {
    using namespace scrollfx;

    {
        ProgressSignal signal(0.25);
        std::vector<double> seen;
        ProgressSignal::Subscription sub = signal.subscribe([&](double v) { seen.push_back(v); });
        assert(sub.active());
        assert(signal.listenerCount() == 1);

        signal.set(0.25);  // unchanged, no notification
        signal.set(0.5);
        signal.set(0.75);
        if (seen != std::vector<double>{0.5, 0.75} || signal.get() != 0.75) {
            std::cerr << "ProgressSignal should notify only on change\n";
            return 1;
        }

        ProgressSignal::Subscription moved = std::move(sub);
        if (sub.active() || !moved.active() || signal.listenerCount() != 1) {
            std::cerr << "Moving a subscription should transfer ownership\n";
            return 1;
        }
        moved.reset();
        moved.reset();
        signal.set(0.1);
        if (signal.listenerCount() != 0 || seen.size() != 2) {
            std::cerr << "reset() should unsubscribe\n";
            return 1;
        }

        {
            ProgressSignal::Subscription scoped = signal.subscribe([&](double v) { seen.push_back(v); });
            signal.set(0.2);
        }
        signal.set(0.3);
        if (seen.size() != 3 || seen.back() != 0.2) {
            std::cerr << "Scoped subscription outlived its scope\n";
            return 1;
        }
    }

    {
        // A listener may drop a later listener while the signal is notifying.
        ProgressSignal signal;
        int laterCalls = 0;
        ProgressSignal::Subscription later;
        ProgressSignal::Subscription first = signal.subscribe([&](double) { later.reset(); });
        later = signal.subscribe([&](double) { ++laterCalls; });
        signal.set(1.0);
        if (laterCalls != 0 || signal.listenerCount() != 1) {
            std::cerr << "Listener removed mid-notification was still called\n";
            return 1;
        }
    }

    {
        // Subscriptions may outlive their signal.
        auto signal = std::make_unique<ProgressSignal>();
        ProgressSignal::Subscription orphan = signal->subscribe([](double) {});
        signal.reset();
        if (orphan.active()) {
            std::cerr << "Subscription should report inactive once the signal is gone\n";
            return 1;
        }
        orphan.reset();
    }

    {
        // Engine attachment: re-attaching keeps physical state and the running loop.
        ManualFrameScheduler scheduler;
        EngineConfig config = defaultEngineConfig();
        config.entityCount = 3;
        config.seed = 3U;
        Engine engine(config, scheduler);
        ProgressSignal first;
        ProgressSignal second;

        engine.attach(first);
        engine.start();
        first.set(0.8);
        scheduler.advanceTo(0.0);
        for (int frame = 1; frame <= 5; ++frame) {
            scheduler.advanceTo(16.0 * frame);
        }
        if (engine.snapshot()->progress != 0.8) {
            std::cerr << "Attached signal did not drive the engine\n";
            return 1;
        }
        const std::vector<EntityState> beforeSwap = engine.rotation().entities();
        const double yBefore = engine.spring().current();
        const std::uint64_t ticksBefore = engine.clock().ticks();

        engine.attach(second);
        if (first.listenerCount() != 0 || second.listenerCount() != 1 || !engine.running()) {
            std::cerr << "Re-attaching should move the subscription without touching the loop\n";
            return 1;
        }
        if (engine.spring().current() != yBefore) {
            std::cerr << "Re-attaching reset the position spring\n";
            return 1;
        }
        for (std::size_t i = 0; i < beforeSwap.size(); ++i) {
            if (engine.rotation().entities()[i].currentSpeed != beforeSwap[i].currentSpeed ||
                engine.rotation().entities()[i].rotationAngle != beforeSwap[i].rotationAngle) {
                std::cerr << "Re-attaching reset entity state\n";
                return 1;
            }
        }

        first.set(0.1);
        scheduler.advanceTo(100.0);
        if (engine.snapshot()->progress != 0.8) {
            std::cerr << "Detached signal still drives the engine\n";
            return 1;
        }
        second.set(0.3);
        scheduler.advanceTo(116.0);
        if (engine.snapshot()->progress != 0.3 || engine.clock().ticks() != ticksBefore + 2) {
            std::cerr << "New signal did not take over cleanly\n";
            return 1;
        }

        engine.detach();
        if (engine.attached() || second.listenerCount() != 0) {
            std::cerr << "detach() should unsubscribe\n";
            return 1;
        }

        engine.attach(second);
        engine.stop();
        if (engine.attached() || second.listenerCount() != 0) {
            std::cerr << "stop() should drop the progress subscription\n";
            return 1;
        }
    }

    std::cout << "ProgressSignalTest: passed\n";
    return 0;
}

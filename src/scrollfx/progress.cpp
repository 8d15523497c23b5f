// filename: progress.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/progress.hpp"

#include <algorithm>
#include <cmath>

namespace scrollfx {

struct ProgressSignal::Subscription::Table {
    std::vector<std::pair<std::uint64_t, Listener>> listeners;
    std::uint64_t nextId{1};
};

void ProgressSignal::Subscription::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto table = table_.lock()) {
        auto& listeners = table->listeners;
        listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                       [this](const auto& entry) { return entry.first == id_; }),
                        listeners.end());
    }
    table_.reset();
    id_ = 0;
}

ProgressSignal::ProgressSignal(double initial)
    : table_(std::make_shared<Subscription::Table>()), value_(initial) {}

void ProgressSignal::set(double value) {
    if (value == value_ || (std::isnan(value) && std::isnan(value_))) {
        return;
    }
    value_ = value;

    // Listeners may unsubscribe while being notified.
    const auto snapshot = table_->listeners;
    for (const auto& entry : snapshot) {
        const auto& live = table_->listeners;
        const bool stillSubscribed =
            std::any_of(live.begin(), live.end(),
                        [&](const auto& current) { return current.first == entry.first; });
        if (stillSubscribed) {
            entry.second(value);
        }
    }
}

ProgressSignal::Subscription ProgressSignal::subscribe(Listener listener) {
    const std::uint64_t id = table_->nextId++;
    table_->listeners.emplace_back(id, std::move(listener));
    return Subscription(table_, id);
}

std::size_t ProgressSignal::listenerCount() const {
    return table_->listeners.size();
}

}  // namespace scrollfx

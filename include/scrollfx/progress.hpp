// filename: progress.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace scrollfx {

/**
 * @brief Push-based scroll progress source.
 *
 * set() notifies listeners only when the value changes. Listeners run
 * synchronously on the caller's thread in subscription order.
 */
class ProgressSignal {
public:
    using Listener = std::function<void(double)>;

    /**
     * @brief Move-only handle; unsubscribes on destruction or reset().
     *
     * Outliving the signal is safe.
     */
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : table_(std::move(other.table_)), id_(std::exchange(other.id_, 0)) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                table_ = std::move(other.table_);
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        void reset();

        [[nodiscard]] bool active() const { return id_ != 0 && !table_.expired(); }

    private:
        friend class ProgressSignal;

        struct Table;

        Subscription(std::weak_ptr<Table> table, std::uint64_t id)
            : table_(std::move(table)), id_(id) {}

        std::weak_ptr<Table> table_;
        std::uint64_t id_{0};
    };

    explicit ProgressSignal(double initial = 0.0);

    void set(double value);
    [[nodiscard]] double get() const { return value_; }

    [[nodiscard]] Subscription subscribe(Listener listener);

    [[nodiscard]] std::size_t listenerCount() const;

private:
    std::shared_ptr<Subscription::Table> table_;
    double value_{0.0};
};

}  // namespace scrollfx

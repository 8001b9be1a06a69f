#pragma once
#include <functional>

namespace feed_sync {

/**
 * RAII handle for a live subscription. Destroying (or resetting) the handle
 * stops further deliveries.
 */
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    explicit ScopedSubscription(std::function<void()> unsubscriber) : unsubscribe_(std::move(unsubscriber)) {}

    ScopedSubscription(ScopedSubscription&& other) noexcept : unsubscribe_(std::move(other.unsubscribe_)) {
        other.unsubscribe_ = nullptr;
    }

    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ~ScopedSubscription() { reset(); }

    void reset() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    bool is_active() const { return unsubscribe_ != nullptr; }

private:
    std::function<void()> unsubscribe_;
};

} // namespace feed_sync

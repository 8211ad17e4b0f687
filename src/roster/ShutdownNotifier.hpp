#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace roster {

/**
 * Tells interested parties, once, that the process has begun a graceful shutdown.
 *
 * Subscribers hold a Subscription; dropping it unsubscribes. Once unsubscribe returns the callback is guaranteed not
 * to be running, except when a callback drops its own subscription while being invoked.
 */
class ShutdownNotifier {
public:
    using Callback = std::function<void()>;

    class Subscription {
        ShutdownNotifier *notifier_{};
        uint64_t id_{};
        friend ShutdownNotifier;
        Subscription(ShutdownNotifier &notifier, uint64_t id) : notifier_(&notifier), id_(id) {}

    public:
        Subscription() = default;
        ~Subscription() { reset(); }
        Subscription(const Subscription &) = delete;
        Subscription &operator=(const Subscription &) = delete;
        Subscription(Subscription &&other) noexcept
            : notifier_(std::exchange(other.notifier_, nullptr)), id_(std::exchange(other.id_, 0)) {}
        Subscription &operator=(Subscription &&other) noexcept {
            reset();
            notifier_ = std::exchange(other.notifier_, nullptr);
            id_ = std::exchange(other.id_, 0);
            return *this;
        }

        void reset() noexcept {
            if (notifier_)
                std::exchange(notifier_, nullptr)->unsubscribe(id_);
        }
        [[nodiscard]] bool active() const noexcept { return notifier_ != nullptr; }
    };

    ShutdownNotifier() = default;
    virtual ~ShutdownNotifier() = default;
    ShutdownNotifier(const ShutdownNotifier &) = delete;
    ShutdownNotifier &operator=(const ShutdownNotifier &) = delete;

    // Registers a callback to run on shutdown. Subscribing after shutdown has begun yields an inactive Subscription.
    [[nodiscard]] Subscription subscribe(Callback callback);

    // Runs every subscribed callback once, on the calling thread. Only the first call does anything.
    void notify();

    [[nodiscard]] bool notified() const;

private:
    void unsubscribe(uint64_t id) noexcept;

    mutable std::mutex mutex_;
    std::condition_variable callback_done_;
    std::map<uint64_t, Callback> callbacks_;
    uint64_t last_id_{};
    uint64_t running_id_{};
    std::thread::id notifying_thread_;
    bool notified_{};
};

}

#include "ShutdownNotifier.hpp"

#include <gsl/gsl_util>

namespace roster {

ShutdownNotifier::Subscription ShutdownNotifier::subscribe(Callback callback) {
    std::lock_guard lock(mutex_);
    if (notified_)
        return {};
    auto id = ++last_id_;
    callbacks_.emplace(id, std::move(callback));
    return Subscription(*this, id);
}

void ShutdownNotifier::notify() {
    std::unique_lock lock(mutex_);
    if (notified_)
        return;
    notified_ = true;
    notifying_thread_ = std::this_thread::get_id();
    while (!callbacks_.empty()) {
        auto node = callbacks_.extract(callbacks_.begin());
        running_id_ = node.key();
        lock.unlock();
        auto relock = gsl::finally([&] {
            lock.lock();
            running_id_ = 0;
            callback_done_.notify_all();
        });
        node.mapped()();
    }
    notifying_thread_ = {};
}

bool ShutdownNotifier::notified() const {
    std::lock_guard lock(mutex_);
    return notified_;
}

void ShutdownNotifier::unsubscribe(uint64_t id) noexcept {
    std::unique_lock lock(mutex_);
    callbacks_.erase(id);
    if (notifying_thread_ != std::this_thread::get_id())
        callback_done_.wait(lock, [&] { return running_id_ != id; });
}

}

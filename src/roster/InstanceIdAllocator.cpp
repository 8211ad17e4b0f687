#include "InstanceIdAllocator.hpp"
#include "Errors.hpp"
#include "GapScan.hpp"

namespace roster {

InstanceIdAllocator::InstanceIdAllocator(ObjectStore &store, ShutdownNotifier &shutdown_notifier,
                                         RecordMetadataSource metadata, FailureHandler on_release_failure)
    : log_(logger_for("InstanceIdAllocator")), store_(store), metadata_(std::move(metadata)),
      on_release_failure_(std::move(on_release_failure)),
      shutdown_subscription_(shutdown_notifier.subscribe([this] { release_record(); })) {
    if (!shutdown_subscription_.active())
        log_.warn("Shutdown is already under way; the instance ID will not be released automatically");
}

InstanceId InstanceIdAllocator::acquire() {
    std::lock_guard lock(mutex_);
    switch (state_) {
    case State::Acquired: return *id_;
    case State::Failed: std::rethrow_exception(failure_);
    case State::Released: throw InstanceIdReleasedError("The application instance ID has already been released");
    case State::Unacquired:
    case State::Acquiring: break;
    }

    state_ = State::Acquiring;
    try {
        id_ = claim();
    } catch (const std::exception &e) {
        log_.error("Unable to acquire an application instance ID: {}", e.what());
        state_ = State::Failed;
        failure_ = std::current_exception();
        throw;
    }
    state_ = State::Acquired;
    return *id_;
}

InstanceId InstanceIdAllocator::claim() {
    store_.ensure_namespace();
    log_.debug("Namespace is ready");
    // Built once; every attempt writes the same content.
    const auto content = metadata_().render();

    for (auto attempt = 1u;; ++attempt) {
        const auto candidate = find_smallest_free_id(store_.list_record_names());
        log_.debug("Attempt {}: claiming instance ID {}", attempt, candidate);
        switch (store_.create_record(format_record_name(candidate), content, ObjectStore::Overwrite::No)) {
        case ObjectStore::CreateResult::Created:
            log_.info("Acquired application instance ID {}", candidate);
            return candidate;
        case ObjectStore::CreateResult::AlreadyExists:
            log_.debug("Another instance claimed ID {} first, retrying", candidate);
            break;
        }
    }
}

void InstanceIdAllocator::release() noexcept {
    release_record();
    // Outside the lock: unsubscribing waits for a running shutdown callback, which may be waiting for the lock.
    shutdown_subscription_.reset();
}

void InstanceIdAllocator::release_record() noexcept {
    std::lock_guard lock(mutex_);
    switch (state_) {
    case State::Released:
    case State::Failed: return;
    case State::Unacquired:
    case State::Acquiring: log_.debug("No application instance ID to release"); break;
    case State::Acquired:
        try {
            store_.delete_record(format_record_name(*id_), ObjectStore::IncludeDerived::Yes);
            log_.info("Released application instance ID {}", *id_);
        } catch (const std::exception &e) {
            log_.warn("Unable to release application instance ID {}: {}", *id_, e.what());
            if (on_release_failure_)
                on_release_failure_(e);
        }
        break;
    }
    state_ = State::Released;
}

InstanceIdAllocator::State InstanceIdAllocator::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<InstanceId> InstanceIdAllocator::id() const {
    std::lock_guard lock(mutex_);
    if (state_ != State::Acquired)
        return std::nullopt;
    return id_;
}

}

#pragma once

#include "InstanceId.hpp"
#include "Logger.hpp"
#include "ObjectStore.hpp"
#include "RecordMetadata.hpp"
#include "ShutdownNotifier.hpp"

#include <exception>
#include <functional>
#include <mutex>
#include <optional>

namespace roster {

/**
 * Hands this process a small ID that no other live instance of the application holds, using an object store
 * namespace shared by all instances as the only means of coordination.
 *
 * Each live instance owns one record in the namespace, named after its ID. To acquire an ID the allocator lists the
 * namespace, picks the smallest ID with no record and creates that record, failing if it already exists. Losing that
 * race to another instance just means listing again. The ID is looked up once, on the first call to acquire(), and
 * kept for the life of the allocator.
 *
 * When the shutdown notifier fires, the allocator deletes its record. That is best effort: a record left behind only
 * wastes one ID, and the smallest-first choice reuses the slot once someone cleans it up.
 */
class InstanceIdAllocator {
public:
    enum class State { Unacquired, Acquiring, Acquired, Released, Failed };
    // Receives errors raised while releasing the ID. Must not throw.
    using FailureHandler = std::function<void(const std::exception &)>;

    InstanceIdAllocator(ObjectStore &store, ShutdownNotifier &shutdown_notifier, RecordMetadataSource metadata,
                        FailureHandler on_release_failure = {});
    InstanceIdAllocator(const InstanceIdAllocator &) = delete;
    InstanceIdAllocator &operator=(const InstanceIdAllocator &) = delete;

    // Returns this process's ID, claiming one on the first call. Concurrent callers wait for the first to finish.
    // A failure is final: every later call rethrows it.
    [[nodiscard]] InstanceId acquire();

    // Deletes the record of the ID held, if any, and stops listening for shutdown. Never throws; failures go to the
    // FailureHandler. Afterwards no ID can be acquired. Not to be called concurrently with itself or the destructor.
    void release() noexcept;

    [[nodiscard]] State state() const;
    // The ID currently held, without trying to acquire one.
    [[nodiscard]] std::optional<InstanceId> id() const;

private:
    InstanceId claim();
    // The part of release() the shutdown callback runs. It leaves the subscription alone: only the owning thread
    // touches it, so that dropping it always waits for a running callback.
    void release_record() noexcept;

    Logger log_;
    ObjectStore &store_;
    RecordMetadataSource metadata_;
    FailureHandler on_release_failure_;
    mutable std::mutex mutex_;
    State state_{State::Unacquired};
    std::optional<InstanceId> id_;
    std::exception_ptr failure_;
    // Declared last so it is dropped first, before anything the shutdown callback touches.
    ShutdownNotifier::Subscription shutdown_subscription_;
};

}

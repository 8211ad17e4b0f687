#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace roster {

// Base of every error raised while obtaining an application instance ID.
class InstanceIdError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The namespace holds a record whose name is not a valid instance ID. Needs manual cleanup.
class NamespaceCorruptError : public InstanceIdError {
    std::string record_name_;

public:
    NamespaceCorruptError(const std::string &message, std::string record_name)
        : InstanceIdError(message), record_name_(std::move(record_name)) {}
    [[nodiscard]] const std::string &record_name() const noexcept { return record_name_; }
};

// Every ID in the valid range is already claimed.
class IdSpaceExhaustedError : public InstanceIdError {
public:
    using InstanceIdError::InstanceIdError;
};

// The object store failed or answered unexpectedly.
class StoreError : public InstanceIdError {
public:
    using InstanceIdError::InstanceIdError;
};

// The allocator has already given its ID back.
class InstanceIdReleasedError : public InstanceIdError {
public:
    using InstanceIdError::InstanceIdError;
};

}

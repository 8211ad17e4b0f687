#pragma once

#include "roster/Errors.hpp"
#include "roster/ObjectStore.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace test {

// An in-process ObjectStore shared by several allocators, standing in for a real store. Lists names in lexicographic
// order, the way most object stores do, unless told to reverse them.
class MemoryObjectStore : public roster::ObjectStore {
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> records_;
    bool reverse_listing_{};
    std::function<void(std::string_view)> before_create_;
    std::function<void(std::string_view)> before_delete_;
    int list_calls_{};
    int create_calls_{};

public:
    MemoryObjectStore() = default;
    explicit MemoryObjectStore(std::initializer_list<std::string> names) {
        for (const auto &name : names)
            records_.emplace(name, "");
    }

    void ensure_namespace() override {}

    std::vector<std::string> list_record_names() override {
        std::lock_guard lock(mutex_);
        ++list_calls_;
        std::vector<std::string> names;
        for (const auto &record : records_)
            names.push_back(record.first);
        if (reverse_listing_)
            std::reverse(names.begin(), names.end());
        return names;
    }

    CreateResult create_record(std::string_view name, std::string_view content, Overwrite overwrite) override {
        if (before_create_)
            before_create_(name);
        std::lock_guard lock(mutex_);
        ++create_calls_;
        auto it = records_.find(name);
        if (it != records_.end()) {
            if (overwrite == Overwrite::No)
                return CreateResult::AlreadyExists;
            it->second = content;
            return CreateResult::Created;
        }
        records_.emplace(name, content);
        return CreateResult::Created;
    }

    void delete_record(std::string_view name, IncludeDerived) override {
        if (before_delete_)
            before_delete_(name);
        std::lock_guard lock(mutex_);
        auto it = records_.find(name);
        if (it == records_.end())
            throw roster::StoreError(fmt::format("No record called {}", name));
        records_.erase(it);
    }

    // Runs just before every create_record, outside the store's lock.
    void before_create(std::function<void(std::string_view)> hook) { before_create_ = std::move(hook); }
    // Runs just before every delete_record, outside the store's lock.
    void before_delete(std::function<void(std::string_view)> hook) { before_delete_ = std::move(hook); }
    void reverse_listing() { reverse_listing_ = true; }

    void add(const std::string &name, std::string content = "") {
        std::lock_guard lock(mutex_);
        records_.insert_or_assign(name, std::move(content));
    }
    [[nodiscard]] bool contains(std::string_view name) const {
        std::lock_guard lock(mutex_);
        return records_.find(name) != records_.end();
    }
    [[nodiscard]] std::string content(std::string_view name) const {
        std::lock_guard lock(mutex_);
        auto it = records_.find(name);
        return it == records_.end() ? std::string() : it->second;
    }
    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }
    [[nodiscard]] int list_calls() const {
        std::lock_guard lock(mutex_);
        return list_calls_;
    }
    [[nodiscard]] int create_calls() const {
        std::lock_guard lock(mutex_);
        return create_calls_;
    }
};

}

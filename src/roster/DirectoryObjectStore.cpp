#include "DirectoryObjectStore.hpp"
#include "Errors.hpp"
#include "common/Fd.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace roster {

namespace {

constexpr auto SnapshotDirName = ".snapshots";

void check_name(std::string_view kind, std::string_view name) {
    if (name.empty() || name.front() == '.' || name.find_first_of(std::string_view("/\0", 2)) != std::string_view::npos)
        throw std::invalid_argument(fmt::format("Invalid {} name '{}'", kind, name));
}

void write_record_file(const Fd &fd, const fs::path &path, std::string_view content) {
    try {
        fd.write(content);
        fd.sync();
    } catch (const std::runtime_error &re) {
        throw StoreError(fmt::format("Unable to write record {}: {}", path.string(), re.what()));
    }
}

}

DirectoryObjectStore::DirectoryObjectStore(fs::path root, const std::string &namespace_name)
    : log_(logger_for("DirectoryObjectStore")), root_(std::move(root)) {
    check_name("namespace", namespace_name);
    namespace_dir_ = root_ / namespace_name;
}

fs::path DirectoryObjectStore::record_path(std::string_view name) const {
    check_name("record", name);
    return namespace_dir_ / name;
}

fs::path DirectoryObjectStore::snapshot_dir(std::string_view name) const {
    check_name("record", name);
    return namespace_dir_ / SnapshotDirName / name;
}

void DirectoryObjectStore::ensure_namespace() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
        throw StoreError(fmt::format("Object store root {} is not a directory", root_.string()));
    if (fs::create_directory(namespace_dir_, ec))
        log_.info("Created namespace {}", namespace_dir_.string());
    if (ec)
        throw StoreError(fmt::format("Unable to create namespace {}: {}", namespace_dir_.string(), ec.message()));
    if (!fs::is_directory(namespace_dir_, ec))
        throw StoreError(fmt::format("Namespace {} exists but is not a directory", namespace_dir_.string()));
}

std::vector<std::string> DirectoryObjectStore::list_record_names() {
    std::error_code ec;
    fs::directory_iterator it(namespace_dir_, ec);
    if (ec)
        throw StoreError(fmt::format("Unable to list namespace {}: {}", namespace_dir_.string(), ec.message()));
    std::vector<std::string> names;
    while (it != fs::directory_iterator()) {
        auto name = it->path().filename().string();
        if (!name.empty() && name.front() != '.')
            names.emplace_back(std::move(name));
        it.increment(ec);
        if (ec)
            throw StoreError(fmt::format("Unable to list namespace {}: {}", namespace_dir_.string(), ec.message()));
    }
    return names;
}

ObjectStore::CreateResult DirectoryObjectStore::create_record(std::string_view name, std::string_view content,
                                                              Overwrite overwrite) {
    const auto path = record_path(name);
    auto result = overwrite == Overwrite::No ? create_exclusive(path, content) : replace(name, path, content);
    log_.debug("Create of record {} ({} overwrite): {}", name, overwrite == Overwrite::No ? "without" : "with",
               magic_enum::enum_name(result));
    return result;
}

ObjectStore::CreateResult DirectoryObjectStore::create_exclusive(const fs::path &path, std::string_view content) {
    auto raw_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (raw_fd < 0) {
        if (errno == EEXIST)
            return CreateResult::AlreadyExists;
        throw StoreError(fmt::format("Unable to create record {}: {}", path.string(), std::strerror(errno)));
    }
    Fd fd(raw_fd);
    try {
        write_record_file(fd, path, content);
    } catch (const StoreError &) {
        // Don't leave a half-written claim behind.
        fd.close();
        std::error_code ignored;
        fs::remove(path, ignored);
        throw;
    }
    return CreateResult::Created;
}

ObjectStore::CreateResult DirectoryObjectStore::replace(std::string_view name, const fs::path &path,
                                                        std::string_view content) {
    const auto temp_path = namespace_dir_ / fmt::format(".{}.{}.{}.tmp", name, ::getpid(), ++temp_file_counter_);
    {
        Fd fd;
        try {
            fd = Fd::open(temp_path.string(), O_WRONLY | O_CREAT | O_TRUNC);
        } catch (const std::system_error &se) {
            throw StoreError(fmt::format("Unable to write record {}: {}", path.string(), se.what()));
        }
        try {
            write_record_file(fd, temp_path, content);
        } catch (const StoreError &) {
            fd.close();
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            throw;
        }
    }
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw StoreError(fmt::format("Unable to replace record {}: {}", path.string(), ec.message()));
    }
    return CreateResult::Created;
}

void DirectoryObjectStore::delete_record(std::string_view name, IncludeDerived include_derived) {
    const auto path = record_path(name);
    const auto snapshots = snapshot_dir(name);
    std::error_code ec;
    const auto has_snapshots = fs::exists(snapshots, ec);
    if (ec)
        throw StoreError(fmt::format("Unable to look for snapshots of {}: {}", path.string(), ec.message()));
    if (has_snapshots) {
        if (include_derived == IncludeDerived::No)
            throw StoreError(
                fmt::format("Record {} has snapshots and they were not included in the delete", path.string()));
        fs::remove_all(snapshots, ec);
        if (ec)
            throw StoreError(fmt::format("Unable to delete snapshots of {}: {}", path.string(), ec.message()));
    }
    if (!fs::remove(path, ec)) {
        if (ec)
            throw StoreError(fmt::format("Unable to delete record {}: {}", path.string(), ec.message()));
        throw StoreError(fmt::format("Unable to delete record {}: it does not exist", path.string()));
    }
    log_.debug("Deleted record {}{}", name, has_snapshots ? " and its snapshots" : "");
}

fs::path DirectoryObjectStore::snapshot_record(std::string_view name) {
    const auto path = record_path(name);
    const auto dir = snapshot_dir(name);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw StoreError(fmt::format("Unable to snapshot record {}: it does not exist", path.string()));
    fs::create_directories(dir, ec);
    if (ec)
        throw StoreError(fmt::format("Unable to create snapshot directory {}: {}", dir.string(), ec.message()));
    for (auto sequence = 1u;; ++sequence) {
        auto target = dir / fmt::format("{}", sequence);
        if (fs::copy_file(path, target, fs::copy_options::none, ec)) {
            log_.debug("Snapshot {} taken of record {}", sequence, name);
            return target;
        }
        if (ec != std::errc::file_exists)
            throw StoreError(fmt::format("Unable to snapshot record {}: {}", path.string(), ec.message()));
    }
}

}

#pragma once

#include "Logger.hpp"
#include "ObjectStore.hpp"

#include <atomic>
#include <filesystem>
#include <string>

namespace roster {

/**
 * An ObjectStore kept in a directory tree, for deployments whose instances share a filesystem.
 *
 * The namespace is the directory <root>/<namespace name>, and each record is a regular file in it. Exclusive creation
 * relies on open(O_CREAT | O_EXCL), which is atomic on local filesystems and on NFSv3 and later. Names starting with a
 * dot belong to the store itself and are never listed; snapshots of a record live under .snapshots/<record name>/.
 */
class DirectoryObjectStore final : public ObjectStore {
    Logger log_;
    std::filesystem::path root_;
    std::filesystem::path namespace_dir_;
    std::atomic<unsigned> temp_file_counter_{};

    [[nodiscard]] std::filesystem::path record_path(std::string_view name) const;
    [[nodiscard]] std::filesystem::path snapshot_dir(std::string_view name) const;
    CreateResult create_exclusive(const std::filesystem::path &path, std::string_view content);
    CreateResult replace(std::string_view name, const std::filesystem::path &path, std::string_view content);

public:
    DirectoryObjectStore(std::filesystem::path root, const std::string &namespace_name);

    void ensure_namespace() override;
    [[nodiscard]] std::vector<std::string> list_record_names() override;
    [[nodiscard]] CreateResult create_record(std::string_view name, std::string_view content,
                                             Overwrite overwrite) override;
    void delete_record(std::string_view name, IncludeDerived include_derived) override;

    // Copies the current content of a record into a new snapshot, returning the snapshot's path.
    std::filesystem::path snapshot_record(std::string_view name);

    [[nodiscard]] const std::filesystem::path &namespace_dir() const noexcept { return namespace_dir_; }
};

}

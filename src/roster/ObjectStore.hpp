#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace roster {

/**
 * The handful of object store primitives the instance ID allocator needs, over one namespace (a container or bucket).
 *
 * Implementations must be safe to use from several threads and several processes at once against the same namespace.
 * Any unexpected backend response is reported by throwing StoreError.
 */
class ObjectStore {
public:
    enum class Overwrite { No, Yes };
    enum class IncludeDerived { No, Yes };
    enum class CreateResult { Created, AlreadyExists };

    virtual ~ObjectStore() = default;

    // Creates the namespace unless it already exists.
    virtual void ensure_namespace() = 0;

    // All record names currently in the namespace, in no particular order.
    [[nodiscard]] virtual std::vector<std::string> list_record_names() = 0;

    // Writes a record. With Overwrite::No an existing record is left alone and AlreadyExists is returned; this is the
    // only primitive used for mutual exclusion between instances, so it must be atomic per record name.
    [[nodiscard]] virtual CreateResult create_record(std::string_view name, std::string_view content,
                                                     Overwrite overwrite) = 0;

    // Deletes a record, and with IncludeDerived::Yes also anything derived from it such as snapshots.
    virtual void delete_record(std::string_view name, IncludeDerived include_derived) = 0;
};

}

#include "GapScan.hpp"
#include "Errors.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace roster {

InstanceId find_smallest_free_id(const std::vector<std::string> &record_names) {
    std::vector<InstanceId> claimed;
    claimed.reserve(record_names.size());
    for (const auto &name : record_names) {
        auto id = parse_record_name(name);
        if (!id)
            throw NamespaceCorruptError(
                fmt::format("Found unrelated record '{}' in the instance ID namespace", name), name);
        claimed.push_back(*id);
    }
    std::sort(claimed.begin(), claimed.end());

    InstanceId last_seen = NoInstanceId;
    for (auto id : claimed) {
        if (id > last_seen + 1)
            break; // found a gap
        last_seen = id;
    }

    if (last_seen == MaxInstanceId)
        throw IdSpaceExhaustedError(fmt::format("All {} application instance IDs are in use", MaxInstanceId));
    return static_cast<InstanceId>(last_seen + 1);
}

}

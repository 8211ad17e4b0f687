#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace roster {

using InstanceId = uint16_t;

// Zero is never handed out; it stands for "nothing seen yet" during a gap scan.
static inline constexpr InstanceId NoInstanceId = 0;
static inline constexpr InstanceId MinInstanceId = 1;
static inline constexpr InstanceId MaxInstanceId = std::numeric_limits<InstanceId>::max();

// Record names are the plain decimal form of the ID: no sign, no leading zeros.
std::string format_record_name(InstanceId id);

// Returns the ID a record name stands for, or nullopt if the name could not have been written by format_record_name.
std::optional<InstanceId> parse_record_name(std::string_view name);

}

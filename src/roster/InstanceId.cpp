#include "InstanceId.hpp"

#include <fmt/format.h>

#include <charconv>

namespace roster {

std::string format_record_name(InstanceId id) { return fmt::format("{}", id); }

std::optional<InstanceId> parse_record_name(std::string_view name) {
    if (name.empty() || name.front() == '0')
        return std::nullopt;
    // from_chars alone would accept a numeric prefix, so insist on digits throughout.
    for (auto c : name)
        if (c < '0' || c > '9')
            return std::nullopt;
    uint32_t value{};
    auto [end, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
    if (ec != std::errc{} || end != name.data() + name.size())
        return std::nullopt;
    if (value < MinInstanceId || value > MaxInstanceId)
        return std::nullopt;
    return static_cast<InstanceId>(value);
}

}

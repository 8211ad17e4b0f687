#pragma once

#include "common/Time.hpp"

#include <functional>
#include <string>

namespace roster {

// Diagnostic content written into a claimed record. Never read back by the allocator.
struct RecordMetadata {
    std::string application_name;
    std::string server_name;
    Time creation_time;

    // Renders "Key=Value" lines separated by newlines.
    [[nodiscard]] std::string render() const;

    // Describes this process: the given application name, this host's name, and the current time.
    static RecordMetadata for_this_process(std::string application_name);
};

using RecordMetadataSource = std::function<RecordMetadata()>;

}

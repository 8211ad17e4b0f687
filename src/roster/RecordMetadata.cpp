#include "RecordMetadata.hpp"
#include "common/host_name.hpp"

#include <fmt/format.h>

namespace roster {

std::string RecordMetadata::render() const {
    return fmt::format("ApplicationName={}\nServerName={}\nCreationDateTime={}", application_name, server_name,
                       iso8601_time(creation_time));
}

RecordMetadata RecordMetadata::for_this_process(std::string application_name) {
    return RecordMetadata{std::move(application_name), get_host_name(), Clock::now()};
}

}

#include "host_name.hpp"

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <climits>
#include <unistd.h>

std::string get_host_name() {
    std::array<char, HOST_NAME_MAX + 1> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) < 0)
        throw fmt::system_error(errno, "Unable to determine host name");
    return buffer.data();
}

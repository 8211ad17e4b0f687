#include "Fd.hpp"

#include <fmt/format.h>

void Fd::write(const void *data, size_t length) const {
    if (!is_open())
        throw std::runtime_error("Write called on invalid file descriptor");
    auto num = ::write(fd_, data, length);
    if (num < 0)
        throw fmt::system_error(errno, "Unable to write to {}", fd_);
    if (static_cast<size_t>(num) != length)
        throw std::runtime_error(fmt::format("Truncated write to file descriptor {} ({}/{})", fd_, num, length));
}

void Fd::sync() const {
    if (!is_open())
        throw std::runtime_error("Sync called on invalid file descriptor");
    if (::fsync(fd_) < 0)
        throw fmt::system_error(errno, "Unable to sync {}", fd_);
}

Fd Fd::open(const std::string &path, int flags, mode_t mode) {
    auto fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd < 0)
        throw fmt::system_error(errno, "Unable to open {}", path);
    return Fd(fd);
}

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

class Fd {
    int fd_;

public:
    Fd() : fd_(-1) {}
    explicit Fd(int fd) noexcept : fd_(fd) {}
    ~Fd() noexcept { close(); }
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;
    Fd(Fd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd &operator=(Fd &&other) noexcept {
        close();
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int number() const {
        if (!is_open())
            throw std::runtime_error("Attempt to get handle for invalid file descriptor");
        return fd_;
    }
    void close() noexcept {
        if (is_open())
            ::close(fd_);
        fd_ = -1;
    }
    void write(std::string_view data) const { write(data.data(), data.size()); }
    void write(const void *data, size_t length) const;
    // Flushes written data to the backing device.
    void sync() const;

    static Fd open(const std::string &path, int flags, mode_t mode = 0644);
};

#include "SignalShutdownNotifier.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <sys/signalfd.h>

namespace roster {

SignalShutdownNotifier::SignalShutdownNotifier() : log_(logger_for("SignalShutdownNotifier")) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    if (sigprocmask(SIG_BLOCK, &signals, &previous_mask_) < 0)
        throw fmt::system_error(errno, "Unable to block shutdown signals");
    auto fd = signalfd(-1, &signals, SFD_CLOEXEC);
    if (fd < 0) {
        auto error = errno;
        sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
        throw fmt::system_error(error, "Unable to create signal fd");
    }
    signal_fd_ = Fd(fd);
}

SignalShutdownNotifier::~SignalShutdownNotifier() {
    signal_fd_.close();
    sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
}

int SignalShutdownNotifier::wait() {
    for (;;) {
        signalfd_siginfo info{};
        auto num_read = ::read(signal_fd_.number(), &info, sizeof(info));
        if (num_read < 0 && errno == EINTR)
            continue;
        if (num_read < 0)
            throw fmt::system_error(errno, "Unable to read from signal fd");
        if (static_cast<size_t>(num_read) != sizeof(info)) {
            log_.warn("Unable to read signal info - treating as term");
            info.ssi_signo = SIGTERM;
        }
        if (info.ssi_signo != SIGTERM && info.ssi_signo != SIGINT) {
            log_.warn("Unexpected signal {}: ignoring", info.ssi_signo);
            continue;
        }
        log_.info("Caught {}, shutting down", strsignal(static_cast<int>(info.ssi_signo)));
        notify();
        return static_cast<int>(info.ssi_signo);
    }
}

}

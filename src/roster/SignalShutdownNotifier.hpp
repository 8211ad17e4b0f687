#pragma once

#include "Logger.hpp"
#include "ShutdownNotifier.hpp"
#include "common/Fd.hpp"

#include <csignal>

namespace roster {

// Turns SIGTERM and SIGINT into a shutdown notification. Construct it before starting any threads, so they all
// inherit the blocked signal mask.
class SignalShutdownNotifier final : public ShutdownNotifier {
    Logger log_;
    sigset_t previous_mask_{};
    Fd signal_fd_;

public:
    SignalShutdownNotifier();
    ~SignalShutdownNotifier() override;

    // Blocks until SIGTERM or SIGINT arrives, notifies subscribers and returns the signal number.
    int wait();
};

}

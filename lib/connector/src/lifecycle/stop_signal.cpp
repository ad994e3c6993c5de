#include "lifecycle/stop_signal.h"

#include <csignal>
#include <stdexcept>

namespace lifecycle {

namespace {

volatile std::sig_atomic_t stopFlag = 0;

void onStopSignal(int) {
    stopFlag = 1;
}

}  // namespace

void installStopSignals() {
    if (std::signal(SIGINT, onStopSignal) == SIG_ERR || std::signal(SIGTERM, onStopSignal) == SIG_ERR) {
        throw std::runtime_error("Failed to install SIGINT/SIGTERM handlers");
    }
}

bool stopRequested() {
    return stopFlag != 0;
}

void clearStopRequest() {
    stopFlag = 0;
}

}  // namespace lifecycle

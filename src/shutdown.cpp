#include "shutdown.hpp"
#include <algorithm>
#include <thread>
#include <signal.h>

volatile std::sig_atomic_t gShutdownFlag = 0;

namespace {

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

} // namespace

void installShutdownHandlers() {
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
}

bool shutdownRequested() {
    return gShutdownFlag != 0;
}

bool interruptibleSleep(std::chrono::milliseconds duration, const std::function<bool()>& interrupted) {
    using namespace std::chrono;
    auto deadline = steady_clock::now() + duration;
    while (!(interrupted ? interrupted() : shutdownRequested())) {
        auto now = steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::min(milliseconds(100), duration_cast<milliseconds>(deadline - now));
        std::this_thread::sleep_for(slice);
    }
    return false;
}

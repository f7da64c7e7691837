#include "ytmux/interrupt.h"
#include <atomic> // Shared by the signal handler and transfer threads
#include <csignal>
#include <signal.h> // For sigaction

namespace ytmux {

namespace {

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free, "interrupt flag must be usable from a signal handler");

void onInterrupt(int) {
    g_interrupted.store(true);
}

} // namespace

void installInterruptHandler() {
    struct sigaction action {};
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART
    sigaction(SIGINT, &action, nullptr);
}

bool interruptRequested() {
    return g_interrupted.load();
}

void requestInterrupt() {
    g_interrupted.store(true);
}

void resetInterrupt() {
    g_interrupted.store(false);
}

} // namespace ytmux

#ifndef YTMUX_INTERRUPT_H
#define YTMUX_INTERRUPT_H

namespace ytmux {

// Installs a SIGINT handler that only records the interrupt. The handler is
// installed without SA_RESTART so blocking reads return early.
void installInterruptHandler();

bool interruptRequested();

// Same effect as a delivered SIGINT.
void requestInterrupt();

void resetInterrupt();

} // namespace ytmux

#endif // YTMUX_INTERRUPT_H

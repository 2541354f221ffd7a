#include "patchwright/interrupt.hpp"

#include "patchwright/errors.hpp"

#include <csignal>
#include <signal.h>

namespace patchwright::interrupt {

namespace {
volatile std::sig_atomic_t g_requested = 0;

void on_signal(int /*signo*/) { g_requested = 1; }
} // namespace

void install_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool requested() { return g_requested != 0; }

void check() {
  if (requested())
    throw Interrupted();
}

void request() { g_requested = 1; }

void reset() { g_requested = 0; }

} // namespace patchwright::interrupt

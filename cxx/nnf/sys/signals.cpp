#include "signals.hpp"

#include <csignal>
#include <cstdlib>
#include <mutex>

namespace nnf {

namespace {
int                        interruptLevel = 0;
std::mutex                 interruptMutex;
volatile std::sig_atomic_t received = 0;
void (*previous)(int) = SIG_DFL;

/* Only async-signal-safe work in here, the message is logged by whoever polls */
void Handler(int)
{
  if (received) {
    std::_Exit(EXIT_FAILURE);
  } else {
    received = 1;
  }
}
} // namespace

void PushInterrupt()
{
  std::scoped_lock lock(interruptMutex);
  if (interruptLevel == 0) {
    received = 0;
    previous = std::signal(SIGINT, Handler);
    if (previous == SIG_ERR) { previous = SIG_DFL; }
  }
  interruptLevel++;
}

void PopInterrupt()
{
  std::scoped_lock lock(interruptMutex);
  if (interruptLevel == 0) { return; }
  interruptLevel--;
  if (interruptLevel == 0) { std::signal(SIGINT, previous); }
}

auto InterruptReceived() -> bool { return received != 0; }

} // namespace nnf

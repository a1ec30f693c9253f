#include "iter.hpp"

#include "../log/log.hpp"
#include "../sys/signals.hpp"

namespace nnf::Iterating {

Scope::Scope() { PushInterrupt(); }

Scope::~Scope() { PopInterrupt(); }

auto ShouldStop(char const *name) -> bool
{
  if (InterruptReceived()) {
    Log::Print(name, "SIGINT received, halting iterations. Press Ctrl-C again to terminate now.");
    return true;
  } else {
    return false;
  }
}

} // namespace nnf::Iterating

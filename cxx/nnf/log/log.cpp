#include "log.hpp"

#include "fmt/chrono.h"

#include <atomic>
#include <mutex>

namespace nnf {
namespace Log {

namespace {
std::atomic<Display> displayLevel = Display::None;
std::mutex           logMutex;
std::FILE           *output = stderr;

auto TheTime() -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}
} // namespace

void SetDisplayLevel(Display const l)
{
  displayLevel = l;
  // Move the cursor one more line down so we don't erase command names etc.
  if (l == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto IsHigh() -> bool { return displayLevel == Display::High; }

auto Shows(Display const level) -> bool { return displayLevel >= level; }

void SetOutput(std::FILE *f)
{
  std::scoped_lock lock(logMutex);
  output = f ? f : stderr;
}

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<6}] {}", TheTime(), category, fmt::vformat(fmt, args));
}

void Emit(std::string const &s, fmt::text_style const style, Display const level)
{
  Display const current = displayLevel;
  if (current < level) { return; }
  std::scoped_lock lock(logMutex);
  if (current == Display::Ephemeral && output == stderr) { fmt::print(output, "\033[A\33[2K\r"); }
  fmt::print(output, style, "{}\n", s);
  std::fflush(output);
}

void End() { displayLevel = Display::None; }

Time Now() { return std::chrono::high_resolution_clock::now(); }

std::string ToNow(Log::Time const t1)
{
  using ms = std::chrono::milliseconds;
  auto const t2 = std::chrono::high_resolution_clock::now();
  auto const diff = std::chrono::duration_cast<ms>(t2 - t1).count();
  auto const mins = diff / (60 * 1000);
  auto const secs = diff % (60 * 1000) / 1000;
  auto const millis = diff % 1000;
  if (mins > 0) {
    return fmt::format("{} minute{} {} second{}", mins, mins > 1 ? "s" : "", secs, secs > 1 ? "s" : "");
  } else if (secs > 0) {
    return fmt::format("{}.{:03d} seconds", secs, millis);
  } else {
    return fmt::format("{} millisecond{}", diff, diff > 1 ? "s" : "");
  }
}

} // namespace Log
} // namespace nnf

#include "threads.hpp"

#include "../log/log.hpp"

#include <mutex>
#include <thread>

namespace {
std::unique_ptr<Eigen::ThreadPool> gp = nullptr;
std::mutex                         poolMutex;
} // namespace

namespace nnf {
namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *
{
  std::scoped_lock lock(poolMutex);
  if (gp == nullptr) {
    auto const nt = std::max(1U, std::thread::hardware_concurrency());
    Log::Debug("Thread", "Creating default thread pool with {} threads", nt);
    gp = std::make_unique<Eigen::ThreadPool>(nt);
  }
  return gp.get();
}

auto GlobalThreadCount() -> Index { return GlobalPool()->NumThreads(); }

void SetGlobalThreadCount(Index nt)
{
  if (nt < 1) { nt = std::max(1U, std::thread::hardware_concurrency()); }
  Log::Debug("Thread", "Creating thread pool with {} threads", nt);
  std::scoped_lock lock(poolMutex);
  gp = std::make_unique<Eigen::ThreadPool>(nt);
}

} // namespace Threads
} // namespace nnf

#include "nonneg.hpp"

#include "../algo/common.hpp"
#include "../log/log.hpp"
#include "../sys/threads.hpp"

namespace nnf::Proxs {

auto NonNeg::Make(Index const sz) -> Prox::Ptr { return std::make_shared<NonNeg>(sz); }

NonNeg::NonNeg(Index const sz_)
  : Prox(sz_)
{
}

auto NonNeg::apply(double const, Map x) const -> double
{
  Threads::ChunkFor(
    [&x](Index lo, Index hi) {
      for (Index ii = lo; ii < hi; ii++) {
        x[ii] = Cx(std::max(x[ii].real(), 0.), 0.);
      }
    },
    x.size());
  if (Log::IsHigh()) { Log::Debug("NonNeg", "|z| {:4.3E}", ParallelNorm(x)); }
  return 0.;
}

/* The constraint adds nothing to the objective */
auto NonNeg::value(CMap) const -> double { return 0.; }

} // namespace nnf::Proxs

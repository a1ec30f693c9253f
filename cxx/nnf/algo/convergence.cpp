#include "convergence.hpp"

#include "common.hpp"

namespace nnf::Convergence {

auto ToString(Reason const r) -> std::string
{
  switch (r) {
  case Reason::AbsObjective: return "ABS_OBJ";
  case Reason::RelObjective: return "REL_OBJ";
  case Reason::AbsX: return "ABS_X";
  case Reason::RelX: return "REL_X";
  case Reason::MaxIterations: return "MAX_IT";
  case Reason::Interrupted: return "INTERRUPTED";
  }
  throw Log::Failure("Convergence", "Unknown reason {}", static_cast<int>(r));
}

auto Measure(double const obj, double const prevObj, CxVector const &x, CxVector const &prevX) -> Deltas
{
  Deltas d;
  d.absObj = std::abs(obj - prevObj);
  if (obj > 0.) {
    d.relObj = d.absObj / obj;
  } else {
    d.relObj = d.absObj > 0. ? std::numeric_limits<double>::infinity() : 0.;
  }
  CxVector const dx = x - prevX;
  d.absX = ParallelNorm(dx);
  d.relX = d.absX / (ParallelNorm(x) + ε);
  return d;
}

auto Check(Deltas const &d, Index const iter, Tolerances const &tol) -> std::optional<Reason>
{
  if (d.absObj < ε) {
    return Reason::AbsObjective;
  } else if (d.relObj < tol.tolFun) {
    return Reason::RelObjective;
  } else if (d.absX < ε) {
    return Reason::AbsX;
  } else if (d.relX < tol.tolX) {
    return Reason::RelX;
  } else if (iter >= tol.imax) {
    return Reason::MaxIterations;
  } else {
    return std::nullopt;
  }
}

} // namespace nnf::Convergence

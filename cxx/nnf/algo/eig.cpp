#include "eig.hpp"

#include "common.hpp"
#include "iter.hpp"

#include <random>

namespace nnf {

auto PowerMethod(Ops::Op::Ptr A, double const tol, Index const iterLimit) -> PowerReturn
{
  if (!A) { throw Log::Failure("Power", "No operator supplied"); }
  if (iterLimit < 1) { throw Log::Failure("Power", "Requires at least 1 iteration"); }
  if (tol < 0.) { throw Log::Failure("Power", "Tolerance {} must not be negative", tol); }
  Log::Print("Power", "A'A [{}, {}] tolerance {}", A->rows(), A->cols(), tol);
  // One generator per call with a fixed seed
  std::mt19937                           gen(1729);
  std::uniform_real_distribution<double> uniform(-1., 1.);
  Ops::Op::Vector                        vec(A->cols());
  for (Index ii = 0; ii < vec.size(); ii++) {
    vec[ii] = Cx(uniform(gen), uniform(gen));
  }
  Ops::Op::Vector tmp(A->rows());
  double          val = ParallelNorm(vec);
  vec /= val;
  val = 0.;
  Index ii = 0;
  Iterating::Scope const scope;
  while (ii < iterLimit) {
    A->forward(vec, tmp);
    A->adjoint(tmp, vec);
    double const old = val;
    val = ParallelNorm(vec);
    ii++;
    if (val == 0.) {
      Log::Warn("Power", "Operator maps the current vector to zero");
      break;
    }
    vec /= val;
    double const δ = std::abs(val - old) / val;
    Log::Print("Power", "{} Eigenvalue {:4.3E} Δ {:4.3E}", ii, val, δ);
    if (δ < tol) { break; }
    if (Iterating::ShouldStop("Power")) { break; }
  }
  return {val, vec, ii};
}

auto EstimateLipschitz(Ops::Op::Ptr A, Ops::Op::Ptr At, double const tol, Index const iterLimit) -> double
{
  auto const [val, vec, its] = PowerMethod(Ops::WithAdjoint(A, At), tol, iterLimit);
  if (!std::isfinite(val) || val <= ε) {
    throw Log::Failure("Power", "Degenerate operator, largest eigenvalue estimate {} after {} iterations", val, its);
  }
  Log::Print("Power", "Lipschitz constant {:4.3E} after {} iterations", val, its);
  return val;
}

} // namespace nnf

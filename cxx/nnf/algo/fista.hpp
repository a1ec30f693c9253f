#pragma once

#include "../op/ops.hpp"
#include "../prox/prox.hpp"
#include "convergence.hpp"

#include <functional>

namespace nnf {

/*
 * Accelerated proximal gradient (FISTA) for
 *
 *   min 0.5|Ax - b|^2 + g(x)
 *
 * where the prox of g is supplied by P. The step size either comes from a backtracking line-search seeded from the
 * curvature along the first gradient, or is fixed at 1/L when a Lipschitz constant is given.
 */
struct FISTA
{
  using Op = Ops::Op;
  using Vector = typename Op::Vector;
  using CMap = typename Op::CMap;
  using Reason = Convergence::Reason;

  struct Opts
  {
    Index  imax = 100;
    double tolFun = 1.e-4;
    double tolX = 1.e-9;
    double L = 0.; // > 0 fixes the step at 1/L and disables backtracking
    double β = 0.9;
    Index  backtrackMax = 256;
    bool   verbose = false;
  };

  struct Record
  {
    Index               iter;
    double              resNorm, objective, majorizer, μ;
    Convergence::Deltas δ;
  };

  struct Result
  {
    ReVector x;
    Reason   reason;
    Index    iterations;
    double   objective;
  };

  using DbgFunc = std::function<void(Record const &, Vector const &)>;
  using StopFunc = std::function<bool()>;

  Op::Ptr          A;
  Proxs::Prox::Ptr P;
  Opts             opts;
  DbgFunc          debug = nullptr;
  StopFunc         cancel = nullptr;

  auto run(Vector const &b, ReVector const &x0 = ReVector()) const -> Result;
  auto run(CMap b, ReVector const &x0 = ReVector()) const -> Result;

private:
  auto initialStep(Vector const &grad) const -> double;
};

} // namespace nnf

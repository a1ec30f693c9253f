#include "fista.hpp"

#include "../log/log.hpp"
#include "common.hpp"
#include "iter.hpp"

#include <cmath>

namespace nnf {

auto FISTA::run(Vector const &b, ReVector const &x0) const -> Result { return run(CMap{b.data(), b.rows()}, x0); }

auto FISTA::initialStep(Vector const &grad) const -> double
{
  if (opts.L > 0.) { return 1. / opts.L; }
  double const ng = ParallelNorm(grad);
  if (ng == 0.) {
    Log::Print("FISTA", "Gradient is zero at the starting point");
    return 1.;
  }
  double const L = std::pow(ParallelNorm(A->forward(grad)) / ng, 2);
  if (!std::isfinite(L) || !(L > 0.)) { throw Log::Failure("FISTA", "Degenerate operator, curvature estimate {}", L); }
  return 1.9 / L;
}

auto FISTA::run(CMap b, ReVector const &x0) const -> Result
{
  if (!A) { throw Log::Failure("FISTA", "No operator supplied"); }
  if (!P) { throw Log::Failure("FISTA", "No proximal operator supplied"); }
  Index const rows = A->rows();
  Index const cols = A->cols();
  if (rows < 1 || cols < 1) { throw Log::Failure("FISTA", "Invalid operator size rows {} cols {}", rows, cols); }
  if (b.rows() != rows) { throw Log::Failure("FISTA", "b had size {} expected {}", b.rows(), rows); }
  if (P->sz != cols) { throw Log::Failure("FISTA", "Prox size {} does not match operator cols {}", P->sz, cols); }
  if (x0.size() && x0.size() != cols) { throw Log::Failure("FISTA", "x0 had size {} expected {}", x0.size(), cols); }
  if (opts.imax < 1) { throw Log::Failure("FISTA", "Requires at least 1 iteration"); }
  if (!(opts.tolFun >= 0.) || !(opts.tolX >= 0.)) {
    throw Log::Failure("FISTA", "Tolerances must be non-negative, had {} {}", opts.tolFun, opts.tolX);
  }
  if (!(opts.β > 0. && opts.β < 1.)) { throw Log::Failure("FISTA", "Backtracking factor {} must be in (0, 1)", opts.β); }
  if (!(opts.L >= 0.) || !std::isfinite(opts.L)) { throw Log::Failure("FISTA", "Invalid Lipschitz constant {}", opts.L); }
  bool const backtrack = opts.L == 0.;

  Vector xhat(cols), x(cols), xold(cols), grad(cols), Δ(cols), res(rows);
  double prevObj = 0.;
  if (x0.size()) {
    xhat = x0.cast<Cx>();
    A->forward(xhat, res);
    res -= b;
    prevObj = P->value(xhat);
  } else {
    xhat.setZero();
    res = -b;
  }
  A->adjoint(res, grad);
  double qfval = 0.5 * std::pow(ParallelNorm(res), 2);
  prevObj += qfval;
  double μ = initialStep(grad);
  Log::Print("FISTA", "{} μ {:4.3E} tolerances {:4.3E} {:4.3E} max iterations {}", backtrack ? "Backtracking" : "Constant step",
             μ, opts.tolFun, opts.tolX, opts.imax);

  struct Eval
  {
    double q, obj, r;
  };
  /* Gradient step from xhat, prox, then the quadratic majorizer and true objective at the new point */
  auto step = [&](double const τ) -> Eval {
    x = xhat - τ * grad;
    double const pen = P->apply(τ, x);
    Δ = x - xhat;
    double const q = qfval + RealDot(Δ, grad) + 0.5 / τ * std::pow(ParallelNorm(Δ), 2) + pen;
    A->forward(x, res);
    res -= b;
    double const r = ParallelNorm(res);
    return {q, 0.5 * r * r + pen, r};
  };

  xold = xhat;
  double                told = 1.;
  Index                 ii = 1;
  Eval                  e;
  std::optional<Reason> reason;
  auto const header = "IT |Ax-b|     Objective Δobj      Rel       |Δx|      Rel       μ";
  if (opts.verbose) {
    Log::Always("FISTA", "{}", header);
  } else {
    Log::Debug("FISTA", "{}", header);
  }
  Iterating::Scope const scope;
  while (true) {
    e = step(μ);
    if (backtrack) {
      Index nb = 0;
      while (e.obj > e.q) {
        if (nb == opts.backtrackMax) {
          Log::Warn("FISTA", "Accepting step after {} reductions, μ {:4.3E} objective {} majorizer {}", nb, μ, e.obj, e.q);
          break;
        }
        μ *= opts.β;
        e = step(μ);
        nb++;
      }
    }

    auto const   δ = Convergence::Measure(e.obj, prevObj, x, xold);
    Record const rec{ii, e.r, e.obj, e.q, μ, δ};
    if (debug) { debug(rec, x); }
    if (opts.verbose || Log::Shows(Log::Display::High)) {
      auto const line = fmt::format("{:02d} {:4.3E} {:4.3E} {:4.3E} {:4.3E} {:4.3E} {:4.3E} {:4.3E}", ii, e.r, e.obj,
                                    δ.absObj, δ.relObj, δ.absX, δ.relX, μ);
      if (opts.verbose) {
        Log::Always("FISTA", "{}", line);
      } else {
        Log::Debug("FISTA", "{}", line);
      }
    }

    if ((reason = Convergence::Check(δ, ii, {opts.tolFun, opts.tolX, opts.imax}))) { break; }
    if (Iterating::ShouldStop("FISTA") || (cancel && cancel())) {
      reason = Reason::Interrupted;
      break;
    }

    double const t = 0.5 * (1. + std::sqrt(1. + 4. * told * told));
    xhat = x + ((told - 1.) / t) * (x - xold);
    A->forward(xhat, res);
    res -= b;
    A->adjoint(res, grad);

    ii++;
    prevObj = e.obj;
    xold = x;
    told = t;
    qfval = 0.5 * std::pow(ParallelNorm(res), 2);
  }
  Log::Print("FISTA", "Stopping criterion {} after {} iterations, objective {:4.3E}", Convergence::ToString(*reason), ii, e.obj);
  return {x.real(), *reason, ii, e.obj};
}

} // namespace nnf

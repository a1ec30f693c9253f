#include "nnls.hpp"

#include "../prox/group-l1.hpp"
#include "../prox/nonneg.hpp"

namespace nnf {

auto NNLS(ReVector const &y, Ops::Op::Ptr A, Ops::Op::Ptr At, FISTA::Opts const &opts, ReVector const &x0,
          FISTA::DbgFunc const &debug) -> FISTA::Result
{
  auto const op = Ops::WithAdjoint(A, At);
  Log::Print("NNLS", "Operator [{}, {}]", op->rows(), op->cols());
  FISTA fista{op, Proxs::NonNeg::Make(op->cols()), opts, debug};
  fista.opts.L = 0.;
  CxVector const b = y.cast<Cx>();
  return fista.run(b, x0);
}

auto NNLSConstantStep(ReVector const &y, Ops::Op::Ptr A, double const L, Ops::Op::Ptr At, FISTA::Opts const &opts,
                      ReVector const &x0, FISTA::DbgFunc const &debug) -> FISTA::Result
{
  if (!std::isfinite(L) || !(L > ε)) { throw Log::Failure("NNLS", "Lipschitz constant {} must be positive", L); }
  auto const op = Ops::WithAdjoint(A, At);
  Log::Print("NNLS", "Operator [{}, {}] L {:4.3E}", op->rows(), op->cols(), L);
  FISTA fista{op, Proxs::NonNeg::Make(op->cols()), opts, debug};
  fista.opts.L = L;
  CxVector const b = y.cast<Cx>();
  return fista.run(b, x0);
}

auto NNGroupLasso(ReVector const         &y,
                  Ops::Op::Ptr            A,
                  double const            λ1,
                  double const            λ2,
                  double const            λ3,
                  Proxs::Partition const &partition,
                  Ops::Op::Ptr            At,
                  FISTA::Opts const      &opts,
                  ReVector const         &x0,
                  FISTA::DbgFunc const   &debug) -> FISTA::Result
{
  auto const op = Ops::WithAdjoint(A, At);
  if (partition.size() != op->cols()) {
    throw Log::Failure("NNGL", "Partition covers {} coefficients, operator has {}", partition.size(), op->cols());
  }
  Log::Print("NNGL", "Operator [{}, {}]", op->rows(), op->cols());
  FISTA fista{op, Proxs::GroupL1L1::Make(λ1, λ2, λ3, partition), opts, debug};
  fista.opts.L = 0.;
  CxVector const b = y.cast<Cx>();
  return fista.run(b, x0);
}

} // namespace nnf

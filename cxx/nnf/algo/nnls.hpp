#pragma once

#include "../prox/partition.hpp"
#include "eig.hpp"
#include "fista.hpp"

namespace nnf {

/* min 0.5|y - Ax|^2 s.t. x >= 0 with backtracking. At may be null, in which case A's own adjoint is used. */
auto NNLS(ReVector const        &y,
          Ops::Op::Ptr           A,
          Ops::Op::Ptr           At = nullptr,
          FISTA::Opts const     &opts = FISTA::Opts(),
          ReVector const        &x0 = ReVector(),
          FISTA::DbgFunc const  &debug = nullptr) -> FISTA::Result;

/* As NNLS but with the step fixed at 1/L, for instance with L from EstimateLipschitz */
auto NNLSConstantStep(ReVector const       &y,
                      Ops::Op::Ptr          A,
                      double const          L,
                      Ops::Op::Ptr          At = nullptr,
                      FISTA::Opts const    &opts = FISTA::Opts(),
                      ReVector const       &x0 = ReVector(),
                      FISTA::DbgFunc const &debug = nullptr) -> FISTA::Result;

/*
 * min 0.5|y - Ax|^2 + λ1 Σ w_k |x_k|_2 + λ2 |x_a|_1 + λ3 |x_b|_1 s.t. x >= 0
 *
 * with the groups, flat regions and weights w taken from the partition.
 */
auto NNGroupLasso(ReVector const       &y,
                  Ops::Op::Ptr          A,
                  double const          λ1,
                  double const          λ2,
                  double const          λ3,
                  Proxs::Partition const &partition,
                  Ops::Op::Ptr          At = nullptr,
                  FISTA::Opts const    &opts = FISTA::Opts(),
                  ReVector const       &x0 = ReVector(),
                  FISTA::DbgFunc const &debug = nullptr) -> FISTA::Result;

} // namespace nnf

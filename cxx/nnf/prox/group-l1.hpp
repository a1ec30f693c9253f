#pragma once

#include "partition.hpp"
#include "prox.hpp"

namespace nnf::Proxs {

/*
 * Non-negative group-L2,1 + L1 + L1, i.e.
 *
 *   g(x) = λ1 Σ w_k |x_k|_2 + λ2 |x_a|_1 + λ3 |x_b|_1  s.t. x >= 0
 *
 * over the groups and two flat regions of a Partition.
 */
struct GroupL1L1 final : Prox
{
  PROX_INHERIT

  /* Unweighted bookkeeping values. group is Σ w_k |z_k| after thresholding, a and b are the L1 norms of the flat
   * regions before thresholding. */
  struct Terms
  {
    double group, a, b;
  };

  double    λ1, λ2, λ3;
  Partition partition;

  static auto Make(double const λ1, double const λ2, double const λ3, Partition const &p) -> std::shared_ptr<GroupL1L1>;
  GroupL1L1(double const λ1, double const λ2, double const λ3, Partition const &p);

  auto terms(double const α, Map x) const -> Terms;
  auto terms(double const α, Vector &x) const -> Terms;
  auto apply(double const α, Map x) const -> double;
  auto value(CMap x) const -> double;
};

} // namespace nnf::Proxs

#pragma once

#include "prox.hpp"

namespace nnf::Proxs {

/* Projection onto the non-negative orthant. Any imaginary part is discarded first. */
struct NonNeg final : Prox
{
  PROX_INHERIT
  static auto Make(Index const sz) -> Prox::Ptr;
  NonNeg(Index const sz);

  auto apply(double const α, Map x) const -> double;
  auto value(CMap x) const -> double;
};

} // namespace nnf::Proxs

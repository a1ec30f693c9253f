#pragma once

#include "../types.hpp"

namespace nnf::Proxs {

/*
 * Proximal operator of α·g(x) where g contains the non-negativity constraint. apply() works in place and returns the
 * penalty the solver books against the new point (zero for a pure constraint).
 */
struct Prox
{
  using Vector = CxVector;
  using Map = Eigen::Map<Vector>;
  using CMap = Eigen::Map<Vector const>;
  using Ptr = std::shared_ptr<Prox>;

  Prox(Index const sz);

  auto         apply(double const α, Vector &x) const -> double;
  virtual auto apply(double const α, Map x) const -> double = 0;

  /* g(x) itself */
  auto         value(Vector const &x) const -> double;
  virtual auto value(CMap x) const -> double = 0;

  virtual ~Prox() {};

  Index sz;
};

#define PROX_INHERIT                                                                                                           \
  using Vector = typename Prox::Vector;                                                                                        \
  using Map = typename Prox::Map;                                                                                              \
  using CMap = typename Prox::CMap;                                                                                            \
  using Ptr = Prox::Ptr;                                                                                                       \
  using Prox::apply;                                                                                                           \
  using Prox::value;

} // namespace nnf::Proxs

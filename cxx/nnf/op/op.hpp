#pragma once

#include "../log/log.hpp"
#include "../types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace nnf::Ops {

/*
 * A linear operator A from a coefficient space of size cols() to a measurement space of size rows().
 * Implementations must be free of side effects so a single operator can be shared between solves.
 */
struct Op
{
  using Vector = CxVector;
  using Map = Eigen::Map<Vector>;
  using CMap = Eigen::Map<Vector const>;
  using Ptr = std::shared_ptr<Op>;

  std::string name;
  Op(std::string const &n);
  virtual ~Op() = default;

  virtual auto rows() const -> Index = 0;
  virtual auto cols() const -> Index = 0;

  /* y = s * A x and x = s * A' y */
  virtual void forward(CMap x, Map y, double const s = 1.) const = 0;
  virtual void adjoint(CMap y, Map x, double const s = 1.) const = 0;
  virtual auto forward(Vector const &x, double const s = 1.) const -> Vector;
  virtual auto adjoint(Vector const &y, double const s = 1.) const -> Vector;
  void         forward(Vector const &x, Vector &y, double const s = 1.) const;
  void         adjoint(Vector const &y, Vector &x, double const s = 1.) const;

protected:
  auto startForward(CMap x, Map const &y) const -> Log::Time;
  void finishForward(Map const &y, Log::Time const start) const;
  auto startAdjoint(CMap y, Map const &x) const -> Log::Time;
  void finishAdjoint(Map const &x, Log::Time const start) const;
};

#define OP_INHERIT                                                                                                             \
  using typename Op::Vector;                                                                                                   \
  using typename Op::Map;                                                                                                      \
  using typename Op::CMap;                                                                                                     \
  using typename Op::Ptr;                                                                                                      \
  using Op::forward;                                                                                                           \
  using Op::adjoint;                                                                                                           \
  auto rows() const -> Index final;                                                                                            \
  auto cols() const -> Index final;

} // namespace nnf::Ops

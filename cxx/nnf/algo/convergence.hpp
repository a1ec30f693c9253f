#pragma once

#include "../types.hpp"

#include <optional>
#include <string>

namespace nnf::Convergence {

enum struct Reason
{
  AbsObjective = 0,
  RelObjective,
  AbsX,
  RelX,
  MaxIterations,
  Interrupted
};

auto ToString(Reason const r) -> std::string;

struct Tolerances
{
  double tolFun;
  double tolX;
  Index  imax;
};

struct Deltas
{
  double absObj, relObj, absX, relX;
};

auto Measure(double const obj, double const prevObj, CxVector const &x, CxVector const &prevX) -> Deltas;

/* Criteria are tested in a fixed order and the first one met wins */
auto Check(Deltas const &d, Index const iter, Tolerances const &tol) -> std::optional<Reason>;

} // namespace nnf::Convergence

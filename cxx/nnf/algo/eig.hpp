#pragma once

#include "../op/ops.hpp"

namespace nnf {

struct PowerReturn
{
  double         val;
  Ops::Op::Vector vec;
  Index          its;
};

/*
 * Power iteration on A'A. Stops when the relative change of the eigenvalue estimate drops below tol, or after
 * iterLimit iterations.
 */
auto PowerMethod(Ops::Op::Ptr A, double const tol, Index const iterLimit) -> PowerReturn;

/* Largest eigenvalue of A'A, i.e. the Lipschitz constant of the gradient of 0.5|Ax - y|^2 */
auto EstimateLipschitz(Ops::Op::Ptr A, Ops::Op::Ptr At = nullptr, double const tol = 1.e-6, Index const iterLimit = 100)
  -> double;

} // namespace nnf

#pragma once

// Intellisense gives false positives with Eigen+ARM
#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>

#include <complex>
#include <limits>
#include <memory>

using Index = Eigen::Index;

namespace nnf {

using Cx = std::complex<double>;

using CxVector = Eigen::Vector<Cx, Eigen::Dynamic>;
using ReVector = Eigen::VectorXd;

/* Smallest difference the convergence tests and guards care about */
constexpr double ε = std::numeric_limits<double>::epsilon();

} // namespace nnf

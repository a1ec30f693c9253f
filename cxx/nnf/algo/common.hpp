#pragma once

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "../types.hpp"

namespace nnf {

template <typename T> inline auto PairwiseDot(T const &x1, T const &x2, Index const st, Index const sz) -> typename T::Scalar
{
  if (sz < 128) {
    return x1.segment(st, sz).dot(x2.segment(st, sz));
  } else {
    auto const mid = sz / 2;
    return PairwiseDot(x1, x2, st, mid) + PairwiseDot(x1, x2, st + mid, sz - mid);
  }
}

template <typename Derived>
inline auto ParallelDot(Eigen::MatrixBase<Derived> const &x1, Eigen::MatrixBase<Derived> const &x2) ->
  typename Eigen::MatrixBase<Derived>::Scalar
{
  using Scalar = typename Eigen::MatrixBase<Derived>::Scalar;
  if (x1.size() != x2.size()) { throw Log::Failure("Algo", "Dot product vectors had size {} and {}", x1.size(), x2.size()); }
  auto const sz = x1.size();
  if (sz == 0) {
    return Scalar(0);
  } else {
    Index const                         nT = Threads::GlobalThreadCount();
    Index const                         nC = std::min<Index>(sz, nT);
    Index const                         den = sz / nC;
    Index const                         rem = sz % nC;
    Eigen::Barrier                      barrier(nC);
    Eigen::Vector<Scalar, Eigen::Dynamic> partials(nC);
    for (Index ic = 0; ic < nC; ic++) {
      Index const lo = ic * den + std::min(ic, rem);
      Index const hi = (ic + 1) * den + std::min(ic + 1, rem);
      Index const n = hi - lo;
      Threads::GlobalPool()->Schedule([&x1, &x2, &barrier, &partials, ic, lo, n] {
        partials(ic) = PairwiseDot(x1.derived(), x2.derived(), lo, n);
        barrier.Notify();
      });
    }
    barrier.Wait();
    return partials.sum();
  }
}

/* Real part of <x1, x2>, which is all the line-search ever needs */
template <typename Derived>
inline auto RealDot(Eigen::MatrixBase<Derived> const &x1, Eigen::MatrixBase<Derived> const &x2) ->
  typename Eigen::MatrixBase<Derived>::RealScalar
{
  auto const dot = ParallelDot(x1, x2);
  if (!std::isfinite(std::real(dot))) { throw Log::Failure("Algo", "Dot product was not finite."); }
  return std::real(dot);
}

template <typename Derived>
inline auto ParallelNorm(Eigen::MatrixBase<Derived> const &v) -> typename Eigen::MatrixBase<Derived>::RealScalar
{
  using RealScalar = typename Eigen::MatrixBase<Derived>::RealScalar;
  Index const nT = Threads::GlobalThreadCount();
  if (v.rows() == 0) {
    return RealScalar(0);
  } else {
    Index const nC = std::min<Index>(v.size(), nT);
    Index const den = v.size() / nC;
    Index const rem = v.size() % nC;

    Eigen::Vector<RealScalar, Eigen::Dynamic> norms(nC);
    Eigen::Barrier                            barrier(nC);

    for (Index ic = 0; ic < nC; ic++) {
      Index const lo = ic * den + std::min(ic, rem);
      Index const hi = (ic + 1) * den + std::min(ic + 1, rem);
      Index const n = hi - lo;
      Threads::GlobalPool()->Schedule([&v, &norms, &barrier, ic, lo, n] {
        norms[ic] = v.segment(lo, n).stableNorm();
        barrier.Notify();
      });
    }
    barrier.Wait();

    return norms.norm();
  }
}

} // namespace nnf

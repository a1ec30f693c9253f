#include "partition.hpp"

#include "../log/log.hpp"

#include <numeric>

namespace nnf::Proxs {

Partition::Partition(std::vector<Index> const &b, Eigen::ArrayXd const &w, Index const sz)
  : bounds{b}
  , weights{w}
{
  if (bounds.size() < 3) { throw Log::Failure("Partition", "Need at least 3 boundaries, had {}", bounds.size()); }
  if (bounds.front() != 0) { throw Log::Failure("Partition", "First boundary was {}, must be 0", bounds.front()); }
  for (size_t ii = 1; ii < bounds.size(); ii++) {
    if (bounds[ii] <= bounds[ii - 1]) {
      throw Log::Failure("Partition", "Boundaries must be strictly increasing, {} followed by {} at {}", bounds[ii - 1],
                         bounds[ii], ii);
    }
  }
  if (bounds.back() != sz) { throw Log::Failure("Partition", "Last boundary {} does not match vector size {}", bounds.back(), sz); }
  if (weights.size() != groups()) {
    throw Log::Failure("Partition", "Had {} weights for {} groups", weights.size(), groups());
  }
  if ((weights < 0.).any() || !weights.allFinite()) { throw Log::Failure("Partition", "Group weights must be finite and non-negative"); }
  Log::Debug("Partition", "{} groups, flat regions [{}, {}) [{}, {})", groups(), startA(), startB(), startB(), size());
}

auto Partition::FromSizes(std::vector<Index> const &groupSizes, Index const nA, Index const nB, Eigen::ArrayXd const &w)
  -> Partition
{
  std::vector<Index> b(groupSizes.size() + 1);
  b[0] = 0;
  std::partial_sum(groupSizes.cbegin(), groupSizes.cend(), b.begin() + 1);
  b.push_back(b.back() + nA);
  b.push_back(b.back() + nB);
  return Partition(b, w, b.back());
}

auto Partition::size() const -> Index { return bounds.back(); }
auto Partition::groups() const -> Index { return bounds.size() - 3; }
auto Partition::groupStart(Index const k) const -> Index { return bounds[k]; }
auto Partition::groupSize(Index const k) const -> Index { return bounds[k + 1] - bounds[k]; }
auto Partition::weight(Index const k) const -> double { return weights[k]; }
auto Partition::startA() const -> Index { return bounds[bounds.size() - 3]; }
auto Partition::sizeA() const -> Index { return startB() - startA(); }
auto Partition::startB() const -> Index { return bounds[bounds.size() - 2]; }
auto Partition::sizeB() const -> Index { return size() - startB(); }

} // namespace nnf::Proxs

#pragma once

#include "../types.hpp"

#include <vector>

namespace nnf::Proxs {

/*
 * Splits a coefficient vector into contiguous groups followed by two flat regions. The boundaries start at 0 and are
 * strictly increasing. The last three mark the end of the groups (start of the first flat region), the start of the
 * second flat region, and the end of the vector.
 */
struct Partition
{
  Partition(std::vector<Index> const &bounds, Eigen::ArrayXd const &weights, Index const size);

  /* Convenience for building boundaries from sizes */
  static auto FromSizes(std::vector<Index> const &groupSizes, Index const sizeA, Index const sizeB, Eigen::ArrayXd const &weights)
    -> Partition;

  auto size() const -> Index;
  auto groups() const -> Index;
  auto groupStart(Index const k) const -> Index;
  auto groupSize(Index const k) const -> Index;
  auto weight(Index const k) const -> double;
  auto startA() const -> Index;
  auto sizeA() const -> Index;
  auto startB() const -> Index;
  auto sizeB() const -> Index;

  std::vector<Index> bounds;
  Eigen::ArrayXd     weights;
};

} // namespace nnf::Proxs

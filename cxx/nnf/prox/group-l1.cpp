#include "group-l1.hpp"

#include "../algo/common.hpp"
#include "../log/log.hpp"
#include "../sys/threads.hpp"

namespace nnf::Proxs {

auto GroupL1L1::Make(double const λ1, double const λ2, double const λ3, Partition const &p) -> std::shared_ptr<GroupL1L1>
{
  return std::make_shared<GroupL1L1>(λ1, λ2, λ3, p);
}

GroupL1L1::GroupL1L1(double const l1, double const l2, double const l3, Partition const &p)
  : Prox(p.size())
  , λ1{l1}
  , λ2{l2}
  , λ3{l3}
  , partition{p}
{
  if (!(λ1 >= 0.) || !(λ2 >= 0.) || !(λ3 >= 0.)) {
    throw Log::Failure("GroupL1L1", "Regularization weights must be non-negative, had {} {} {}", λ1, λ2, λ3);
  }
  Log::Print("GroupL1L1", "λ {} {} {} groups {} flat {} {}", λ1, λ2, λ3, partition.groups(), partition.sizeA(),
             partition.sizeB());
}

auto GroupL1L1::terms(double const α, Vector &x) const -> Terms
{
  if (x.size() != sz) { throw Log::Failure("GroupL1L1", "x size {} did not match {}", x.size(), sz); }
  return terms(α, Map(x.data(), sz));
}

auto GroupL1L1::terms(double const α, Map x) const -> Terms
{
  double const t1 = α * λ1;
  double const t2 = α * λ2;
  double const t3 = α * λ3;

  Index const     nG = partition.groups();
  Eigen::ArrayXd  T(nG);
  Threads::ChunkFor(
    [&](Index lo, Index hi) {
      for (Index ig = lo; ig < hi; ig++) {
        auto xg = x.segment(partition.groupStart(ig), partition.groupSize(ig));
        xg = xg.real().cwiseMax(0.).cast<Cx>();
        double norm = xg.norm();
        T[ig] = std::max(norm - t1 * partition.weight(ig), 0.);
        if (norm == 0.) { norm = std::numeric_limits<double>::denorm_min(); }
        xg *= T[ig] / norm;
      }
    },
    nG);

  auto xa = x.segment(partition.startA(), partition.sizeA());
  xa = xa.real().cwiseMax(0.).cast<Cx>();
  double const l1a = xa.real().sum();
  xa = (xa.real().array() - t2).max(0.).matrix().cast<Cx>();

  auto xb = x.segment(partition.startB(), partition.sizeB());
  xb = xb.real().cwiseMax(0.).cast<Cx>();
  double const l1b = xb.real().sum();
  xb = (xb.real().array() - t3).max(0.).matrix().cast<Cx>();

  Terms const τ{(partition.weights * T).sum(), l1a, l1b};
  Log::Debug("GroupL1L1", "α {:4.3E} t {:4.3E} {:4.3E} {:4.3E} group {:4.3E} |a| {:4.3E} |b| {:4.3E}", α, t1, t2, t3, τ.group,
             τ.a, τ.b);
  return τ;
}

auto GroupL1L1::apply(double const α, Map x) const -> double
{
  auto const τ = terms(α, x);
  return λ1 * τ.group + λ2 * τ.a + λ3 * τ.b;
}

auto GroupL1L1::value(CMap x) const -> double
{
  double group = 0.;
  for (Index ig = 0; ig < partition.groups(); ig++) {
    group += partition.weight(ig) * x.segment(partition.groupStart(ig), partition.groupSize(ig)).norm();
  }
  double const l1a = x.segment(partition.startA(), partition.sizeA()).cwiseAbs().sum();
  double const l1b = x.segment(partition.startB(), partition.sizeB()).cwiseAbs().sum();
  return λ1 * group + λ2 * l1a + λ3 * l1b;
}

} // namespace nnf::Proxs

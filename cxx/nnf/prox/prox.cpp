#include "prox.hpp"

#include "../log/log.hpp"

namespace nnf::Proxs {

Prox::Prox(Index const s)
  : sz{s}
{
}

auto Prox::apply(double const α, Vector &x) const -> double
{
  if (x.size() != sz) { throw Log::Failure("Prox", "x size {} did not match {}", x.size(), sz); }
  Map xm(x.data(), sz);
  return this->apply(α, xm);
}

auto Prox::value(Vector const &x) const -> double
{
  if (x.size() != sz) { throw Log::Failure("Prox", "x size {} did not match {}", x.size(), sz); }
  return this->value(CMap(x.data(), sz));
}

} // namespace nnf::Proxs

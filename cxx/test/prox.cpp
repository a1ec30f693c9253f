#include "nnf/prox/group-l1.hpp"
#include "nnf/prox/nonneg.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace nnf;
using namespace Catch;

TEST_CASE("NonNeg", "[prox]")
{
  auto     prox = Proxs::NonNeg::Make(4);
  CxVector x(4);
  x << Cx(-1., 2.), Cx(3., -1.), Cx(0., 5.), Cx(0.5, 0.);
  CHECK(prox->apply(1., x) == 0.);
  CHECK(x[0] == Cx(0., 0.));
  CHECK(x[1] == Cx(3., 0.));
  CHECK(x[2] == Cx(0., 0.));
  CHECK(x[3] == Cx(0.5, 0.));
  CHECK(prox->value(x) == 0.);

  CxVector wrong(3);
  CHECK_THROWS_AS(prox->apply(1., wrong), Log::Failure);
}

TEST_CASE("GroupL1L1", "[prox]")
{
  Eigen::ArrayXd w(1);
  w << 2.;
  auto const       partition = Proxs::Partition::FromSizes({3}, 1, 1, w);
  Proxs::GroupL1L1 prox(0.5, 0.3, 0.1, partition);

  SECTION("Shrinkage")
  {
    CxVector x(5);
    x << 3., 4., 0., 1., 0.05;
    auto const terms = prox.terms(1., x);
    INFO("x " << x.transpose());
    CHECK(x[0].real() == Approx(2.4));
    CHECK(x[1].real() == Approx(3.2));
    CHECK(x[2].real() == Approx(0.).margin(1.e-15));
    CHECK(x[3].real() == Approx(0.7));
    CHECK(x[4].real() == Approx(0.).margin(1.e-15));
    CHECK(x.imag().cwiseAbs().maxCoeff() == 0.);
    CHECK(terms.group == Approx(8.));
    CHECK(terms.a == Approx(1.));
    CHECK(terms.b == Approx(0.05));
  }

  SECTION("Weighted penalty")
  {
    CxVector x(5);
    x << 3., 4., 0., 1., 0.05;
    CHECK(prox.apply(1., x) == Approx(0.5 * 8. + 0.3 * 1. + 0.1 * 0.05));
    CHECK(prox.value(x) == Approx(0.5 * 2. * 4. + 0.3 * 0.7));
  }

  SECTION("Projection before the group norm")
  {
    CxVector x(5);
    x << -3., 4., 0., -1., 0.;
    prox.apply(1., x);
    CHECK(x[0].real() == 0.);
    CHECK(x[1].real() == Approx(3.));
    CHECK(x[3].real() == 0.);
  }

  SECTION("Zeroed groups")
  {
    CxVector x(5);
    x << 0.1, -0.2, 0.1, 0., 0.;
    auto const terms = prox.terms(1., x);
    CHECK(x.norm() == 0.);
    CHECK(terms.group == 0.);

    x.setZero();
    prox.apply(1., x);
    CHECK(x.allFinite());
    CHECK(x.norm() == 0.);
  }

  SECTION("Step scales thresholds")
  {
    CxVector x(5);
    x << 3., 4., 0., 1., 0.05;
    prox.apply(0.5, x);
    CHECK(x.segment(0, 3).norm() == Approx(4.5));
    CHECK(x[3].real() == Approx(0.85));
    CHECK(x[4].real() == Approx(0.).margin(1.e-15));
  }

  SECTION("Zero regularization is projection")
  {
    Proxs::GroupL1L1 proj(0., 0., 0., partition);
    CxVector         x(5);
    x << -1., 2., Cx(3., 1.), -0.5, 0.25;
    CHECK(proj.apply(1., x) == 0.);
    CHECK(x[0].real() == 0.);
    CHECK(x[1].real() == Approx(2.));
    CHECK(x[2].real() == Approx(3.));
    CHECK(x[2].imag() == 0.);
    CHECK(x[3].real() == 0.);
    CHECK(x[4].real() == Approx(0.25));
  }

  SECTION("Invalid")
  {
    CHECK_THROWS_AS(Proxs::GroupL1L1(-1., 0., 0., partition), Log::Failure);
    CxVector wrong(4);
    CHECK_THROWS_AS(prox.apply(1., wrong), Log::Failure);
  }
}

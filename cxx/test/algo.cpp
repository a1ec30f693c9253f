#include "nnf/algo/eig.hpp"
#include "nnf/algo/nnls.hpp"
#include "nnf/prox/group-l1.hpp"
#include "nnf/prox/nonneg.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <cstdio>
#include <thread>

using namespace nnf;
using namespace Catch;

namespace {
/* Well conditioned and full column rank, A'A = I + 0.04 R'R */
auto TallOp(Index const N, Index const extra) -> Eigen::MatrixXd
{
  Eigen::MatrixXd A(N + extra, N);
  A.topRows(N).setIdentity();
  A.bottomRows(extra) = 0.2 * Eigen::MatrixXd::Random(extra, N);
  return A;
}

/* Wraps another operator and fails on the nth forward application */
struct FailingOp final : Ops::Op
{
  OP_INHERIT

  FailingOp(Ptr o, Index const n)
    : Op("Failing")
    , op{o}
    , failAt{n}
  {
  }

  void forward(CMap x, Map y, double const s = 1.) const
  {
    if (++calls == failAt) { throw Log::Failure(name, "Forward {} failed", failAt); }
    op->forward(x, y, s);
  }

  void adjoint(CMap y, Map x, double const s = 1.) const { op->adjoint(y, x, s); }

  Ptr           op;
  Index         failAt;
  mutable Index calls = 0;
};

auto FailingOp::rows() const -> Index { return op->rows(); }
auto FailingOp::cols() const -> Index { return op->cols(); }

auto CountLines(std::FILE *f) -> Index
{
  std::rewind(f);
  Index lines = 0;
  for (int c = std::fgetc(f); c != EOF; c = std::fgetc(f)) {
    if (c == '\n') { lines++; }
  }
  std::fseek(f, 0, SEEK_END);
  return lines;
}
} // namespace

TEST_CASE("NNLS", "[alg]")
{
  SECTION("Identity")
  {
    ReVector y(2);
    y << 2., 0.;
    auto const r = NNLS(y, Ops::Identity::Make(2));
    INFO("x " << r.x.transpose() << " its " << r.iterations);
    CHECK((r.reason == Convergence::Reason::AbsObjective || r.reason == Convergence::Reason::RelObjective));
    CHECK(r.x[0] == Approx(2.).margin(1.e-4));
    CHECK(r.x[1] == Approx(0.).margin(1.e-4));
    CHECK(r.iterations < 100);
  }

  SECTION("Zero data")
  {
    Eigen::MatrixXd const A = Eigen::MatrixXd::Random(6, 4);
    auto const            r = NNLS(ReVector::Zero(6), Ops::MatMul::Make(A));
    CHECK(r.reason == Convergence::Reason::AbsObjective);
    CHECK(r.iterations == 1);
    CHECK(r.x.norm() == 0.);
    CHECK(r.objective == 0.);
  }

  Index const           M = 20, N = 10;
  Eigen::MatrixXd const mat = Eigen::MatrixXd::Random(M, N);
  auto const            A = Ops::MatMul::Make(mat);
  ReVector const        y = ReVector::Random(M);

  // FISTA does not decrease the objective monotonically, so the monotone decrease property is checked through the
  // line-search guarantee it rests on: every accepted objective lies under its quadratic majorizer.
  SECTION("Feasible iterates under the majorizer")
  {
    std::vector<FISTA::Record> records;
    bool                       feasible = true;
    FISTA::Opts                opts;
    opts.imax = 200;
    auto const r = NNLS(y, A, nullptr, opts, ReVector(), [&](FISTA::Record const &rec, CxVector const &x) {
      records.push_back(rec);
      if (x.real().minCoeff() < 0. || x.imag().cwiseAbs().maxCoeff() != 0.) { feasible = false; }
    });
    CHECK(feasible);
    CHECK(records.size() == static_cast<size_t>(r.iterations));
    for (auto const &rec : records) {
      INFO("Iteration " << rec.iter);
      CHECK(rec.objective <= rec.majorizer);
      CHECK(rec.μ > 0.);
    }
    CHECK(r.x.minCoeff() >= 0.);
  }

  SECTION("Optimality")
  {
    FISTA::Opts opts;
    opts.imax = 5000;
    opts.tolFun = 1.e-14;
    opts.tolX = 0.;
    auto const     r = NNLS(y, A, nullptr, opts);
    ReVector const g = mat.transpose() * (mat * r.x - y);
    INFO("x " << r.x.transpose() << "\ng " << g.transpose());
    for (Index ii = 0; ii < N; ii++) {
      if (r.x[ii] > 1.e-6) {
        CHECK(g[ii] == Approx(0.).margin(1.e-4));
      } else {
        CHECK(g[ii] > -1.e-4);
      }
    }
  }

  SECTION("Max iterations")
  {
    FISTA::Opts opts;
    opts.imax = 1;
    auto const r = NNLS(y, A, nullptr, opts);
    CHECK(r.reason == Convergence::Reason::MaxIterations);
    CHECK(r.iterations == 1);
    CHECK(r.x.minCoeff() >= 0.);
  }

  SECTION("Invalid arguments")
  {
    FISTA::Opts opts;
    CHECK_THROWS_AS(NNLS(ReVector::Zero(M + 1), A), Log::Failure);
    CHECK_THROWS_AS(NNLS(y, A, nullptr, opts, ReVector::Zero(N + 1)), Log::Failure);
    CHECK_THROWS_AS(NNLS(y, A, Ops::MatMul::Make(mat)), Log::Failure);
    opts.imax = 0;
    CHECK_THROWS_AS(NNLS(y, A, nullptr, opts), Log::Failure);
    opts.imax = 10;
    opts.β = 1.;
    CHECK_THROWS_AS(NNLS(y, A, nullptr, opts), Log::Failure);
    CHECK_THROWS_AS(NNLSConstantStep(y, A, 0.), Log::Failure);
  }

  SECTION("Cancellation")
  {
    FISTA fista{A, Proxs::NonNeg::Make(N), FISTA::Opts()};
    fista.cancel = [] { return true; };
    CxVector const b = y.cast<Cx>();
    auto const     r = fista.run(b);
    CHECK(r.reason == Convergence::Reason::Interrupted);
    CHECK(r.iterations == 1);
    CHECK(r.x.minCoeff() >= 0.);
  }

  SECTION("Concurrent solves")
  {
    FISTA::Opts opts;
    opts.imax = 50;
    auto const                 serial = NNLS(y, A, nullptr, opts);
    std::vector<FISTA::Result> results(4);
    std::vector<std::thread>   threads;
    for (size_t it = 0; it < results.size(); it++) {
      threads.emplace_back([&, it] { results[it] = NNLS(y, A, nullptr, opts); });
    }
    for (auto &t : threads) {
      t.join();
    }
    for (auto const &r : results) {
      CHECK(r.iterations == serial.iterations);
      CHECK((r.x - serial.x).norm() == Approx(0.).margin(1.e-12));
    }
  }
}

TEST_CASE("NNLS exact recovery", "[alg]")
{
  Index const           N = 6;
  Eigen::MatrixXd const mat = TallOp(N, 4);
  auto const            A = Ops::MatMul::Make(mat);
  ReVector              x(N);
  x << 1., 0., 0.5, 2., 0., 0.25;
  ReVector const y = mat * x;

  FISTA::Opts opts;
  opts.imax = 5000;
  opts.tolFun = 0.;
  opts.tolX = 0.;

  SECTION("Backtracking")
  {
    auto const r = NNLS(y, A, nullptr, opts);
    INFO("x " << r.x.transpose());
    CHECK((r.x - x).norm() == Approx(0.).margin(1.e-6));
  }

  SECTION("Constant step")
  {
    double const L = EstimateLipschitz(A);
    auto const   r = NNLSConstantStep(y, A, L, nullptr, opts);
    auto const   rb = NNLS(y, A, nullptr, opts);
    INFO("x " << r.x.transpose());
    CHECK((r.x - x).norm() == Approx(0.).margin(1.e-6));
    CHECK((r.x - rb.x).norm() == Approx(0.).margin(1.e-6));
  }

  SECTION("Warm start at the solution")
  {
    auto const r = NNLS(y, A, nullptr, opts, x);
    CHECK(r.reason == Convergence::Reason::AbsObjective);
    CHECK(r.iterations == 1);
    CHECK((r.x - x).norm() == Approx(0.).margin(1.e-12));
  }

  SECTION("Warm start")
  {
    FISTA::Opts loose = opts;
    loose.imax = 5;
    auto const first = NNLS(y, A, nullptr, loose);
    auto const r = NNLS(y, A, nullptr, opts, first.x);
    CHECK((r.x - x).norm() == Approx(0.).margin(1.e-6));
  }
}

TEST_CASE("NNGroupLasso", "[alg]")
{
  Eigen::ArrayXd w(2);
  w << 1., 2.;
  auto const partition = Proxs::Partition::FromSizes({2, 2}, 2, 2, w);
  Index const N = partition.size();

  FISTA::Opts opts;
  opts.imax = 2000;
  opts.tolFun = 0.;
  opts.tolX = 0.;

  SECTION("Identity operator gives the prox")
  {
    ReVector y(N);
    y << 3., 4., 0.2, -0.1, 1., -2., 0.5, 0.05;
    double const   λ1 = 0.5, λ2 = 0.3, λ3 = 0.1;
    auto const     r = NNGroupLasso(y, Ops::Identity::Make(N), λ1, λ2, λ3, partition, nullptr, opts);
    CxVector       expected = y.cast<Cx>();
    Proxs::GroupL1L1 const prox(λ1, λ2, λ3, partition);
    prox.apply(1., expected);
    INFO("x " << r.x.transpose() << "\nexpected " << expected.real().transpose());
    CHECK((r.x - expected.real()).norm() == Approx(0.).margin(1.e-6));
    CHECK(r.x.segment(2, 2).norm() == 0.);
  }

  SECTION("No regularization is NNLS")
  {
    Eigen::MatrixXd const mat = TallOp(N, 5);
    auto const            A = Ops::MatMul::Make(mat);
    ReVector              x(N);
    x << 1., 0.5, 0., 0., 2., 0., 0.3, 1.5;
    ReVector const y = mat * x;
    auto const     gl = NNGroupLasso(y, A, 0., 0., 0., partition, nullptr, opts);
    auto const     nn = NNLS(y, A, nullptr, opts);
    CHECK((gl.x - nn.x).norm() == Approx(0.).margin(1.e-6));
    CHECK((gl.x - x).norm() == Approx(0.).margin(1.e-6));
  }

  // Stands in for monotone decrease, as for NNLS
  SECTION("Majorizer")
  {
    Eigen::MatrixXd const mat = Eigen::MatrixXd::Random(12, N);
    ReVector const        y = ReVector::Random(12);
    FISTA::Opts           few = opts;
    few.imax = 100;
    bool       bounded = true;
    bool       feasible = true;
    auto const r =
      NNGroupLasso(y, Ops::MatMul::Make(mat), 0.2, 0.1, 0.1, partition, nullptr, few, ReVector(),
                   [&](FISTA::Record const &rec, CxVector const &x) {
                     if (rec.objective > rec.majorizer) { bounded = false; }
                     if (x.real().minCoeff() < 0.) { feasible = false; }
                   });
    CHECK(bounded);
    CHECK(feasible);
    CHECK(r.x.minCoeff() >= 0.);
  }

  SECTION("Warm start at the solution")
  {
    // Flat regions are negative so the booked penalty matches the true penalty at the solution
    ReVector y(N);
    y << 3., 4., 0.2, -0.1, -1., -2., -0.5, -0.05;
    double const           λ1 = 0.5, λ2 = 0.3, λ3 = 0.1;
    Proxs::GroupL1L1 const prox(λ1, λ2, λ3, partition);
    CxVector               z = y.cast<Cx>();
    prox.apply(1., z);
    ReVector const x0 = z.real();
    REQUIRE(prox.value(z) == Approx(2.25));

    FISTA::Opts warm = opts;
    warm.tolFun = 1.e-10;
    std::vector<FISTA::Record> records;
    auto const r = NNGroupLasso(y, Ops::Identity::Make(N), λ1, λ2, λ3, partition, nullptr, warm, x0,
                                [&](FISTA::Record const &rec, CxVector const &) { records.push_back(rec); });
    CHECK((r.reason == Convergence::Reason::AbsObjective || r.reason == Convergence::Reason::RelObjective));
    CHECK(r.iterations == 1);
    REQUIRE(records.size() == 1);
    CHECK(records.front().δ.absObj == Approx(0.).margin(1.e-10));
    CHECK(r.objective == Approx(0.5 * (x0 - y).squaredNorm() + 2.25));
    CHECK((r.x - x0).norm() == Approx(0.).margin(1.e-10));
  }

  SECTION("Warm start from a partial solve")
  {
    Eigen::MatrixXd const mat = TallOp(N, 5);
    auto const            A = Ops::MatMul::Make(mat);
    ReVector              x(N);
    x << 1., 0.5, 0., 0.2, 2., 0., 0.3, 1.5;
    ReVector const y = mat * x;
    auto const     cold = NNGroupLasso(y, A, 0.1, 0.1, 0.1, partition, nullptr, opts);
    FISTA::Opts    few = opts;
    few.imax = 5;
    auto const partial = NNGroupLasso(y, A, 0.1, 0.1, 0.1, partition, nullptr, few);
    CHECK(partial.reason == Convergence::Reason::MaxIterations);
    auto const r = NNGroupLasso(y, A, 0.1, 0.1, 0.1, partition, nullptr, opts, partial.x);
    INFO("cold " << cold.x.transpose() << "\nwarm " << r.x.transpose());
    CHECK((r.x - cold.x).norm() == Approx(0.).margin(1.e-6));
    CHECK(r.objective == Approx(cold.objective).margin(1.e-9));
  }

  SECTION("Partition must match the operator")
  {
    ReVector const y = ReVector::Zero(N + 1);
    CHECK_THROWS_AS(NNGroupLasso(y, Ops::Identity::Make(N + 1), 0.1, 0.1, 0.1, partition), Log::Failure);
  }
}

TEST_CASE("Interrupts", "[alg]")
{
  Eigen::MatrixXd const mat = TallOp(6, 4);
  auto const            A = Ops::MatMul::Make(mat);
  ReVector              x(6);
  x << 1., 0., 0.5, 2., 0., 0.25;
  ReVector const y = mat * x;
  FISTA::Opts    opts;
  opts.imax = 50;

  auto const before = std::signal(SIGINT, SIG_IGN);
  std::signal(SIGINT, before);

  CHECK_THROWS_AS(NNLS(y, std::make_shared<FailingOp>(A, 3), nullptr, opts), Log::Failure);
  auto const after = std::signal(SIGINT, before);
  bool const restored = after == before;
  CHECK(restored);

  // SIGINT during a solve stops that solve only
  auto const interrupted = NNLS(y, A, nullptr, opts, ReVector(), [](FISTA::Record const &rec, CxVector const &) {
    if (rec.iter == 2) { std::raise(SIGINT); }
  });
  CHECK(interrupted.reason == Convergence::Reason::Interrupted);
  CHECK(interrupted.iterations == 2);
  CHECK(interrupted.x.minCoeff() >= 0.);

  for (Index ii = 0; ii < 2; ii++) {
    auto const r = NNLS(y, A, nullptr, opts);
    CHECK(r.reason != Convergence::Reason::Interrupted);
    CHECK(r.iterations > 1);
  }
}

TEST_CASE("Verbose solves log every iteration", "[alg]")
{
  std::FILE *f = std::tmpfile();
  REQUIRE(f != nullptr);
  Log::SetOutput(f);
  ReVector y(2);
  y << 2., 0.;
  FISTA::Opts opts;
  auto const  quiet = NNLS(y, Ops::Identity::Make(2), nullptr, opts);
  Index const quietLines = CountLines(f);
  opts.verbose = true;
  auto const  loud = NNLS(y, Ops::Identity::Make(2), nullptr, opts);
  Index const loudLines = CountLines(f);
  Log::SetOutput(nullptr);
  std::fclose(f);

  CHECK(quiet.iterations == loud.iterations);
  CHECK(quietLines == 0);
  // One header line plus one per iteration
  CHECK(loudLines == loud.iterations + 1);
}

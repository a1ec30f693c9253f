#include "inputs.hpp"

#include "nnf/algo/convergence.hpp"
#include "nnf/log/log.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <numeric>
#include <random>

using namespace nnf;

ProblemArgs::ProblemArgs(args::Subparser &parser)
  : rows(parser, "M", "Number of measurements (64)", {'m', "rows"}, 64)
  , cols(parser, "N", "Number of coefficients (32)", {'n', "cols"}, 32)
  , active(parser, "K", "Non-zero coefficients in the ground truth (4)", {'k', "active"}, 4)
  , noise(parser, "σ", "Standard deviation of added noise (0)", {"noise"}, 0.)
  , seed(parser, "S", "Random seed (42)", {"seed"}, 42)
  , density(parser, "D", "Dictionary density, < 1 for a sparse operator (1)", {"density"}, 1.)
{
}

auto MakeProblem(Index const rows, Index const cols, Index const active, double const noise, unsigned const seed, double const density)
  -> Problem
{
  if (rows < 1 || cols < 1) { throw Log::Failure("Problem", "Invalid size rows {} cols {}", rows, cols); }
  if (active < 0 || active > cols) { throw Log::Failure("Problem", "Active coefficients {} must be in [0, {}]", active, cols); }
  if (!(density > 0.) || density > 1.) { throw Log::Failure("Problem", "Density {} must be in (0, 1]", density); }
  if (noise < 0.) { throw Log::Failure("Problem", "Noise {} must not be negative", noise); }

  std::mt19937                           gen(seed);
  std::uniform_real_distribution<double> uniform(0., 1.);
  std::normal_distribution<double>       normal(0., noise > 0. ? noise : 1.);

  Eigen::MatrixXd D(rows, cols);
  for (Index ic = 0; ic < cols; ic++) {
    for (Index ir = 0; ir < rows; ir++) {
      D(ir, ic) = uniform(gen) < density ? uniform(gen) : 0.;
    }
    double const n = D.col(ic).norm();
    if (n > 0.) {
      D.col(ic) /= n;
    } else {
      D(ic % rows, ic) = 1.;
    }
  }

  std::vector<Index> support(cols);
  std::iota(support.begin(), support.end(), 0);
  std::shuffle(support.begin(), support.end(), gen);
  ReVector x = ReVector::Zero(cols);
  for (Index ia = 0; ia < active; ia++) {
    x[support[ia]] = 0.5 + uniform(gen);
  }

  ReVector y = D * x;
  if (noise > 0.) {
    for (Index ir = 0; ir < rows; ir++) {
      y[ir] += normal(gen);
    }
  }

  Ops::Op::Ptr A;
  if (density < 1.) {
    Eigen::SparseMatrix<double> const S = D.sparseView();
    A = Ops::SparseMatMul::Make(S);
  } else {
    A = Ops::MatMul::Make(D);
  }
  Log::Print("Problem", "Dictionary [{}, {}] {} active |y| {:4.3E} noise {}", rows, cols, active, y.norm(), noise);
  return {A, x, y};
}

auto MakeProblem(ProblemArgs &args, Index const cols) -> Problem
{
  return MakeProblem(args.rows.Get(), cols, args.active.Get(), args.noise.Get(), args.seed.Get(), args.density.Get());
}

SolverArgs::SolverArgs(args::Subparser &parser, Index const defIts, double const defTolFun)
  : its(parser, "N", fmt::format("Max iterations ({})", defIts), {'i', "max-its"}, defIts)
  , tolFun(parser, "T", fmt::format("Relative objective tolerance ({})", defTolFun), {"tol-fun"}, defTolFun)
  , tolX(parser, "T", "Relative solution tolerance (1e-9)", {"tol-x"}, 1.e-9)
  , verbose(parser, "V", "Log every iteration", {"verbose"})
{
}

auto SolverArgs::Get() -> FISTA::Opts
{
  FISTA::Opts opts;
  opts.imax = its.Get();
  opts.tolFun = tolFun.Get();
  opts.tolX = tolX.Get();
  opts.verbose = verbose.Get();
  return opts;
}

void Report(std::string const &cmd, Problem const &p, FISTA::Result const &r)
{
  ReVector const res = p.A->forward(r.x.cast<Cx>()).real() - p.y;
  Log::Print(cmd, "Finished");
  fmt::print("Reason     {}\n", Convergence::ToString(r.reason));
  fmt::print("Iterations {}\n", r.iterations);
  fmt::print("Objective  {:.6E}\n", r.objective);
  fmt::print("|Ax-y|     {:.6E}\n", res.norm());
  fmt::print("|x-x0|/|x0| {:.6E}\n", (r.x - p.x).norm() / std::max(p.x.norm(), ε));
  fmt::print("Non-zeros  {} / {} (truth {})\n", (r.x.array() > 0.).count(), r.x.size(), (p.x.array() > 0.).count());
}

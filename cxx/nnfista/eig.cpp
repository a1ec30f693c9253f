#include "inputs.hpp"

#include "nnf/algo/eig.hpp"
#include "nnf/log/log.hpp"

#include <cmath>

using namespace nnf;

auto CeilDP(double x, int N) -> double
{
  if (N > 0) {
    return std::ceil(x * std::pow(10, N)) / std::pow(10, N);
  } else {
    return x;
  }
}

void main_eig(args::Subparser &parser)
{
  ProblemArgs             problemArgs(parser);
  args::ValueFlag<Index>  its(parser, "N", "Max iterations (100)", {'i', "max-its"}, 100);
  args::ValueFlag<double> tol(parser, "T", "Relative tolerance (1e-6)", {"tol"}, 1.e-6);
  args::Flag              recip(parser, "R", "Output reciprocal of eigenvalue", {"recip"});
  args::ValueFlag<int>    dp(parser, "D", "Round up to this many decimal places", {"dp"}, -1);
  ParseCommand(parser);

  auto const   p = MakeProblem(problemArgs, problemArgs.cols.Get());
  double const val = EstimateLipschitz(p.A, nullptr, tol.Get(), its.Get());
  fmt::print("{}\n", CeilDP(recip ? (1. / val) : val, dp.Get()));
}

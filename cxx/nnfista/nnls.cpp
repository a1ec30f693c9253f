#include "inputs.hpp"

#include "nnf/algo/eig.hpp"
#include "nnf/algo/nnls.hpp"
#include "nnf/log/log.hpp"

using namespace nnf;

void main_nnls(args::Subparser &parser)
{
  ProblemArgs            problemArgs(parser);
  SolverArgs             solverArgs(parser, 100, 1.e-4);
  args::Flag             constant(parser, "C", "Use a constant step from the power method", {'c', "constant"});
  args::ValueFlag<Index> powerIts(parser, "N", "Power method iterations (100)", {"power-its"}, 100);
  args::ValueFlag<double> powerTol(parser, "T", "Power method tolerance (1e-6)", {"power-tol"}, 1.e-6);
  ParseCommand(parser);
  auto const cmd = parser.GetCommand().Name();

  auto const p = MakeProblem(problemArgs, problemArgs.cols.Get());
  auto const opts = solverArgs.Get();
  if (constant) {
    double const L = EstimateLipschitz(p.A, nullptr, powerTol.Get(), powerIts.Get());
    Report(cmd, p, NNLSConstantStep(p.y, p.A, L, nullptr, opts));
  } else {
    Report(cmd, p, NNLS(p.y, p.A, nullptr, opts));
  }
}

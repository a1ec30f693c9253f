#include "inputs.hpp"

#include "nnf/algo/nnls.hpp"
#include "nnf/log/log.hpp"
#include "nnf/prox/partition.hpp"

#include <numeric>

using namespace nnf;

void main_glasso(args::Subparser &parser)
{
  ProblemArgs       problemArgs(parser);
  SolverArgs        solverArgs(parser, 500, 1.e-5);
  VectorFlag<Index> groups(parser, "G", "Group sizes (8,8,8)", {"groups"}, std::vector<Index>{8, 8, 8});
  args::ValueFlag<Index>  nA(parser, "N", "Size of the first flat region (4)", {"l1a"}, 4);
  args::ValueFlag<Index>  nB(parser, "N", "Size of the second flat region (4)", {"l1b"}, 4);
  args::ValueFlag<double> λ1(parser, "λ", "Group penalty (0.1)", {"lambda1"}, 0.1);
  args::ValueFlag<double> λ2(parser, "λ", "First flat region penalty (0.1)", {"lambda2"}, 0.1);
  args::ValueFlag<double> λ3(parser, "λ", "Second flat region penalty (0.1)", {"lambda3"}, 0.1);
  args::ValueFlag<Eigen::ArrayXd, ArrayXdReader> weights(parser, "W", "Group weights (all 1)", {"weights"});
  ParseCommand(parser);
  auto const cmd = parser.GetCommand().Name();

  auto const           &g = groups.Get();
  Eigen::ArrayXd const w = weights ? weights.Get() : Eigen::ArrayXd::Ones(static_cast<Index>(g.size())).eval();
  auto const           partition = Proxs::Partition::FromSizes(g, nA.Get(), nB.Get(), w);
  if (problemArgs.cols) {
    Log::Warn(cmd, "Coefficient count is set by the partition, ignoring --cols {}", problemArgs.cols.Get());
  }
  auto const p = MakeProblem(problemArgs, partition.size());
  Report(cmd, p, NNGroupLasso(p.y, p.A, λ1.Get(), λ2.Get(), λ3.Get(), partition, nullptr, solverArgs.Get()));
}

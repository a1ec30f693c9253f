#include "args.hpp"
#include "nnf/log/log.hpp"

using namespace nnf;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("nnfista");
  args::GlobalOptions  globals(parser, global_group);

  args::Group solve(parser, "SOLVE");
  COMMAND(solve, nnls, "nnls", "Non-negative least squares");
  COMMAND(solve, glasso, "glasso", "Non-negative group-L2,1 + L1 + L1 regularized least squares");

  args::Group util(parser, "UTIL");
  COMMAND(util, eig, "eig", "Estimate the largest eigenvalue of A'A");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
    return EXIT_SUCCESS;
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return EXIT_FAILURE;
  } catch (Log::Failure &f) {
    Log::Fail(f);
    Log::End();
    return EXIT_FAILURE;
  } catch (std::exception const &e) {
    Log::Fail(Log::Failure("None", "{}", e.what()));
    Log::End();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

#include "args.hpp"

#include "nnf/log/log.hpp"
#include "nnf/sys/threads.hpp"

#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <scn/scan.h>
#include <unordered_map>

using namespace nnf;

namespace {
std::unordered_map<int, Log::Display> levelMap{
  {0, Log::Display::None}, {1, Log::Display::Ephemeral}, {2, Log::Display::Low}, {3, Log::Display::High}};
}

args::Group                      global_group("GLOBAL OPTIONS");
args::HelpFlag                   help(global_group, "H", "Show this help message", {'h', "help"});
args::MapFlag<int, Log::Display> verbosity(global_group, "V", "Log level 0-3", {'v', "verbosity"}, levelMap, Log::Display::Low);
args::ValueFlag<Index>           nthreads(global_group, "N", "Limit number of threads", {"nthreads"});

void SetLogging(std::string const &name)
{
  if (verbosity) {
    Log::SetDisplayLevel(verbosity.Get());
  } else if (char *const env_p = std::getenv("NNF_VERBOSITY")) {
    auto const it = levelMap.find(std::atoi(env_p));
    if (it == levelMap.end()) { throw args::Error(fmt::format("Invalid NNF_VERBOSITY {}", env_p)); }
    Log::SetDisplayLevel(it->second);
  }
  Log::Print(name, "Welcome to nnfista");
}

void SetThreadCount()
{
  if (nthreads) {
    Threads::SetGlobalThreadCount(nthreads.Get());
  } else if (char *const env_p = std::getenv("NNF_THREADS")) {
    Threads::SetGlobalThreadCount(std::atoi(env_p));
  }
}

void ParseCommand(args::Subparser &parser)
{
  args::GlobalOptions globals(parser, global_group);
  parser.Parse();
  SetLogging(parser.GetCommand().Name());
  SetThreadCount();
}

class ArgsError : public std::runtime_error
{
public:
  ArgsError(std::string const &msg)
    : std::runtime_error(msg)
  {
  }
};

void ArrayXdReader::operator()(std::string const &name, std::string const &input, Eigen::ArrayXd &val)
{
  auto                result = scn::scan<double>(input, "{}");
  std::vector<double> values;
  if (result) {
    values.push_back(result->value());
    while ((result = scn::scan<double>(result->range(), ",{}"))) {
      values.push_back(result->value());
    }
  } else {
    throw(ArgsError(fmt::format("Could not read argument for {}", name)));
  }
  val.resize(values.size());
  for (size_t ii = 0; ii < values.size(); ii++) {
    val[ii] = values[ii];
  }
}

template <typename T>
void VectorReader<T>::operator()(std::string const &name, std::string const &input, std::vector<T> &values)
{
  auto result = scn::scan<T>(input, "{}");
  if (result) {
    // Values will have been default initialized. Reset
    values.clear();
    values.push_back(result->value());
    while ((result = scn::scan<T>(result->range(), ",{}"))) {
      values.push_back(result->value());
    }
  } else {
    throw(ArgsError(fmt::format("Could not read argument for {}", name)));
  }
}

template struct VectorReader<Index>;

#pragma once

#include "args.hpp"

#include "nnf/algo/fista.hpp"
#include "nnf/op/ops.hpp"

/*
 * Synthetic problems: a random non-negative dictionary with unit-norm columns, a sparse non-negative ground truth, and
 * measurements with optional Gaussian noise. Everything is drawn from a seeded generator so runs are reproducible.
 */
struct ProblemArgs
{
  args::ValueFlag<Index>        rows;
  args::ValueFlag<Index>        cols;
  args::ValueFlag<Index>        active;
  args::ValueFlag<double>       noise;
  args::ValueFlag<unsigned int> seed;
  args::ValueFlag<double>       density;

  ProblemArgs(args::Subparser &parser);
};

struct Problem
{
  nnf::Ops::Op::Ptr A;
  nnf::ReVector     x;
  nnf::ReVector     y;
};

/* Dense unless density < 1, in which case dictionary entries are kept with that probability */
auto MakeProblem(Index const   rows,
                 Index const   cols,
                 Index const   active,
                 double const  noise,
                 unsigned const seed,
                 double const  density) -> Problem;
auto MakeProblem(ProblemArgs &args, Index const cols) -> Problem;

struct SolverArgs
{
  args::ValueFlag<Index>  its;
  args::ValueFlag<double> tolFun;
  args::ValueFlag<double> tolX;
  args::Flag              verbose;

  SolverArgs(args::Subparser &parser, Index const its, double const tolFun);
  auto Get() -> nnf::FISTA::Opts;
};

void Report(std::string const &cmd, Problem const &p, nnf::FISTA::Result const &r);

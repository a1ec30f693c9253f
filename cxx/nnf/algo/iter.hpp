#pragma once
/*
 * Infrastructure for dealing with whether to continue iterating in optimizers
 */
namespace nnf::Iterating {

/* Installs the SIGINT handler for as long as an iterative loop is alive, and removes it however the loop exits */
struct Scope
{
  Scope();
  ~Scope();
  Scope(Scope const &) = delete;
  auto operator=(Scope const &) -> Scope & = delete;
};

auto ShouldStop(char const *name) -> bool;
} // namespace nnf::Iterating

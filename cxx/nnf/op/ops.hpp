#pragma once

#include "op.hpp"

#include <Eigen/SparseCore>

namespace nnf::Ops {

struct Identity final : Op
{
  OP_INHERIT

  Identity(Index const s);
  static auto Make(Index const s) -> Ptr;
  void        forward(CMap x, Map y, double const s = 1.) const;
  void        adjoint(CMap y, Map x, double const s = 1.) const;

private:
  Index sz;
};

//! Dense matrix. The adjoint is the conjugate transpose.
struct MatMul final : Op
{
  OP_INHERIT
  using Matrix = Eigen::Matrix<Cx, Eigen::Dynamic, Eigen::Dynamic>;
  MatMul(Matrix const &m);
  MatMul(Eigen::MatrixXd const &m);
  static auto Make(Matrix const &m) -> Ptr;
  static auto Make(Eigen::MatrixXd const &m) -> Ptr;
  void        forward(CMap x, Map y, double const s = 1.) const;
  void        adjoint(CMap y, Map x, double const s = 1.) const;

private:
  Matrix mat;
};

//! Sparse real matrix, e.g. a dictionary with mostly empty columns
struct SparseMatMul final : Op
{
  OP_INHERIT
  using Matrix = Eigen::SparseMatrix<Cx>;
  SparseMatMul(Eigen::SparseMatrix<double> const &m);
  static auto Make(Eigen::SparseMatrix<double> const &m) -> Ptr;
  void        forward(CMap x, Map y, double const s = 1.) const;
  void        adjoint(CMap y, Map x, double const s = 1.) const;

private:
  Matrix mat;
};

//! Multiply by a diagonal
struct Diag final : Op
{
  OP_INHERIT
  Diag(Vector const &d);
  static auto Make(Vector const &d) -> Ptr;
  void        forward(CMap x, Map y, double const s = 1.) const;
  void        adjoint(CMap y, Map x, double const s = 1.) const;

private:
  Vector d;
};

//! Swaps forward and adjoint, i.e. A'
struct Adjoint final : Op
{
  OP_INHERIT
  Adjoint(Ptr op);
  static auto Make(Ptr op) -> Ptr;
  void        forward(CMap x, Map y, double const s = 1.) const;
  void        adjoint(CMap y, Map x, double const s = 1.) const;

private:
  Ptr op;
};

/*
 * Pairs a forward operator with a separately supplied adjoint. The forward of At is used as the adjoint of A,
 * so At must map measurement space to coefficient space.
 */
struct Paired final : Op
{
  OP_INHERIT
  Paired(Ptr A, Ptr At);
  static auto Make(Ptr A, Ptr At) -> Ptr;
  void        forward(CMap x, Map y, double const s = 1.) const;
  void        adjoint(CMap y, Map x, double const s = 1.) const;

private:
  Ptr A, At;
};

// Returns A when At is null, otherwise A paired with At
auto WithAdjoint(Op::Ptr A, Op::Ptr At) -> Op::Ptr;

} // namespace nnf::Ops

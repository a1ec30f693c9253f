#include "ops.hpp"

namespace nnf::Ops {

Identity::Identity(Index const s)
  : Op("Identity")
  , sz{s}
{
}

auto Identity::Make(Index const s) -> Op::Ptr { return std::make_shared<Identity>(s); }
auto Identity::rows() const -> Index { return sz; }
auto Identity::cols() const -> Index { return sz; }

void Identity::forward(CMap x, Map y, double const s) const
{
  auto const time = this->startForward(x, y);
  y = x * s;
  this->finishForward(y, time);
}

void Identity::adjoint(CMap y, Map x, double const s) const
{
  auto const time = this->startAdjoint(y, x);
  x = y * s;
  this->finishAdjoint(x, time);
}

MatMul::MatMul(Matrix const &m)
  : Op("MatMul")
  , mat{m}
{
}

MatMul::MatMul(Eigen::MatrixXd const &m)
  : Op("MatMul")
  , mat{m.cast<Cx>()}
{
}

auto MatMul::Make(Matrix const &m) -> Op::Ptr { return std::make_shared<MatMul>(m); }
auto MatMul::Make(Eigen::MatrixXd const &m) -> Op::Ptr { return std::make_shared<MatMul>(m); }

auto MatMul::rows() const -> Index { return mat.rows(); }

auto MatMul::cols() const -> Index { return mat.cols(); }

void MatMul::forward(CMap x, Map y, double const s) const
{
  auto const time = this->startForward(x, y);
  y.noalias() = mat * x * s;
  this->finishForward(y, time);
}

void MatMul::adjoint(CMap y, Map x, double const s) const
{
  auto const time = this->startAdjoint(y, x);
  x.noalias() = mat.adjoint() * y * s;
  this->finishAdjoint(x, time);
}

SparseMatMul::SparseMatMul(Eigen::SparseMatrix<double> const &m)
  : Op("SparseMatMul")
  , mat{m.cast<Cx>()}
{
  mat.makeCompressed();
  Log::Debug("SparseMatMul", "[{}, {}] with {} non-zeros", mat.rows(), mat.cols(), mat.nonZeros());
}

auto SparseMatMul::Make(Eigen::SparseMatrix<double> const &m) -> Op::Ptr { return std::make_shared<SparseMatMul>(m); }

auto SparseMatMul::rows() const -> Index { return mat.rows(); }

auto SparseMatMul::cols() const -> Index { return mat.cols(); }

void SparseMatMul::forward(CMap x, Map y, double const s) const
{
  auto const time = this->startForward(x, y);
  y.noalias() = mat * x;
  y *= s;
  this->finishForward(y, time);
}

void SparseMatMul::adjoint(CMap y, Map x, double const s) const
{
  auto const time = this->startAdjoint(y, x);
  x.noalias() = mat.adjoint() * y;
  x *= s;
  this->finishAdjoint(x, time);
}

Diag::Diag(Vector const &dd)
  : Op("Diag")
  , d{dd}
{
}

auto Diag::Make(Vector const &d) -> Op::Ptr { return std::make_shared<Diag>(d); }

auto Diag::rows() const -> Index { return d.rows(); }
auto Diag::cols() const -> Index { return d.rows(); }

void Diag::forward(CMap x, Map y, double const s) const
{
  auto const time = this->startForward(x, y);
  y = d.cwiseProduct(x) * s;
  this->finishForward(y, time);
}

void Diag::adjoint(CMap y, Map x, double const s) const
{
  auto const time = this->startAdjoint(y, x);
  x = d.conjugate().cwiseProduct(y) * s;
  this->finishAdjoint(x, time);
}

Adjoint::Adjoint(Ptr o)
  : Op("Adjoint")
  , op{o}
{
}

auto Adjoint::Make(Ptr o) -> Op::Ptr { return std::make_shared<Adjoint>(o); }
auto Adjoint::rows() const -> Index { return op->cols(); }
auto Adjoint::cols() const -> Index { return op->rows(); }

void Adjoint::forward(CMap x, Map y, double const s) const { op->adjoint(x, y, s); }
void Adjoint::adjoint(CMap y, Map x, double const s) const { op->forward(y, x, s); }

Paired::Paired(Ptr a, Ptr at)
  : Op("Paired")
  , A{a}
  , At{at}
{
  if (!A || !At) { throw Log::Failure("Paired", "Both the operator and its adjoint are required"); }
  if (At->rows() != A->cols() || At->cols() != A->rows()) {
    throw Log::Failure("Paired", "Adjoint [{}, {}] does not match operator [{}, {}]", At->rows(), At->cols(), A->rows(),
                       A->cols());
  }
}

auto Paired::Make(Ptr A, Ptr At) -> Op::Ptr { return std::make_shared<Paired>(A, At); }
auto Paired::rows() const -> Index { return A->rows(); }
auto Paired::cols() const -> Index { return A->cols(); }

void Paired::forward(CMap x, Map y, double const s) const { A->forward(x, y, s); }
void Paired::adjoint(CMap y, Map x, double const s) const { At->forward(y, x, s); }

auto WithAdjoint(Op::Ptr A, Op::Ptr At) -> Op::Ptr
{
  if (!A) { throw Log::Failure("Op", "No operator supplied"); }
  return At ? Paired::Make(A, At) : A;
}

} // namespace nnf::Ops

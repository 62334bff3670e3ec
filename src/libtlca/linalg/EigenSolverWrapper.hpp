// =============================================================================
//  TLCA
//  
//  Copyright © 2024-present: The TLCA Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file
 * Uniform interface to the sparse direct and iterative solvers of Eigen.
 */

#ifndef LIBTLCA_EIGENSOLVERWRAPPER_HPP_
#define LIBTLCA_EIGENSOLVERWRAPPER_HPP_

#include <Eigen/Sparse>
#include <Eigen/SparseLU>
#include <Eigen/SparseQR>
#include <Eigen/OrderingMethods>
#include <Eigen/IterativeLinearSolvers>

#include <string>

namespace tlca
{

namespace linalg
{

class EigenSolverBase
{
public:
	virtual ~EigenSolverBase() = default;

	virtual void analyzePattern(const Eigen::SparseMatrix<double>& mat) = 0;
	virtual void factorize(const Eigen::SparseMatrix<double>& mat) = 0;
	virtual Eigen::VectorXd solve(const Eigen::VectorXd& b) = 0;
	virtual Eigen::ComputationInfo info() const = 0;
	virtual const char* name() const = 0;
};

/**
 * @brief Adapts an Eigen sparse solver to EigenSolverBase
 * @details Iterative solvers keep a reference to the factorized matrix, which has to
 *          outlive all calls to solve().
 * @tparam Solver_t Eigen direct or iterative solver for Eigen::SparseMatrix<double>
 */
template <class Solver_t>
class EigenSolver : public EigenSolverBase
{
public:
	explicit EigenSolver(const char* name) : _name(name) { }

	void analyzePattern(const Eigen::SparseMatrix<double>& mat) override { _solver.analyzePattern(mat); }
	void factorize(const Eigen::SparseMatrix<double>& mat) override { _solver.factorize(mat); }
	Eigen::VectorXd solve(const Eigen::VectorXd& b) override { return _solver.solve(b); }
	Eigen::ComputationInfo info() const override { return _solver.info(); }
	const char* name() const override { return _name; }

private:
	Solver_t _solver;
	const char* _name;
};

template <typename Ordering_t>
using SparseLU = EigenSolver<Eigen::SparseLU<Eigen::SparseMatrix<double>, Ordering_t>>;

template <typename Ordering_t>
using SparseQR = EigenSolver<Eigen::SparseQR<Eigen::SparseMatrix<double>, Ordering_t>>;

template <typename Preconditioner_t>
using BiCGSTAB = EigenSolver<Eigen::BiCGSTAB<Eigen::SparseMatrix<double>, Preconditioner_t>>;

/**
 * @brief Creates a linear solver by name
 * @details Names start with the solver (@c SparseLU, @c SparseQR, @c BiCGSTAB) optionally
 *          followed by an ordering (@c COLAMDOrdering, @c AMDOrdering, @c NaturalOrdering) or a
 *          preconditioner (@c IdentityPreconditioner, @c DiagonalPreconditioner, @c IncompleteLUT),
 *          e.g. @c SparseLU_NaturalOrdering. Throws InvalidParameterException for unknown names.
 * @param [in] solverName Name of the solver
 * @return Solver owned by the caller
 */
tlca::linalg::EigenSolverBase* createLinearSolver(const std::string& solverName);

/**
 * @brief Checks whether a solver name is known
 * @param [in] solverName Name of the solver, @c Auto included
 */
bool isKnownLinearSolver(const std::string& solverName);

} // namespace linalg

} // namespace tlca

#endif // LIBTLCA_EIGENSOLVERWRAPPER_HPP_

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
 * Assembles and solves the technosphere and biosphere matrices of a ProcessGraph.
 */

#ifndef LIBTLCA_TECHNOSPHERESYSTEM_HPP_
#define LIBTLCA_TECHNOSPHERESYSTEM_HPP_

#include "tlca/StaticLca.hpp"
#include "linalg/EigenSolverWrapper.hpp"

#include <Eigen/Sparse>

#include <memory>
#include <string>
#include <vector>

namespace tlca
{

class ProcessGraph;

/**
 * @brief Linear system @f$ A s = f @f$ with inventory @f$ g = B s @f$ of one graph snapshot
 * @details The matrices are assembled from triplets on construction and never shared.
 *          The technosphere matrix has the self-production on its diagonal and the
 *          negative consumption coefficients off the diagonal. Acyclic graphs are
 *          permuted to lower-triangular form (consumers first) and solved by forward
 *          substitution, cyclic graphs use a general sparse solver.
 *
 *          The system references the graph, which has to outlive it.
 */
class TechnosphereSystem
{
public:

	/**
	 * @brief Assembles the system
	 * @details Throws SingularSystemException naming the activity if a diagonal entry
	 *          of a triangular system vanishes or an activity has zero self-production,
	 *          and if the factorization of the general solver fails.
	 * @param [in] graph Process graph snapshot
	 * @param [in] solverName Name of the linear solver or @c Auto
	 */
	TechnosphereSystem(const ProcessGraph& graph, const std::string& solverName);
	~TechnosphereSystem() TLCA_NOEXCEPT;

	/**
	 * @brief Converts a functional unit into a dense demand vector
	 * @details Throws UnknownNodeException for ids that are not technosphere activities
	 *          of @p graph. Nothing else is computed before the check.
	 */
	static Eigen::VectorXd assembleDemand(const ProcessGraph& graph, const FunctionalUnit& fu);

	/**
	 * @brief Solves @f$ A s = f @f$
	 * @details Throws SingularSystemException if the solution is not finite.
	 * @param [in] demand Demand vector (one entry per activity)
	 * @return Scaling vector
	 */
	Eigen::VectorXd solve(const Eigen::VectorXd& demand);

	/**
	 * @brief Computes the inventory @f$ g = B s @f$
	 */
	Eigen::VectorXd inventory(const Eigen::VectorXd& scaling) const;

	/**
	 * @brief Cumulative inventory of one unit of activation of @p activity
	 * @details Column @f$ B A^{-1} e_j @f$, cached after the first request.
	 * @param [in] activity Index of the activity
	 * @return Inventory per unit scaling of @p activity (one entry per flow)
	 */
	const Eigen::VectorXd& flowColumn(int activity);

	inline bool isTriangular() const TLCA_NOEXCEPT { return _triangular; }
	inline const char* solverName() const TLCA_NOEXCEPT { return _solver ? _solver->name() : "Triangular"; }

	inline const Eigen::SparseMatrix<double>& technosphereMatrix() const TLCA_NOEXCEPT { return _A; }
	inline const Eigen::SparseMatrix<double>& biosphereMatrix() const TLCA_NOEXCEPT { return _B; }

protected:

	void assembleTriangular(const std::vector<int>& topoOrder);
	void assembleGeneral();
	void checkFinite(const Eigen::VectorXd& s) const;

	const ProcessGraph& _graph;

	Eigen::SparseMatrix<double> _A; //!< Technosphere matrix (permuted if triangular)
	Eigen::SparseMatrix<double> _B; //!< Biosphere matrix (columns in activity order)

	bool _triangular;
	std::vector<int> _position; //!< Row / column of each activity in the permuted technosphere matrix
	std::unique_ptr<tlca::linalg::EigenSolverBase> _solver;

	std::vector<Eigen::VectorXd> _flowColumns;
	std::vector<bool> _flowColumnReady;
};

} // namespace tlca

#endif  // LIBTLCA_TECHNOSPHERESYSTEM_HPP_

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
 * Static life cycle inventory of a functional unit.
 */

#ifndef LIBTLCA_STATICLCA_HPP_
#define LIBTLCA_STATICLCA_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <map>
#include <string>
#include <vector>

namespace tlca
{

class ProcessGraph;

/**
 * @brief External demand mapping activity id to demanded amount
 */
typedef std::map<std::string, double> FunctionalUnit;

/**
 * @brief Scaling and inventory vector of a solved functional unit
 * @details Scaling entries are ordered like ProcessGraph::activityIds() and inventory
 *          entries like ProcessGraph::flowIds().
 */
class TLCA_API LcaResult
{
public:
	LcaResult() : _triangular(false) { }
	LcaResult(std::vector<std::string> activities, std::vector<std::string> flows, std::vector<double> scaling, std::vector<double> inventory, bool triangular);

	inline const std::vector<std::string>& activities() const TLCA_NOEXCEPT { return _activities; }
	inline const std::vector<std::string>& flows() const TLCA_NOEXCEPT { return _flows; }
	inline const std::vector<double>& scaling() const TLCA_NOEXCEPT { return _scaling; }
	inline const std::vector<double>& inventory() const TLCA_NOEXCEPT { return _inventory; }

	/**
	 * @brief Returns the scaling of an activity, throws UnknownNodeException for unknown ids
	 */
	double scaling(const std::string& activity) const;

	/**
	 * @brief Returns the inventory of a flow, throws UnknownNodeException for unknown ids
	 */
	double inventory(const std::string& flow) const;

	std::map<std::string, double> scalingMap() const;
	std::map<std::string, double> inventoryMap() const;

	/**
	 * @brief Total scaling of all activities whose id starts with @p prefix
	 * @details Used to obtain the mass routed to a group of processes.
	 */
	double massFlow(const std::string& prefix) const;

	/**
	 * @brief Returns whether the system was solved by forward substitution
	 */
	inline bool solvedTriangular() const TLCA_NOEXCEPT { return _triangular; }

private:
	std::vector<std::string> _activities;
	std::vector<std::string> _flows;
	std::vector<double> _scaling;
	std::vector<double> _inventory;
	bool _triangular;
};

/**
 * @brief Solves functional units against process graph snapshots
 * @details The solver holds no state besides its configuration, so a single
 *          instance can be used concurrently.
 */
class TLCA_API StaticLcaSolver
{
public:

	/**
	 * @brief Creates the solver
	 * @details Throws InvalidParameterException for unknown solver names.
	 * @param [in] linearSolver @c Auto or a linear solver name (e.g., @c SparseLU, @c SparseQR_NaturalOrdering, @c BiCGSTAB_IncompleteLUT)
	 */
	explicit StaticLcaSolver(const std::string& linearSolver = "Auto");

	/**
	 * @brief Computes scaling vector and inventory of a functional unit
	 * @details Throws UnknownNodeException if @p fu references ids that are no activities of
	 *          @p graph (before anything is assembled) and SingularSystemException if the
	 *          technosphere matrix cannot be inverted.
	 * @param [in] graph Process graph snapshot
	 * @param [in] fu Functional unit
	 * @return Scaling and inventory
	 */
	LcaResult solve(const ProcessGraph& graph, const FunctionalUnit& fu) const;

	inline const std::string& linearSolver() const TLCA_NOEXCEPT { return _linearSolver; }

private:
	std::string _linearSolver;
};

} // namespace tlca

#endif  // LIBTLCA_STATICLCA_HPP_

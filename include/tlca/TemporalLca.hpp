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
 * Temporal convolution of the inventory by traversing the process graph.
 */

#ifndef LIBTLCA_TEMPORALLCA_HPP_
#define LIBTLCA_TEMPORALLCA_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"
#include "tlca/StaticLca.hpp"
#include "tlca/Timeline.hpp"
#include "tlca/TemporalDistribution.hpp"

#include <map>
#include <memory>
#include <string>

namespace tlca
{

class ProcessGraph;
class ITraversalMonitor;

/**
 * @brief Criterion that stops the expansion of a branch
 */
enum class CutoffPolicyType : int
{
	/**
	 * @brief Cut branches whose share of the total inventory falls below a threshold
	 */
	Relative = 0,
	/**
	 * @brief Cut branches below a maximum depth
	 */
	Depth = 1,
	/**
	 * @brief Cut branches that start after a time horizon
	 */
	Horizon = 2
};

TLCA_API const char* to_string(CutoffPolicyType type) TLCA_NOEXCEPT;
TLCA_API CutoffPolicyType toCutoffPolicyType(const std::string& name);

/**
 * @brief Options of the graph traversal
 */
struct TLCA_API TraversalOptions
{
	CutoffPolicyType policy = CutoffPolicyType::Relative;
	double cutoff = 1e-3; //!< Relative threshold of the Relative policy
	unsigned int maxDepth = 100; //!< Deepest expanded level of the Depth policy
	double timeHorizon = 1000.0; //!< Latest expanded time (years) of the Horizon policy
	unsigned int maxCalc = 5000; //!< Maximum number of expanded items
	bool allowNegativeOffsets = false;
	double massBalanceTolerance = 1e-6; //!< Relative tolerance of the mass balance check

	/**
	 * @brief Throws InvalidParameterException for out-of-range values
	 */
	void validate() const;
};

/**
 * @brief Activation of an activity waiting in the traversal frontier
 */
struct TLCA_API TraversalItem
{
	int activity; //!< Index of the activity
	double runs; //!< Number of activity runs (scaling divided by self-production)
	unsigned int depth; //!< Number of exchanges between the item and the functional unit
	TemporalDistribution timing; //!< Absolute activation times (empty for time 0)
	double contribution; //!< Share of the item's cumulative inventory in the total inventory
};

/**
 * @brief Decides whether a frontier item is expanded or cut
 */
class TLCA_API ICutoffPolicy
{
public:
	virtual ~ICutoffPolicy() TLCA_NOEXCEPT { }

	virtual const char* name() const TLCA_NOEXCEPT = 0;

	/**
	 * @brief Returns @c true if the branch starting at @p item is not expanded
	 * @details Items of the functional unit itself (depth 0) are never passed.
	 */
	virtual bool cut(const TraversalItem& item) const = 0;
};

/**
 * @brief Creates the cutoff policy selected by @p opts
 */
TLCA_API std::shared_ptr<const ICutoffPolicy> createCutoffPolicy(const TraversalOptions& opts);

/**
 * @brief Result of a temporal traversal
 * @details The residual holds the cumulative inventory of all branches that were cut,
 *          it is not part of the timeline.
 */
struct TLCA_API TemporalResult
{
	LcaResult staticResult;
	Timeline timeline;
	std::map<std::string, double> residualByFlow; //!< Uncharacterized residual inventory per flow
	std::map<std::string, double> residualActivation; //!< Cut production per activity
	unsigned int numExpanded = 0;
	unsigned int numCut = 0;

	/**
	 * @brief Total absolute residual over all flows
	 */
	double residualMass() const;
};

/**
 * @brief Distributes the inventory of a functional unit in time
 * @details Starting from the functional unit at time 0, the activations are expanded
 *          breadth-first along the technosphere exchanges. Temporal distributions of
 *          the exchanges are convolved along the way. Biosphere exchanges of expanded
 *          activations are emitted into the timeline. Branches rejected by the cutoff
 *          policy, or left over when the expansion budget is exhausted, add their
 *          cumulative inventory to the residual. Timeline and residual are checked
 *          against the static inventory.
 */
class TLCA_API TemporalLcaEngine
{
public:
	explicit TemporalLcaEngine(const TraversalOptions& opts = TraversalOptions(), const std::string& linearSolver = "Auto");

	/**
	 * @brief Replaces the cutoff policy created from the options
	 */
	void setCutoffPolicy(std::shared_ptr<const ICutoffPolicy> policy);

	/**
	 * @brief Runs the traversal
	 * @details Throws UnknownNodeException for unknown demand ids, InvalidTemporalDistributionException
	 *          for disallowed negative offsets (both before any computation),
	 *          SingularSystemException if the static system cannot be solved and
	 *          TemporalMassBalanceException if timeline and residual diverge from the
	 *          static inventory.
	 * @param [in] graph Process graph snapshot
	 * @param [in] fu Functional unit
	 * @param [in] monitor Optional monitor that is notified before each expansion
	 * @return Static inventory, timeline and residual
	 */
	TemporalResult run(const ProcessGraph& graph, const FunctionalUnit& fu, ITraversalMonitor* monitor = nullptr) const;

	inline const TraversalOptions& options() const TLCA_NOEXCEPT { return _opts; }
	inline const ICutoffPolicy& cutoffPolicy() const TLCA_NOEXCEPT { return *_policy; }

private:
	TraversalOptions _opts;
	std::string _linearSolver;
	std::shared_ptr<const ICutoffPolicy> _policy;
};

} // namespace tlca

#endif  // LIBTLCA_TEMPORALLCA_HPP_

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
 * Defines the ProcessGraph of technosphere activities, biosphere flows and their exchanges.
 */

#ifndef LIBTLCA_PROCESSGRAPH_HPP_
#define LIBTLCA_PROCESSGRAPH_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"
#include "tlca/TemporalDistribution.hpp"
#include "tlca/Uncertainty.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tlca
{

/**
 * @brief Kind of a node
 */
enum class NodeKind : int
{
	/**
	 * @brief Activity (process) of the technosphere
	 */
	Technosphere = 0,
	/**
	 * @brief Elementary flow exchanged with the environment
	 */
	Biosphere = 1
};

TLCA_API const char* to_string(NodeKind kind) TLCA_NOEXCEPT;
TLCA_API NodeKind toNodeKind(const std::string& name);

/**
 * @brief Technosphere activity or biosphere flow
 */
struct TLCA_API Node
{
	std::string id;
	NodeKind kind = NodeKind::Technosphere;
	std::string unit;
	std::string name;
};

/**
 * @brief Type of an exchange
 */
enum class ExchangeType : int
{
	/**
	 * @brief Self-production of an activity (input and output are the same activity)
	 */
	Production = 0,
	/**
	 * @brief Consumption of a technosphere activity's product by another activity
	 */
	Technosphere = 1,
	/**
	 * @brief Emission or extraction of a biosphere flow by an activity
	 */
	Biosphere = 2
};

TLCA_API const char* to_string(ExchangeType type) TLCA_NOEXCEPT;
TLCA_API ExchangeType toExchangeType(const std::string& name);

/**
 * @brief Directed edge between a producing node (input) and a consuming activity (output)
 * @details The amount is given per unit output of the consuming activity. An empty
 *          temporal distribution denotes an immediate exchange.
 */
struct TLCA_API Exchange
{
	std::string input;
	std::string output;
	ExchangeType type = ExchangeType::Technosphere;
	double amount = 0.0;
	UncertaintySpec uncertainty;
	TemporalDistribution temporal;

	/**
	 * @brief Returns a human readable description used in messages
	 */
	std::string describe() const;
};

namespace detail
{
	struct GraphTopology;
}

/**
 * @brief Immutable snapshot of the process graph
 * @details The node set and the connectivity are validated once and shared by all
 *          snapshots derived via withAmount(), withAmounts() and withTemporalDistributions().
 *          A snapshot owns its exchange data, so resampled snapshots never share
 *          mutable state with the base graph.
 *
 *          Activities (technosphere nodes) and flows (biosphere nodes) are numbered
 *          separately in the order of their definition.
 */
class TLCA_API ProcessGraph
{
public:

	/**
	 * @brief Creates and validates a process graph
	 * @details Throws InvalidParameterException for duplicate node ids, non-finite amounts,
	 *          invalid uncertainty specifications, or exchanges whose type does not match
	 *          their nodes; UnknownNodeException for exchanges that reference missing nodes;
	 *          InvalidTemporalDistributionException for temporal distributions on production
	 *          exchanges.
	 * @param [in] nodes Nodes of the graph
	 * @param [in] exchanges Exchanges of the graph
	 */
	ProcessGraph(std::vector<Node> nodes, std::vector<Exchange> exchanges);

	~ProcessGraph() TLCA_NOEXCEPT;
	ProcessGraph(const ProcessGraph& cpy);
	ProcessGraph(ProcessGraph&& cpy) TLCA_NOEXCEPT;
	ProcessGraph& operator=(const ProcessGraph& cpy);
	ProcessGraph& operator=(ProcessGraph&& cpy) TLCA_NOEXCEPT;

	const std::vector<Node>& nodes() const TLCA_NOEXCEPT;
	inline const std::vector<Exchange>& exchanges() const TLCA_NOEXCEPT { return _exchanges; }
	inline const Exchange& exchange(unsigned int idx) const { return _exchanges[idx]; }
	inline unsigned int numExchanges() const TLCA_NOEXCEPT { return static_cast<unsigned int>(_exchanges.size()); }

	unsigned int numActivities() const TLCA_NOEXCEPT;
	unsigned int numFlows() const TLCA_NOEXCEPT;
	const std::vector<std::string>& activityIds() const TLCA_NOEXCEPT;
	const std::vector<std::string>& flowIds() const TLCA_NOEXCEPT;

	/**
	 * @brief Returns the index of an activity or @c -1 if there is no such technosphere node
	 */
	int activityIndex(const std::string& id) const;

	/**
	 * @brief Returns the index of a flow or @c -1 if there is no such biosphere node
	 */
	int flowIndex(const std::string& id) const;

	bool contains(const std::string& id) const;

	/**
	 * @brief Returns a node by id, throws UnknownNodeException if it does not exist
	 */
	const Node& node(const std::string& id) const;

	/**
	 * @brief Returns the self-production of an activity
	 * @details Sum of its production exchanges, or 1 if it has none.
	 */
	inline double production(unsigned int activity) const { return _production[activity]; }

	/**
	 * @brief Technosphere exchanges consumed by an activity (excluding production)
	 * @return Pointer to the exchange indices, see numInputs()
	 */
	int const* inputs(unsigned int activity) const;
	unsigned int numInputs(unsigned int activity) const;

	/**
	 * @brief Biosphere exchanges of an activity
	 * @return Pointer to the exchange indices, see numEmissions()
	 */
	int const* emissions(unsigned int activity) const;
	unsigned int numEmissions(unsigned int activity) const;

	/**
	 * @brief Index of the input node of an exchange
	 * @details Activity index for production and technosphere exchanges, flow index for biosphere exchanges.
	 */
	int exchangeSource(unsigned int idx) const;

	/**
	 * @brief Activity index of the output node of an exchange
	 */
	int exchangeTarget(unsigned int idx) const;

	/**
	 * @brief Returns the index of the exchange between two nodes or @c -1 if there is none
	 * @details Throws InvalidParameterException if more than one exchange connects the nodes.
	 */
	int findExchange(const std::string& input, const std::string& output) const;

	/**
	 * @brief Returns a snapshot with a changed exchange amount
	 * @details Throws UnknownNodeException if no exchange connects @p input and @p output
	 *          and InvalidParameterException if @p amount is not finite.
	 */
	ProcessGraph withAmount(const std::string& input, const std::string& output, double amount) const;

	/**
	 * @brief Returns a snapshot with new amounts for all exchanges (in exchange order)
	 */
	ProcessGraph withAmounts(const std::vector<double>& amounts) const;

	/**
	 * @brief Returns a snapshot with new temporal distributions for all exchanges (in exchange order)
	 */
	ProcessGraph withTemporalDistributions(std::vector<TemporalDistribution> distributions) const;

	/**
	 * @brief Checks the offsets of all temporal distributions
	 * @details Throws InvalidTemporalDistributionException naming the exchange if a negative
	 *          offset is found and @p allowNegativeOffsets is @c false.
	 */
	void validateTemporalDistributions(bool allowNegativeOffsets) const;

private:
	ProcessGraph(std::shared_ptr<const detail::GraphTopology> topology, std::vector<Exchange> exchanges);

	void computeProduction();

	std::shared_ptr<const detail::GraphTopology> _topology;
	std::vector<Exchange> _exchanges;
	std::vector<double> _production;
};

} // namespace tlca

#endif  // LIBTLCA_PROCESSGRAPH_HPP_

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

#include "tlca/ProcessGraph.hpp"
#include "tlca/Exceptions.hpp"
#include "SlicedVector.hpp"
#include "Logging.hpp"

#include <cmath>
#include <unordered_map>
#include <utility>

namespace tlca
{

namespace detail
{
	/**
	 * @brief Validated node set and connectivity shared by all snapshots of a graph
	 */
	struct GraphTopology
	{
		struct Entry
		{
			NodeKind kind;
			int index; //!< Activity or flow index
			std::size_t node; //!< Position in nodes
		};

		std::vector<Node> nodes;
		std::vector<std::string> activityIds;
		std::vector<std::string> flowIds;
		std::unordered_map<std::string, Entry> lookup;

		std::vector<int> source;
		std::vector<int> target;
		std::vector<int> productionExchanges;
		util::SlicedVector<int> inputs;
		util::SlicedVector<int> emissions;

		inline const Entry* find(const std::string& id) const
		{
			const std::unordered_map<std::string, Entry>::const_iterator it = lookup.find(id);
			if (it == lookup.end())
				return nullptr;
			return &it->second;
		}
	};
}

namespace
{
	std::shared_ptr<const detail::GraphTopology> buildTopology(std::vector<Node>&& nodes, const std::vector<Exchange>& exchanges)
	{
		std::shared_ptr<detail::GraphTopology> topo = std::make_shared<detail::GraphTopology>();
		topo->nodes = std::move(nodes);

		for (std::size_t i = 0; i < topo->nodes.size(); ++i)
		{
			const Node& n = topo->nodes[i];
			if (n.id.empty())
				throw InvalidParameterException("Node " + std::to_string(i) + " has an empty id");

			detail::GraphTopology::Entry e;
			e.kind = n.kind;
			e.node = i;
			if (n.kind == NodeKind::Technosphere)
			{
				e.index = static_cast<int>(topo->activityIds.size());
				topo->activityIds.push_back(n.id);
			}
			else
			{
				e.index = static_cast<int>(topo->flowIds.size());
				topo->flowIds.push_back(n.id);
			}

			if (!topo->lookup.emplace(n.id, e).second)
				throw InvalidParameterException("Duplicate node id '" + n.id + "'");
		}

		const std::size_t nActivities = topo->activityIds.size();
		std::vector<std::vector<int>> inputs(nActivities);
		std::vector<std::vector<int>> emissions(nActivities);

		topo->source.resize(exchanges.size());
		topo->target.resize(exchanges.size());
		for (std::size_t i = 0; i < exchanges.size(); ++i)
		{
			const Exchange& ex = exchanges[i];
			const detail::GraphTopology::Entry* const out = topo->find(ex.output);
			if (!out || (out->kind != NodeKind::Technosphere))
				throw UnknownNodeException(ex.output, "referenced as consuming activity by " + ex.describe());

			const detail::GraphTopology::Entry* const in = topo->find(ex.input);
			if (!in)
				throw UnknownNodeException(ex.input, "referenced as input by " + ex.describe());

			switch (ex.type)
			{
				case ExchangeType::Production:
					if (ex.input != ex.output)
						throw InvalidParameterException("Production exchange must have identical input and output: " + ex.describe());
					if (!ex.temporal.empty())
						throw InvalidTemporalDistributionException("Production exchange cannot have a temporal distribution: " + ex.describe());
					topo->productionExchanges.push_back(static_cast<int>(i));
					break;
				case ExchangeType::Technosphere:
					if (in->kind != NodeKind::Technosphere)
						throw UnknownNodeException(ex.input, "is not a technosphere activity but used by " + ex.describe());
					inputs[out->index].push_back(static_cast<int>(i));
					break;
				case ExchangeType::Biosphere:
					if (in->kind != NodeKind::Biosphere)
						throw UnknownNodeException(ex.input, "is not a biosphere flow but used by " + ex.describe());
					emissions[out->index].push_back(static_cast<int>(i));
					break;
			}

			topo->source[i] = in->index;
			topo->target[i] = out->index;
		}

		topo->inputs.reserve(exchanges.size(), nActivities);
		topo->emissions.reserve(exchanges.size(), nActivities);
		for (std::size_t j = 0; j < nActivities; ++j)
		{
			topo->inputs.appendSlice(inputs[j]);
			topo->emissions.appendSlice(emissions[j]);
		}

		return topo;
	}

	void checkExchangeValues(const Exchange& ex)
	{
		if (!std::isfinite(ex.amount))
			throw InvalidParameterException("Amount of " + ex.describe() + " is not finite");

		validateUncertainty(ex.uncertainty, ex.amount, ex.describe());
	}
}

const char* to_string(NodeKind kind) TLCA_NOEXCEPT
{
	switch (kind)
	{
		case NodeKind::Technosphere:
			return "technosphere";
		case NodeKind::Biosphere:
			return "biosphere";
	}
	return "unknown";
}

NodeKind toNodeKind(const std::string& name)
{
	if ((name == "technosphere") || (name == "process") || (name == "activity"))
		return NodeKind::Technosphere;
	else if ((name == "biosphere") || (name == "emission") || (name == "flow"))
		return NodeKind::Biosphere;

	throw InvalidParameterException("Unknown node kind '" + name + "'");
}

const char* to_string(ExchangeType type) TLCA_NOEXCEPT
{
	switch (type)
	{
		case ExchangeType::Production:
			return "production";
		case ExchangeType::Technosphere:
			return "technosphere";
		case ExchangeType::Biosphere:
			return "biosphere";
	}
	return "unknown";
}

ExchangeType toExchangeType(const std::string& name)
{
	if (name == "production")
		return ExchangeType::Production;
	else if (name == "technosphere")
		return ExchangeType::Technosphere;
	else if (name == "biosphere")
		return ExchangeType::Biosphere;

	throw InvalidParameterException("Unknown exchange type '" + name + "'");
}

std::string Exchange::describe() const
{
	return std::string(to_string(type)) + " exchange '" + input + "' -> '" + output + "'";
}

ProcessGraph::ProcessGraph(std::vector<Node> nodes, std::vector<Exchange> exchanges)
	: _topology(buildTopology(std::move(nodes), exchanges)), _exchanges(std::move(exchanges))
{
	for (const Exchange& ex : _exchanges)
		checkExchangeValues(ex);

	computeProduction();

	LOG(Debug) << "Created process graph with " << numActivities() << " activities, " << numFlows() << " flows and " << numExchanges() << " exchanges";
}

ProcessGraph::ProcessGraph(std::shared_ptr<const detail::GraphTopology> topology, std::vector<Exchange> exchanges)
	: _topology(std::move(topology)), _exchanges(std::move(exchanges))
{
	computeProduction();
}

ProcessGraph::~ProcessGraph() TLCA_NOEXCEPT { }
ProcessGraph::ProcessGraph(const ProcessGraph& cpy) = default;
ProcessGraph::ProcessGraph(ProcessGraph&& cpy) TLCA_NOEXCEPT = default;
ProcessGraph& ProcessGraph::operator=(const ProcessGraph& cpy) = default;
ProcessGraph& ProcessGraph::operator=(ProcessGraph&& cpy) TLCA_NOEXCEPT = default;

void ProcessGraph::computeProduction()
{
	_production.assign(_topology->activityIds.size(), 1.0);

	std::vector<bool> explicitProduction(_production.size(), false);
	for (int idx : _topology->productionExchanges)
	{
		const int act = _topology->target[idx];
		if (!explicitProduction[act])
		{
			explicitProduction[act] = true;
			_production[act] = 0.0;
		}
		_production[act] += _exchanges[idx].amount;
	}
}

const std::vector<Node>& ProcessGraph::nodes() const TLCA_NOEXCEPT
{
	return _topology->nodes;
}

unsigned int ProcessGraph::numActivities() const TLCA_NOEXCEPT
{
	return static_cast<unsigned int>(_topology->activityIds.size());
}

unsigned int ProcessGraph::numFlows() const TLCA_NOEXCEPT
{
	return static_cast<unsigned int>(_topology->flowIds.size());
}

const std::vector<std::string>& ProcessGraph::activityIds() const TLCA_NOEXCEPT
{
	return _topology->activityIds;
}

const std::vector<std::string>& ProcessGraph::flowIds() const TLCA_NOEXCEPT
{
	return _topology->flowIds;
}

int ProcessGraph::activityIndex(const std::string& id) const
{
	const detail::GraphTopology::Entry* const e = _topology->find(id);
	if (!e || (e->kind != NodeKind::Technosphere))
		return -1;
	return e->index;
}

int ProcessGraph::flowIndex(const std::string& id) const
{
	const detail::GraphTopology::Entry* const e = _topology->find(id);
	if (!e || (e->kind != NodeKind::Biosphere))
		return -1;
	return e->index;
}

bool ProcessGraph::contains(const std::string& id) const
{
	return _topology->find(id) != nullptr;
}

const Node& ProcessGraph::node(const std::string& id) const
{
	const detail::GraphTopology::Entry* const e = _topology->find(id);
	if (!e)
		throw UnknownNodeException(id, "is not part of the process graph");
	return _topology->nodes[e->node];
}

int const* ProcessGraph::inputs(unsigned int activity) const
{
	return _topology->inputs[activity];
}

unsigned int ProcessGraph::numInputs(unsigned int activity) const
{
	return static_cast<unsigned int>(_topology->inputs.sliceSize(activity));
}

int const* ProcessGraph::emissions(unsigned int activity) const
{
	return _topology->emissions[activity];
}

unsigned int ProcessGraph::numEmissions(unsigned int activity) const
{
	return static_cast<unsigned int>(_topology->emissions.sliceSize(activity));
}

int ProcessGraph::exchangeSource(unsigned int idx) const
{
	return _topology->source[idx];
}

int ProcessGraph::exchangeTarget(unsigned int idx) const
{
	return _topology->target[idx];
}

int ProcessGraph::findExchange(const std::string& input, const std::string& output) const
{
	int found = -1;
	for (std::size_t i = 0; i < _exchanges.size(); ++i)
	{
		if ((_exchanges[i].input != input) || (_exchanges[i].output != output))
			continue;

		if (found >= 0)
			throw InvalidParameterException("More than one exchange connects '" + input + "' and '" + output + "'");

		found = static_cast<int>(i);
	}
	return found;
}

ProcessGraph ProcessGraph::withAmount(const std::string& input, const std::string& output, double amount) const
{
	const int idx = findExchange(input, output);
	if (idx < 0)
	{
		if (!contains(input))
			throw UnknownNodeException(input, "is not part of the process graph");
		throw UnknownNodeException(output, "has no exchange with input '" + input + "'");
	}

	if (!std::isfinite(amount))
		throw InvalidParameterException("Amount of " + _exchanges[idx].describe() + " is not finite");

	std::vector<Exchange> exchanges(_exchanges);
	exchanges[idx].amount = amount;
	return ProcessGraph(_topology, std::move(exchanges));
}

ProcessGraph ProcessGraph::withAmounts(const std::vector<double>& amounts) const
{
	if (amounts.size() != _exchanges.size())
		throw InvalidParameterException("Expected " + std::to_string(_exchanges.size()) + " exchange amounts but got " + std::to_string(amounts.size()));

	std::vector<Exchange> exchanges(_exchanges);
	for (std::size_t i = 0; i < amounts.size(); ++i)
	{
		if (!std::isfinite(amounts[i]))
			throw InvalidParameterException("Amount of " + exchanges[i].describe() + " is not finite");

		exchanges[i].amount = amounts[i];
	}
	return ProcessGraph(_topology, std::move(exchanges));
}

ProcessGraph ProcessGraph::withTemporalDistributions(std::vector<TemporalDistribution> distributions) const
{
	if (distributions.size() != _exchanges.size())
		throw InvalidParameterException("Expected " + std::to_string(_exchanges.size()) + " temporal distributions but got " + std::to_string(distributions.size()));

	std::vector<Exchange> exchanges(_exchanges);
	for (std::size_t i = 0; i < distributions.size(); ++i)
	{
		if ((exchanges[i].type == ExchangeType::Production) && !distributions[i].empty())
			throw InvalidTemporalDistributionException("Production exchange cannot have a temporal distribution: " + exchanges[i].describe());

		exchanges[i].temporal = std::move(distributions[i]);
	}
	return ProcessGraph(_topology, std::move(exchanges));
}

void ProcessGraph::validateTemporalDistributions(bool allowNegativeOffsets) const
{
	for (const Exchange& ex : _exchanges)
		ex.temporal.checkOffsets(allowNegativeOffsets, ex.describe());
}

} // namespace tlca

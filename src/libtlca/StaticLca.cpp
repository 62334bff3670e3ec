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

#include "tlca/StaticLca.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/Exceptions.hpp"
#include "TechnosphereSystem.hpp"
#include "Logging.hpp"
#include "LoggingUtils.hpp"

#include <algorithm>
#include <utility>

namespace
{
	int indexOf(const std::vector<std::string>& ids, const std::string& id)
	{
		const std::vector<std::string>::const_iterator it = std::find(ids.begin(), ids.end(), id);
		if (it == ids.end())
			return -1;
		return static_cast<int>(it - ids.begin());
	}

	std::map<std::string, double> toMap(const std::vector<std::string>& ids, const std::vector<double>& values)
	{
		std::map<std::string, double> m;
		for (std::size_t i = 0; i < ids.size(); ++i)
			m[ids[i]] = values[i];
		return m;
	}
}

namespace tlca
{

LcaResult::LcaResult(std::vector<std::string> activities, std::vector<std::string> flows, std::vector<double> scaling, std::vector<double> inventory, bool triangular)
	: _activities(std::move(activities)), _flows(std::move(flows)), _scaling(std::move(scaling)), _inventory(std::move(inventory)), _triangular(triangular)
{
}

double LcaResult::scaling(const std::string& activity) const
{
	const int idx = indexOf(_activities, activity);
	if (idx < 0)
		throw UnknownNodeException(activity, "in scaling vector");
	return _scaling[idx];
}

double LcaResult::inventory(const std::string& flow) const
{
	const int idx = indexOf(_flows, flow);
	if (idx < 0)
		throw UnknownNodeException(flow, "in inventory vector");
	return _inventory[idx];
}

std::map<std::string, double> LcaResult::scalingMap() const
{
	return toMap(_activities, _scaling);
}

std::map<std::string, double> LcaResult::inventoryMap() const
{
	return toMap(_flows, _inventory);
}

double LcaResult::massFlow(const std::string& prefix) const
{
	double total = 0.0;
	for (std::size_t i = 0; i < _activities.size(); ++i)
	{
		if (_activities[i].compare(0, prefix.size(), prefix) == 0)
			total += _scaling[i];
	}
	return total;
}

StaticLcaSolver::StaticLcaSolver(const std::string& linearSolver) : _linearSolver(linearSolver)
{
	if (!tlca::linalg::isKnownLinearSolver(_linearSolver))
		throw InvalidParameterException("Unknown linear solver name: " + _linearSolver);
}

LcaResult StaticLcaSolver::solve(const ProcessGraph& graph, const FunctionalUnit& fu) const
{
	const Eigen::VectorXd demand = TechnosphereSystem::assembleDemand(graph, fu);

	TechnosphereSystem system(graph, _linearSolver);
	const Eigen::VectorXd s = system.solve(demand);
	const Eigen::VectorXd g = system.inventory(s);

	LOG(Trace) << "Scaling " << log::labeled(graph.activityIds(), s.data());
	LOG(Trace) << "Inventory " << log::labeled(graph.flowIds(), g.data());

	return LcaResult(graph.activityIds(), graph.flowIds(), std::vector<double>(s.data(), s.data() + s.size()),
		std::vector<double>(g.data(), g.data() + g.size()), system.isTriangular());
}

} // namespace tlca

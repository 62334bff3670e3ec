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

#include "tlca/TemporalLca.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/Notification.hpp"
#include "tlca/Exceptions.hpp"
#include "TechnosphereSystem.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <utility>

namespace tlca
{

double TemporalResult::residualMass() const
{
	double mass = 0.0;
	for (const std::pair<const std::string, double>& r : residualByFlow)
		mass += std::abs(r.second);
	return mass;
}

TemporalLcaEngine::TemporalLcaEngine(const TraversalOptions& opts, const std::string& linearSolver) : _opts(opts), _linearSolver(linearSolver)
{
	_opts.validate();
	if (!tlca::linalg::isKnownLinearSolver(_linearSolver))
		throw InvalidParameterException("Unknown linear solver name: " + _linearSolver);

	_policy = createCutoffPolicy(_opts);
}

void TemporalLcaEngine::setCutoffPolicy(std::shared_ptr<const ICutoffPolicy> policy)
{
	if (!policy)
		throw InvalidParameterException("Cutoff policy must not be empty");

	_policy = std::move(policy);
}

TemporalResult TemporalLcaEngine::run(const ProcessGraph& graph, const FunctionalUnit& fu, ITraversalMonitor* monitor) const
{
	const Eigen::VectorXd demand = TechnosphereSystem::assembleDemand(graph, fu);
	graph.validateTemporalDistributions(_opts.allowNegativeOffsets);

	TechnosphereSystem system(graph, _linearSolver);
	const Eigen::VectorXd s = system.solve(demand);
	const Eigen::VectorXd g = system.inventory(s);

	const std::vector<std::string>& activityIds = graph.activityIds();
	const std::vector<std::string>& flowIds = graph.flowIds();

	// Seed the frontier with the functional unit at time 0
	std::deque<TraversalItem> frontier;
	double rootTotal = 0.0;
	for (unsigned int j = 0; j < graph.numActivities(); ++j)
	{
		if (demand[j] == 0.0)
			continue;

		const double runs = demand[j] / graph.production(j);
		const double contribution = std::abs(runs * graph.production(j)) * system.flowColumn(j).lpNorm<1>();
		rootTotal += contribution;
		frontier.push_back(TraversalItem{static_cast<int>(j), runs, 0, TemporalDistribution(), contribution});
	}

	for (TraversalItem& item : frontier)
		item.contribution = (rootTotal > 0.0) ? item.contribution / rootTotal : 0.0;

	std::vector<TimelineEntry> entries;
	Eigen::VectorXd residual = Eigen::VectorXd::Zero(graph.numFlows());
	std::vector<double> residualActivation(graph.numActivities(), 0.0);
	unsigned int numExpanded = 0;
	unsigned int numCut = 0;

	while (!frontier.empty())
	{
		const TraversalItem item = std::move(frontier.front());
		frontier.pop_front();

		if (monitor)
			monitor->traversalStep(numExpanded);

		const double production = graph.production(item.activity);
		if ((numExpanded >= _opts.maxCalc) || ((item.depth > 0) && _policy->cut(item)))
		{
			// The cumulative inventory of the whole branch goes into the residual
			residual += (item.runs * production) * system.flowColumn(item.activity);
			residualActivation[item.activity] += item.runs * production;
			++numCut;
			continue;
		}

		++numExpanded;

		int const* const emissions = graph.emissions(item.activity);
		for (unsigned int k = 0; k < graph.numEmissions(item.activity); ++k)
		{
			const Exchange& ex = graph.exchange(emissions[k]);
			const double amount = ex.amount * item.runs;
			if (amount == 0.0)
				continue;

			const std::string& flow = flowIds[graph.exchangeSource(emissions[k])];
			const TemporalDistribution timing = item.timing.convolve(ex.temporal);
			if (timing.empty())
				entries.push_back(TimelineEntry{0.0, flow, activityIds[item.activity], amount});
			else
			{
				for (std::size_t t = 0; t < timing.size(); ++t)
					entries.push_back(TimelineEntry{timing.offset(t), flow, activityIds[item.activity], amount * timing.fraction(t)});
			}
		}

		int const* const inputs = graph.inputs(item.activity);
		for (unsigned int k = 0; k < graph.numInputs(item.activity); ++k)
		{
			const Exchange& ex = graph.exchange(inputs[k]);
			const int supplier = graph.exchangeSource(inputs[k]);
			const double runs = ex.amount * item.runs / graph.production(supplier);
			if (runs == 0.0)
				continue;

			const double contribution = (rootTotal > 0.0) ? std::abs(runs * graph.production(supplier)) * system.flowColumn(supplier).lpNorm<1>() / rootTotal : 0.0;
			frontier.push_back(TraversalItem{supplier, runs, item.depth + 1, item.timing.convolve(ex.temporal), contribution});
		}
	}

	if (numExpanded >= _opts.maxCalc)
		LOG(Warning) << "Traversal stopped after " << numExpanded << " expanded items (MAX_CALC), remaining branches were moved into the residual";

	TemporalResult result;
	result.timeline = Timeline(std::move(entries));
	result.numExpanded = numExpanded;
	result.numCut = numCut;

	// Mass balance of timeline and residual against the static inventory
	const std::map<std::string, double> totals = result.timeline.totalByFlow();
	for (unsigned int k = 0; k < graph.numFlows(); ++k)
	{
		const std::map<std::string, double>::const_iterator it = totals.find(flowIds[k]);
		const double emitted = (it == totals.end()) ? 0.0 : it->second;
		const double actual = emitted + residual[k];
		const double expected = g[k];

		if (!(std::abs(actual - expected) <= _opts.massBalanceTolerance * std::max(1.0, std::abs(expected))))
		{
			LOG(Error) << "Mass balance of flow " << flowIds[k] << " violated: expected " << expected << ", got " << actual;
			throw TemporalMassBalanceException(flowIds[k], expected, actual, _opts.massBalanceTolerance);
		}

		result.residualByFlow[flowIds[k]] = residual[k];
	}

	for (unsigned int j = 0; j < graph.numActivities(); ++j)
	{
		if (residualActivation[j] != 0.0)
			result.residualActivation[activityIds[j]] = residualActivation[j];
	}

	result.staticResult = LcaResult(activityIds, flowIds, std::vector<double>(s.data(), s.data() + s.size()),
		std::vector<double>(g.data(), g.data() + g.size()), system.isTriangular());

	LOG(Debug) << "Traversal (" << _policy->name() << " cutoff) expanded " << numExpanded << " items, cut " << numCut
		<< " branches, " << result.timeline.size() << " timeline entries, residual " << result.residualMass();

	return result;
}

} // namespace tlca

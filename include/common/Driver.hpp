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
 * Provides a driver for configuring and running a TLCA computation
 */

#ifndef TLCA_DRIVER_HPP_
#define TLCA_DRIVER_HPP_

#include <string>
#include <sstream>
#include <iomanip>
#include <vector>
#include <map>
#include <memory>

#include "tlca/tlca.hpp"
#include "common/JsonParameterProvider.hpp"

namespace tlca
{

/**
 * @brief Computation performed by the Driver
 */
enum class RunMode : int
{
	Static,
	Dynamic,
	MonteCarlo
};

inline const char* to_string(RunMode mode) TLCA_NOEXCEPT
{
	switch (mode)
	{
		case RunMode::Static:
			return "static";
		case RunMode::Dynamic:
			return "dynamic";
		case RunMode::MonteCarlo:
			return "montecarlo";
	}
	return "unknown";
}

inline RunMode toRunMode(const std::string& name)
{
	if (name == "static")
		return RunMode::Static;
	else if (name == "dynamic")
		return RunMode::Dynamic;
	else if (name == "montecarlo")
		return RunMode::MonteCarlo;

	throw InvalidParameterException("Unknown run mode '" + name + "'");
}

namespace detail
{

	template <class Writer_t>
	void writeStatistics(Writer_t& writer, const std::string& group, const SummaryStatistics& stats)
	{
		writer.addScope(group);
		writer.pushScope(group);

		writer.set("COUNT", static_cast<uint64_t>(stats.count));
		writer.set("MEAN", stats.mean);
		writer.set("STDDEV", stats.stdDev);
		writer.set("MIN", stats.min);
		writer.set("MAX", stats.max);

		std::vector<double> p;
		std::vector<double> v;
		p.reserve(stats.percentiles.size());
		v.reserve(stats.percentiles.size());
		for (const std::pair<const double, double>& pv : stats.percentiles)
		{
			p.push_back(pv.first);
			v.push_back(pv.second);
		}
		writer.set("PERCENTILES", p);
		writer.set("PERCENTILE_VALUES", v);

		writer.popScope();
	}

	template <class Writer_t>
	void writeStatisticsMap(Writer_t& writer, const std::string& group, const std::map<std::string, SummaryStatistics>& stats)
	{
		writer.addScope(group);
		writer.pushScope(group);
		for (const std::pair<const std::string, SummaryStatistics>& s : stats)
			writeStatistics(writer, s.first, s.second);
		writer.popScope();
	}

	template <class Writer_t>
	void writeMap(Writer_t& writer, const std::string& keyName, const std::string& valueName, const std::map<std::string, double>& data)
	{
		std::vector<std::string> keys;
		std::vector<double> values;
		keys.reserve(data.size());
		values.reserve(data.size());
		for (const std::pair<const std::string, double>& kv : data)
		{
			keys.push_back(kv.first);
			values.push_back(kv.second);
		}
		writer.set(keyName, keys);
		writer.set(valueName, values);
	}

	inline std::string indexedScope(const std::string& prefix, std::size_t idx)
	{
		std::ostringstream oss;
		oss << prefix << "_" << std::setfill('0') << std::setw(3) << idx;
		return oss.str();
	}

} // namespace detail

/**
 * @brief Reads a complete configuration, runs it and writes the results
 * @details The configuration is read from the scopes documented in Configuration.hpp.
 *          Results are written to the @c output scope of a JsonParameterProvider.
 */
class Driver
{
public:

	Driver() : _mode(RunMode::Static), _linearSolver("Auto"), _notification(nullptr), _staticScore(0.0) { }

	/**
	 * @brief Reads all configuration scopes
	 * @details Throws InvalidParameterException on malformed input.
	 * @param [in] pp Parameter provider opened at the root scope
	 */
	void configure(IParameterProvider& pp)
	{
		_graph = std::make_unique<ProcessGraph>(readProcessGraph(pp));
		_linearSolver = readLinearSolver(pp);
		_fu = readFunctionalUnit(pp);
		_traversalOpts = readTraversalOptions(pp);
		_method = std::make_unique<CharacterizationMethod>(readCharacterizationMethod(pp));
		_mcConfig = readMonteCarloConfig(pp);

		_staticResult.reset();
		_temporalResult.reset();
		_mcResult.reset();
	}

	inline void setNotificationCallback(INotificationCallback* nc) TLCA_NOEXCEPT { _notification = nc; }

	/**
	 * @brief Runs the configured computation
	 * @details Exceptions of the computation are passed on, results of a previous run are discarded.
	 * @param [in] mode Computation to perform
	 */
	void run(RunMode mode)
	{
		if (!_graph)
			throw InvalidParameterException("Driver has not been configured");

		_mode = mode;
		_staticResult.reset();
		_temporalResult.reset();
		_mcResult.reset();
		_impactCurve = ImpactCurve();
		_annual.clear();

		switch (mode)
		{
			case RunMode::Static:
			{
				StaticLcaSolver solver(_linearSolver);
				_staticResult = std::make_unique<LcaResult>(solver.solve(*_graph, _fu));
				_staticScore = staticScore(*_staticResult, *_method);
				break;
			}
			case RunMode::Dynamic:
			{
				TemporalLcaEngine engine(_traversalOpts, _linearSolver);
				_temporalResult = std::make_unique<TemporalResult>(engine.run(*_graph, _fu));
				_staticScore = staticScore(_temporalResult->staticResult, *_method);
				_impactCurve = characterize(_temporalResult->timeline, *_method);
				_annual = annualImpacts(_temporalResult->timeline, *_method);
				break;
			}
			case RunMode::MonteCarlo:
			{
				MonteCarloPropagator mc(_mcConfig, _linearSolver);
				mc.setTraversalOptions(_traversalOpts);
				mc.setCharacterizationMethod(*_method);
				mc.setNotificationCallback(_notification);
				_mcResult = std::make_unique<MonteCarloResult>(mc.run(*_graph, _fu));
				break;
			}
		}
	}

	/**
	 * @brief Writes the results of the last run to the given writer
	 * @details Replaces an existing @c output scope and updates the @c meta scope.
	 * @param [in] writer Writer opened at the root scope
	 */
	void write(JsonParameterProvider& writer) const
	{
		if (writer.exists("output"))
			writer.remove("output");

		writer.addScope("output");
		writer.pushScope("output");
		writer.set("MODE", to_string(_mode));

		if (_staticResult)
			writeStatic(writer, *_staticResult);

		if (_temporalResult)
		{
			writeStatic(writer, _temporalResult->staticResult);
			writeTemporal(writer);
		}

		if (_mcResult)
			writeMonteCarlo(writer);

		writer.popScope();

		writer.addScope("meta");
		writer.pushScope("meta");
		writer.set("TLCA_VERSION", getLibraryVersion());
		writer.set("TLCA_DEPENDENCIES", getLibraryDependencyVersions());
		writer.popScope();
	}

	inline const ProcessGraph* graph() const TLCA_NOEXCEPT { return _graph.get(); }
	inline const FunctionalUnit& functionalUnit() const TLCA_NOEXCEPT { return _fu; }
	inline const MonteCarloResult* monteCarloResult() const TLCA_NOEXCEPT { return _mcResult.get(); }

protected:

	void writeStatic(JsonParameterProvider& writer, const LcaResult& res) const
	{
		writer.set("ACTIVITIES", res.activities());
		writer.set("SCALING", res.scaling());
		writer.set("FLOWS", res.flows());
		writer.set("INVENTORY", res.inventory());
		writer.set("SOLVED_TRIANGULAR", res.solvedTriangular());
		writer.set("STATIC_SCORE", _staticScore);
	}

	void writeTemporal(JsonParameterProvider& writer) const
	{
		const TemporalResult& res = *_temporalResult;

		writer.addScope("timeline");
		writer.pushScope("timeline");
		{
			std::vector<double> time;
			std::vector<std::string> flow;
			std::vector<std::string> activity;
			std::vector<double> amount;
			for (const TimelineEntry& e : res.timeline)
			{
				time.push_back(e.time);
				flow.push_back(e.flow);
				activity.push_back(e.activity);
				amount.push_back(e.amount);
			}
			writer.set("TIME", time);
			writer.set("FLOW", flow);
			writer.set("ACTIVITY", activity);
			writer.set("AMOUNT", amount);
		}
		writer.popScope();

		writer.addScope("residual");
		writer.pushScope("residual");
		detail::writeMap(writer, "FLOWS", "AMOUNTS", res.residualByFlow);
		detail::writeMap(writer, "ACTIVITIES", "ACTIVATION", res.residualActivation);
		writer.set("TOTAL_MASS", res.residualMass());
		writer.popScope();

		writer.set("NUM_EXPANDED", static_cast<uint64_t>(res.numExpanded));
		writer.set("NUM_CUT", static_cast<uint64_t>(res.numCut));

		writer.addScope("impact");
		writer.pushScope("impact");
		writer.set("TIME", _impactCurve.times);
		writer.set("VALUE", _impactCurve.values);
		writer.set("DYNAMIC_SCORE", _impactCurve.finalValue());
		writer.set("HORIZON", _method->horizon());
		writer.popScope();

		writer.addScope("annual");
		writer.pushScope("annual");
		{
			std::vector<int> year;
			std::vector<std::string> flow;
			std::vector<std::string> activity;
			std::vector<double> impact;
			for (const AnnualImpact& a : _annual)
			{
				year.push_back(a.year);
				flow.push_back(a.flow);
				activity.push_back(a.activity);
				impact.push_back(a.impact);
			}
			writer.set("YEAR", year);
			writer.set("FLOW", flow);
			writer.set("ACTIVITY", activity);
			writer.set("IMPACT", impact);
		}
		writer.popScope();
	}

	void writeMonteCarlo(JsonParameterProvider& writer) const
	{
		const MonteCarloResult& res = *_mcResult;

		writer.set("NSAMPLES", res.nRequested);
		writer.set("NSUCCEEDED", res.nSucceeded);
		writer.set("NCOMPLETED", res.nCompleted());
		writer.set("CANCELLED", res.cancelled);
		writer.set("FAILURE_RATE", res.failureRate());
		writer.set("ACTIVITIES", res.activities);
		writer.set("FLOWS", res.flows);

		detail::writeStatisticsMap(writer, "inventory", res.inventory);
		detail::writeStatisticsMap(writer, "scaling", res.scaling);
		detail::writeStatistics(writer, "static_score", res.staticScore);

		if (!res.curveTimes.empty())
		{
			detail::writeStatistics(writer, "dynamic_score", res.dynamicScore);

			writer.addScope("impact_curve");
			writer.pushScope("impact_curve");
			writer.set("TIME", res.curveTimes);

			std::vector<double> mean;
			std::vector<double> stdDev;
			std::vector<double> minVal;
			std::vector<double> maxVal;
			for (const SummaryStatistics& s : res.curve)
			{
				mean.push_back(s.mean);
				stdDev.push_back(s.stdDev);
				minVal.push_back(s.min);
				maxVal.push_back(s.max);
			}
			writer.set("MEAN", mean);
			writer.set("STDDEV", stdDev);
			writer.set("MIN", minVal);
			writer.set("MAX", maxVal);

			for (double p : _mcConfig.percentiles)
			{
				std::vector<double> pv;
				pv.reserve(res.curve.size());
				for (const SummaryStatistics& s : res.curve)
				{
					const std::map<double, double>::const_iterator it = s.percentiles.find(p);
					pv.push_back(it != s.percentiles.end() ? it->second : s.mean);
				}
				writer.set("PERCENTILE_" + std::to_string(p), pv);
			}
			writer.popScope();
		}

		writer.addScope("failed");
		writer.pushScope("failed");
		{
			std::vector<uint64_t> index;
			std::vector<uint64_t> seed;
			std::vector<std::string> kind;
			std::vector<std::string> message;
			for (const FailedSample& f : res.failedSamples)
			{
				index.push_back(f.index);
				seed.push_back(f.seed);
				kind.push_back(to_string(f.kind));
				message.push_back(f.message);
			}
			writer.set("INDEX", index);
			writer.set("SEED", seed);
			writer.set("KIND", kind);
			writer.set("MESSAGE", message);
		}
		writer.popScope();

		if (!res.samples.empty())
		{
			writer.addScope("samples");
			writer.pushScope("samples");
			std::vector<double> staticScores;
			std::vector<double> dynamicScores;
			std::vector<uint64_t> index;
			std::vector<uint64_t> seed;
			for (std::size_t i = 0; i < res.samples.size(); ++i)
			{
				const SampleResult& s = res.samples[i];
				index.push_back(s.index);
				seed.push_back(s.seed);
				staticScores.push_back(s.staticScore);
				dynamicScores.push_back(s.dynamicScore);

				// Vectors are ordered like ACTIVITIES and FLOWS of the enclosing scope
				const std::string scope = detail::indexedScope("sample", i);
				writer.addScope(scope);
				writer.pushScope(scope);
				writer.set("INDEX", s.index);
				writer.set("SEED", s.seed);
				writer.set("SCALING", s.scaling);
				writer.set("INVENTORY", s.inventory);
				if (!s.impactCurve.empty())
					writer.set("IMPACT_CURVE", s.impactCurve);
				writer.popScope();
			}
			writer.set("NSAMPLES", static_cast<uint64_t>(res.samples.size()));
			writer.set("INDEX", index);
			writer.set("SEED", seed);
			writer.set("STATIC_SCORE", staticScores);
			writer.set("DYNAMIC_SCORE", dynamicScores);
			writer.popScope();
		}
	}

	RunMode _mode;
	std::unique_ptr<ProcessGraph> _graph;
	std::string _linearSolver;
	FunctionalUnit _fu;
	TraversalOptions _traversalOpts;
	std::unique_ptr<CharacterizationMethod> _method;
	MonteCarloConfig _mcConfig;
	INotificationCallback* _notification;

	std::unique_ptr<LcaResult> _staticResult;
	std::unique_ptr<TemporalResult> _temporalResult;
	std::unique_ptr<MonteCarloResult> _mcResult;
	double _staticScore;
	ImpactCurve _impactCurve;
	std::vector<AnnualImpact> _annual;
};

} // namespace tlca

#endif  // TLCA_DRIVER_HPP_

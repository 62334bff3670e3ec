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

#include "tlca/MonteCarlo.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/Notification.hpp"
#include "tlca/Exceptions.hpp"
#include "tlca/HashUtil.hpp"
#include "common/TimeoutMonitor.hpp"
#include "common/Timer.hpp"
#include "TechnosphereSystem.hpp"
#include "Logging.hpp"

#include <tbb/parallel_pipeline.h>
#include <tbb/task_arena.h>

#include <atomic>
#include <cmath>
#include <random>
#include <utility>

namespace
{
	class CancelRequestReset
	{
	public:
		explicit CancelRequestReset(std::atomic<bool>& flag) : _flag(flag) { }
		~CancelRequestReset() { _flag.store(false); }

	private:
		std::atomic<bool>& _flag;
	};
}

namespace tlca
{

struct MonteCarloPropagator::SampleOutcome
{
	bool success = false;
	SampleResult result;
	FailedSample failure;
};

void MonteCarloConfig::validate() const
{
	if (nSamples == 0)
		throw InvalidParameterException("Number of Monte Carlo samples (NSAMPLES) has to be positive");
	if (nThreads < 0)
		throw InvalidParameterException("Number of threads (NTHREADS) must not be negative");
	if (!std::isfinite(temporalSigma) || (temporalSigma < 0.0))
		throw InvalidParameterException("TEMPORAL_SIGMA has to be non-negative, got " + std::to_string(temporalSigma));
	if (!(maxFailureRate >= 0.0) || !(maxFailureRate <= 1.0))
		throw InvalidParameterException("MAX_FAILURE_RATE has to be in [0, 1], got " + std::to_string(maxFailureRate));
	if (!std::isfinite(sampleTimeout) || (sampleTimeout < 0.0))
		throw InvalidParameterException("SAMPLE_TIMEOUT must not be negative, got " + std::to_string(sampleTimeout));
	for (double p : percentiles)
	{
		if (!(p >= 0.0) || !(p <= 100.0))
			throw InvalidParameterException("Percentile has to be in [0, 100], got " + std::to_string(p));
	}
}

const char* to_string(SampleFailureKind kind) TLCA_NOEXCEPT
{
	switch (kind)
	{
		case SampleFailureKind::Singular:
			return "singular";
		case SampleFailureKind::MassBalance:
			return "mass_balance";
		case SampleFailureKind::Timeout:
			return "timeout";
	}
	return "unknown";
}

double MonteCarloResult::failureRate() const TLCA_NOEXCEPT
{
	const uint64_t n = nCompleted();
	if (n == 0)
		return 0.0;
	return static_cast<double>(failedSamples.size()) / static_cast<double>(n);
}

uint64_t deriveSampleSeed(uint64_t baseSeed, uint64_t sampleIndex) TLCA_NOEXCEPT
{
	uint64_t seed = baseSeed;
	hash_combine(seed, sampleIndex);
	return seed;
}

ProcessGraph resampleGraph(const ProcessGraph& graph, uint64_t sampleSeed, bool resampleTemporal, double temporalSigma)
{
	std::mt19937_64 rng(sampleSeed);

	std::vector<double> amounts(graph.numExchanges());
	for (unsigned int i = 0; i < graph.numExchanges(); ++i)
	{
		const Exchange& ex = graph.exchange(i);
		amounts[i] = sampleAmount(ex.uncertainty, ex.amount, rng);
	}

	if (!resampleTemporal)
		return graph.withAmounts(amounts);

	std::lognormal_distribution<double> perturbation(0.0, temporalSigma);
	std::vector<TemporalDistribution> distributions;
	distributions.reserve(graph.numExchanges());
	for (unsigned int i = 0; i < graph.numExchanges(); ++i)
	{
		const TemporalDistribution& td = graph.exchange(i).temporal;

		// A single point always carries the full amount
		if (td.size() <= 1)
		{
			distributions.push_back(td);
			continue;
		}

		std::vector<double> weights(td.size());
		for (std::size_t k = 0; k < td.size(); ++k)
			weights[k] = td.fraction(k) * perturbation(rng);

		distributions.push_back(td.reweighted(weights));
	}

	return graph.withAmounts(amounts).withTemporalDistributions(std::move(distributions));
}

MonteCarloPropagator::MonteCarloPropagator(const MonteCarloConfig& config, const std::string& linearSolver)
	: _config(config), _solver(linearSolver), _linearSolver(linearSolver), _method(CharacterizationMethod::climateChange()), _notification(nullptr), _cancel(false)
{
	_config.validate();
}

void MonteCarloPropagator::setTraversalOptions(const TraversalOptions& opts)
{
	opts.validate();
	_traversalOpts = opts;
}

void MonteCarloPropagator::setCharacterizationMethod(const CharacterizationMethod& method)
{
	_method = method;
}

MonteCarloPropagator::SampleOutcome MonteCarloPropagator::computeSample(const ProcessGraph& graph, const FunctionalUnit& fu, const TemporalLcaEngine& engine, uint64_t index) const
{
	SampleOutcome outcome;
	const uint64_t seed = deriveSampleSeed(_config.seed, index);

	try
	{
		TimeoutMonitor monitor(index, _config.sampleTimeout);

		const ProcessGraph snapshot = resampleGraph(graph, seed, _config.resampleTemporal, _config.temporalSigma);
		monitor.check();

		SampleResult& res = outcome.result;
		res.index = index;
		res.seed = seed;

		if (_config.impactCurves)
		{
			const TemporalResult tr = engine.run(snapshot, fu, &monitor);
			monitor.check();

			const ImpactCurve curve = characterize(tr.timeline, _method, 0.0, _method.horizon());
			res.scaling = tr.staticResult.scaling();
			res.inventory = tr.staticResult.inventory();
			res.staticScore = staticScore(tr.staticResult, _method);
			res.dynamicScore = curve.finalValue();
			res.impactCurve = curve.values;
		}
		else
		{
			const LcaResult lca = _solver.solve(snapshot, fu);
			res.scaling = lca.scaling();
			res.inventory = lca.inventory();
			res.staticScore = staticScore(lca, _method);
		}

		monitor.check();
		outcome.success = true;
	}
	catch (const SingularSystemException& e)
	{
		outcome.failure = FailedSample{index, seed, SampleFailureKind::Singular, e.what()};
	}
	catch (const TemporalMassBalanceException& e)
	{
		outcome.failure = FailedSample{index, seed, SampleFailureKind::MassBalance, e.what()};
	}
	catch (const SampleTimeoutException& e)
	{
		outcome.failure = FailedSample{index, seed, SampleFailureKind::Timeout, e.what()};
	}

	return outcome;
}

MonteCarloResult MonteCarloPropagator::run(const ProcessGraph& graph, const FunctionalUnit& fu)
{
	CancelRequestReset cancelReset(_cancel);

	// Caller errors are not sample failures
	TechnosphereSystem::assembleDemand(graph, fu);
	if (_config.impactCurves)
	{
		graph.validateTemporalDistributions(_traversalOpts.allowNegativeOffsets);
		for (const std::string& flow : graph.flowIds())
		{
			if (_method.includes(flow) && !_method.findKernel(flow))
			{
				LOG(Error) << "Flow " << flow << " has no characterization kernel";
				throw UnresolvedFlowException(flow);
			}
		}
	}

	const TemporalLcaEngine engine(_traversalOpts, _linearSolver);
	const uint64_t nSamples = _config.nSamples;

	tbb::task_arena arena((_config.nThreads > 0) ? _config.nThreads : tbb::task_arena::automatic);
	const std::size_t nTokens = (_config.channelCapacity > 0) ? _config.channelCapacity : 4 * static_cast<std::size_t>(arena.max_concurrency());

	LOG(Info) << "Monte Carlo run with " << nSamples << " samples on " << arena.max_concurrency() << " threads, seed " << _config.seed;

	if (_notification)
		_notification->monteCarloStart(nSamples);

	// Outcomes are stored by sample index, so aggregation does not depend on completion order
	std::vector<SampleOutcome> outcomes(nSamples);
	std::vector<char> collected(nSamples, 0);
	uint64_t nextSample = 0;
	uint64_t nCollected = 0;
	bool cancelled = false;

	Timer timer;
	timer.start();

	arena.execute([&]()
		{
			tbb::parallel_pipeline(nTokens,
				tbb::make_filter<void, uint64_t>(tbb::filter_mode::serial_in_order,
					[&](tbb::flow_control& fc) -> uint64_t
					{
						if ((nextSample >= nSamples) || _cancel.load())
						{
							fc.stop();
							return 0;
						}
						return nextSample++;
					})
				& tbb::make_filter<uint64_t, std::pair<uint64_t, SampleOutcome>>(tbb::filter_mode::parallel,
					[&](uint64_t idx) -> std::pair<uint64_t, SampleOutcome>
					{
						return std::make_pair(idx, computeSample(graph, fu, engine, idx));
					})
				& tbb::make_filter<std::pair<uint64_t, SampleOutcome>, void>(tbb::filter_mode::serial_out_of_order,
					[&](std::pair<uint64_t, SampleOutcome> item)
					{
						const uint64_t idx = item.first;
						if (!item.second.success)
							LOG(Warning) << "Sample " << idx << " failed (" << to_string(item.second.failure.kind) << "): " << item.second.failure.message;

						const bool success = item.second.success;
						outcomes[idx] = std::move(item.second);
						collected[idx] = 1;
						++nCollected;

						if (_notification && !_notification->sampleCompleted(idx, success, nCollected, nSamples))
							_cancel.store(true);
					})
			);
		});

	cancelled = (nCollected < nSamples);
	if (cancelled)
		LOG(Warning) << "Monte Carlo run cancelled after " << nCollected << " of " << nSamples << " samples";

	LOG(Info) << "Monte Carlo run finished in " << timer.elapsed() << " s";

	if (_notification)
		_notification->monteCarloEnd(cancelled);

	MonteCarloResult result;
	result.nRequested = nSamples;
	result.cancelled = cancelled;
	result.activities = graph.activityIds();
	result.flows = graph.flowIds();

	std::vector<const SampleResult*> successful;
	successful.reserve(nCollected);
	for (uint64_t i = 0; i < nSamples; ++i)
	{
		if (!collected[i])
			continue;

		if (outcomes[i].success)
			successful.push_back(&outcomes[i].result);
		else
			result.failedSamples.push_back(outcomes[i].failure);
	}
	result.nSucceeded = successful.size();

	const double rate = result.failureRate();
	if (rate > _config.maxFailureRate)
	{
		std::vector<uint64_t> failed;
		failed.reserve(result.failedSamples.size());
		for (const FailedSample& fs : result.failedSamples)
			failed.push_back(fs.index);

		LOG(Error) << "Failure rate " << rate << " exceeds threshold " << _config.maxFailureRate;
		throw ExcessiveSampleFailureRateException(rate, _config.maxFailureRate, failed);
	}

	std::vector<double> values(successful.size());
	for (std::size_t k = 0; k < result.flows.size(); ++k)
	{
		for (std::size_t s = 0; s < successful.size(); ++s)
			values[s] = successful[s]->inventory[k];
		result.inventory[result.flows[k]] = summarize(values, _config.percentiles);
	}

	for (std::size_t j = 0; j < result.activities.size(); ++j)
	{
		for (std::size_t s = 0; s < successful.size(); ++s)
			values[s] = successful[s]->scaling[j];
		result.scaling[result.activities[j]] = summarize(values, _config.percentiles);
	}

	for (std::size_t s = 0; s < successful.size(); ++s)
		values[s] = successful[s]->staticScore;
	result.staticScore = summarize(values, _config.percentiles);

	if (_config.impactCurves)
	{
		for (std::size_t s = 0; s < successful.size(); ++s)
			values[s] = successful[s]->dynamicScore;
		result.dynamicScore = summarize(values, _config.percentiles);

		// All samples share the grid [0, horizon]
		const ImpactCurve grid = characterize(Timeline(), _method, 0.0, _method.horizon());
		result.curveTimes = grid.times;
		result.curve.reserve(grid.times.size());
		for (std::size_t t = 0; t < grid.times.size(); ++t)
		{
			for (std::size_t s = 0; s < successful.size(); ++s)
				values[s] = successful[s]->impactCurve[t];
			result.curve.push_back(summarize(values, _config.percentiles));
		}
	}

	if (_config.keepSamples)
	{
		result.samples.reserve(successful.size());
		for (const SampleResult* sr : successful)
			result.samples.push_back(*sr);
	}

	return result;
}

} // namespace tlca

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
 * Parallel Monte Carlo propagation of exchange uncertainties.
 */

#ifndef LIBTLCA_MONTECARLO_HPP_
#define LIBTLCA_MONTECARLO_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"
#include "tlca/StaticLca.hpp"
#include "tlca/TemporalLca.hpp"
#include "tlca/Characterization.hpp"
#include "tlca/Statistics.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tlca
{

class ProcessGraph;
class INotificationCallback;

/**
 * @brief Configuration of a Monte Carlo run
 */
struct TLCA_API MonteCarloConfig
{
	uint64_t nSamples = 1000;
	uint64_t seed = 0; //!< Base seed, the seed of each sample is derived from it
	int nThreads = 0; //!< Number of worker threads, @c 0 for automatic
	bool impactCurves = false; //!< Run the temporal traversal and characterize each sample
	bool resampleTemporal = false; //!< Perturb the fractions of temporal distributions
	double temporalSigma = 0.1; //!< Standard deviation of the lognormal perturbation of fractions
	double maxFailureRate = 0.05;
	std::vector<double> percentiles = {2.5, 50.0, 97.5};
	double sampleTimeout = 0.0; //!< Wall-clock budget per sample in seconds, @c 0 disables the timeout
	bool keepSamples = false;
	unsigned int channelCapacity = 0; //!< Maximum number of samples in flight, @c 0 for four per thread

	/**
	 * @brief Throws InvalidParameterException for out-of-range values
	 */
	void validate() const;
};

/**
 * @brief Reason of a failed sample
 */
enum class SampleFailureKind : int
{
	Singular = 0,
	MassBalance = 1,
	Timeout = 2
};

TLCA_API const char* to_string(SampleFailureKind kind) TLCA_NOEXCEPT;

struct TLCA_API FailedSample
{
	uint64_t index = 0;
	uint64_t seed = 0;
	SampleFailureKind kind = SampleFailureKind::Singular;
	std::string message;
};

/**
 * @brief Outcome of a single successful sample
 */
struct TLCA_API SampleResult
{
	uint64_t index = 0;
	uint64_t seed = 0;
	std::vector<double> scaling;
	std::vector<double> inventory;
	double staticScore = 0.0;
	double dynamicScore = 0.0; //!< Impact at the end of the curve (only with impact curves)
	std::vector<double> impactCurve; //!< Values on MonteCarloResult::curveTimes (only with impact curves)
};

/**
 * @brief Aggregated result of a Monte Carlo run
 * @details Statistics only cover successful samples.
 */
struct TLCA_API MonteCarloResult
{
	uint64_t nRequested = 0;
	uint64_t nSucceeded = 0;
	bool cancelled = false;

	std::vector<std::string> activities;
	std::vector<std::string> flows;

	std::map<std::string, SummaryStatistics> inventory; //!< Per flow
	std::map<std::string, SummaryStatistics> scaling; //!< Per activity
	SummaryStatistics staticScore;
	SummaryStatistics dynamicScore;

	std::vector<double> curveTimes;
	std::vector<SummaryStatistics> curve; //!< Pointwise statistics on @c curveTimes

	std::vector<FailedSample> failedSamples; //!< Ordered by sample index
	std::vector<SampleResult> samples; //!< Successful samples ordered by index (if requested)

	inline uint64_t nCompleted() const TLCA_NOEXCEPT { return nSucceeded + failedSamples.size(); }
	double failureRate() const TLCA_NOEXCEPT;
};

/**
 * @brief Derives the seed of a sample from the base seed
 * @details Pure function of its arguments, so samples are reproducible regardless of
 *          the number of threads and the order of execution.
 */
TLCA_API uint64_t deriveSampleSeed(uint64_t baseSeed, uint64_t sampleIndex) TLCA_NOEXCEPT;

/**
 * @brief Creates a snapshot with resampled exchange amounts
 * @details Exchanges are sampled in graph order from their uncertainty specification using
 *          a @c std::mt19937_64 seeded with @p sampleSeed. If @p resampleTemporal is set,
 *          each fraction of a temporal distribution is multiplied by a lognormal factor
 *          with standard deviation @p temporalSigma and the distribution is renormalized.
 *          The base graph is not modified.
 * @param [in] graph Base graph
 * @param [in] sampleSeed Seed of the sample
 * @param [in] resampleTemporal Whether to perturb temporal distributions
 * @param [in] temporalSigma Standard deviation of the underlying normal distribution of the perturbation
 * @return Resampled snapshot
 */
TLCA_API ProcessGraph resampleGraph(const ProcessGraph& graph, uint64_t sampleSeed, bool resampleTemporal, double temporalSigma);

/**
 * @brief Propagates exchange uncertainties by repeated resampling
 * @details Samples are solved in parallel in a dedicated task arena. A sample that fails
 *          with SingularSystemException, TemporalMassBalanceException or SampleTimeoutException
 *          is recorded and excluded from the statistics. Other exceptions abort the run.
 *          The run fails with ExcessiveSampleFailureRateException if the fraction of failed
 *          samples exceeds MonteCarloConfig::maxFailureRate.
 */
class TLCA_API MonteCarloPropagator
{
public:
	explicit MonteCarloPropagator(const MonteCarloConfig& config, const std::string& linearSolver = "Auto");

	void setTraversalOptions(const TraversalOptions& opts);

	/**
	 * @brief Sets the method used for static scores and impact curves
	 * @details Defaults to CharacterizationMethod::climateChange().
	 */
	void setCharacterizationMethod(const CharacterizationMethod& method);

	/**
	 * @brief Sets a callback that is notified of progress, @c nullptr removes it
	 * @details The callback is not owned and has to outlive run().
	 */
	inline void setNotificationCallback(INotificationCallback* nc) TLCA_NOEXCEPT { _notification = nc; }

	/**
	 * @brief Runs the propagation
	 * @details Throws UnknownNodeException for unknown demand ids and, if impact curves are
	 *          requested, UnresolvedFlowException for characterized flows without kernel
	 *          before any sample is drawn.
	 * @param [in] graph Base graph, shared read-only by all samples
	 * @param [in] fu Functional unit
	 * @return Aggregated statistics
	 */
	MonteCarloResult run(const ProcessGraph& graph, const FunctionalUnit& fu);

	/**
	 * @brief Requests cooperative cancellation
	 * @details No new samples are dispatched, samples in flight are completed.
	 *          May be called from any thread. A request issued before run() stops
	 *          that run before its first sample. The request is cleared when run() returns.
	 */
	inline void cancel() TLCA_NOEXCEPT { _cancel.store(true); }

	inline const MonteCarloConfig& config() const TLCA_NOEXCEPT { return _config; }

private:
	struct SampleOutcome;

	SampleOutcome computeSample(const ProcessGraph& graph, const FunctionalUnit& fu, const TemporalLcaEngine& engine, uint64_t index) const;

	MonteCarloConfig _config;
	StaticLcaSolver _solver;
	std::string _linearSolver;
	TraversalOptions _traversalOpts;
	CharacterizationMethod _method;
	INotificationCallback* _notification;
	std::atomic<bool> _cancel;
};

} // namespace tlca

#endif  // LIBTLCA_MONTECARLO_HPP_

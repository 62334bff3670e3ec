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

#include <catch2/catch.hpp>

#include "tlca/MonteCarlo.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/Characterization.hpp"
#include "tlca/Notification.hpp"
#include "tlca/Exceptions.hpp"
#include "TestModels.hpp"

#include <cmath>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace
{
	class CountingCallback : public tlca::INotificationCallback
	{
	public:
		explicit CountingCallback(uint64_t stopAfter) : nStart(0), nEnd(0), nCompleted(0), endCancelled(false), _stopAfter(stopAfter) { }

		virtual void monteCarloStart(uint64_t) { ++nStart; }
		virtual void monteCarloEnd(bool cancelled)
		{
			++nEnd;
			endCancelled = cancelled;
		}

		virtual bool sampleCompleted(uint64_t, bool, uint64_t nCollected, uint64_t)
		{
			++nCompleted;
			return nCollected < _stopAfter;
		}

		int nStart;
		int nEnd;
		uint64_t nCompleted;
		bool endCancelled;

	private:
		uint64_t _stopAfter;
	};

	tlca::MonteCarloConfig createConfig(uint64_t nSamples, int nThreads)
	{
		tlca::MonteCarloConfig config;
		config.nSamples = nSamples;
		config.nThreads = nThreads;
		config.seed = 12345;
		return config;
	}
}

TEST_CASE("Sample seeds are derived deterministically", "[MonteCarlo],[CI]")
{
	CHECK(tlca::deriveSampleSeed(42, 0) == tlca::deriveSampleSeed(42, 0));
	CHECK(tlca::deriveSampleSeed(42, 0) != tlca::deriveSampleSeed(42, 1));
	CHECK(tlca::deriveSampleSeed(42, 7) != tlca::deriveSampleSeed(43, 7));
}

TEST_CASE("Resampled graph keeps base graph unchanged", "[MonteCarlo],[CI]")
{
	const tlca::ProcessGraph graph = createUncertainGraph();

	const tlca::ProcessGraph a = tlca::resampleGraph(graph, 99, false, 0.0);
	const tlca::ProcessGraph b = tlca::resampleGraph(graph, 99, false, 0.0);

	const int xy = graph.findExchange("Y", "X");
	CHECK(graph.exchange(xy).amount == 0.5);
	CHECK(a.exchange(xy).amount == b.exchange(xy).amount);
	CHECK(a.exchange(xy).amount >= 0.4);
	CHECK(a.exchange(xy).amount <= 0.6);

	// Deterministic exchanges keep their amount
	CHECK(a.production(0) == 1.0);
	CHECK(a.production(1) == 1.0);
}

TEST_CASE("Resampled temporal distributions stay normalized", "[MonteCarlo],[CI]")
{
	const tlca::ProcessGraph graph = createUncertainGraph();

	for (uint64_t seed = 0; seed < 50; ++seed)
	{
		const tlca::ProcessGraph snapshot = tlca::resampleGraph(graph, seed, true, 0.3);
		for (unsigned int i = 0; i < graph.numExchanges(); ++i)
		{
			const tlca::TemporalDistribution& base = graph.exchange(i).temporal;
			const tlca::TemporalDistribution& td = snapshot.exchange(i).temporal;

			REQUIRE(td.size() == base.size());
			CHECK(td.offsets() == base.offsets());
			if (!td.empty())
				CHECK(td.fractionSum() == Approx(1.0).epsilon(1e-12));
		}
	}
}

TEST_CASE("Monte Carlo results do not depend on thread count", "[MonteCarlo],[CI]")
{
	const tlca::ProcessGraph graph = createUncertainGraph();

	tlca::MonteCarloConfig config = createConfig(200, 1);
	config.keepSamples = true;
	tlca::MonteCarloPropagator serial(config);
	const tlca::MonteCarloResult resSerial = serial.run(graph, {{"X", 1.0}});

	config.nThreads = 4;
	tlca::MonteCarloPropagator parallel(config);
	const tlca::MonteCarloResult resParallel = parallel.run(graph, {{"X", 1.0}});

	REQUIRE(resSerial.nSucceeded == 200);
	REQUIRE(resParallel.nSucceeded == 200);
	REQUIRE(resSerial.samples.size() == resParallel.samples.size());

	for (std::size_t i = 0; i < resSerial.samples.size(); ++i)
	{
		CHECK(resSerial.samples[i].index == i);
		CHECK(resSerial.samples[i].index == resParallel.samples[i].index);
		CHECK(resSerial.samples[i].seed == resParallel.samples[i].seed);
		CHECK(resSerial.samples[i].inventory == resParallel.samples[i].inventory);
		CHECK(resSerial.samples[i].staticScore == resParallel.samples[i].staticScore);
	}

	const tlca::SummaryStatistics& co2Serial = resSerial.inventory.at("Carbon dioxide, fossil");
	const tlca::SummaryStatistics& co2Parallel = resParallel.inventory.at("Carbon dioxide, fossil");
	CHECK(co2Serial.mean == co2Parallel.mean);
	CHECK(co2Serial.stdDev == co2Parallel.stdDev);
	CHECK(co2Serial.percentiles == co2Parallel.percentiles);
	CHECK(resSerial.staticScore.mean == resParallel.staticScore.mean);
}

TEST_CASE("Monte Carlo mean converges", "[MonteCarlo],[CI]")
{
	const double mean = 2.0;
	const double stdDev = 0.5;
	const tlca::ProcessGraph graph = createNormalEmissionGraph(mean, stdDev);

	const uint64_t nSamples = GENERATE(as<uint64_t>{}, 10, 100, 1000, 10000);
	INFO("Samples " << nSamples);

	tlca::MonteCarloPropagator mc(createConfig(nSamples, 0));
	const tlca::MonteCarloResult res = mc.run(graph, {{"X", 1.0}});

	REQUIRE(res.nSucceeded == nSamples);
	CHECK_FALSE(res.cancelled);

	const tlca::SummaryStatistics& stats = res.inventory.at("Carbon dioxide, fossil");
	CHECK(stats.count == nSamples);
	CHECK(std::abs(stats.mean - mean) < 4.0 * stdDev / std::sqrt(static_cast<double>(nSamples)));
	CHECK(res.staticScore.mean == Approx(stats.mean));
	CHECK(res.scaling.at("X").stdDev == 0.0);
}

TEST_CASE("Monte Carlo samples exceeding timeout fail", "[MonteCarlo],[CI]")
{
	const tlca::ProcessGraph graph = createUncertainGraph();
	tlca::MonteCarloConfig config = createConfig(10, 2);
	config.sampleTimeout = 1e-12;

	SECTION("Failures tolerated")
	{
		config.maxFailureRate = 1.0;
		tlca::MonteCarloPropagator mc(config);
		const tlca::MonteCarloResult res = mc.run(graph, {{"X", 1.0}});

		CHECK(res.nSucceeded == 0);
		CHECK(res.nCompleted() == 10);
		CHECK(res.failureRate() == 1.0);
		REQUIRE(res.failedSamples.size() == 10);
		for (std::size_t i = 0; i < res.failedSamples.size(); ++i)
		{
			CHECK(res.failedSamples[i].index == i);
			CHECK(res.failedSamples[i].kind == tlca::SampleFailureKind::Timeout);
			CHECK(res.failedSamples[i].seed == tlca::deriveSampleSeed(config.seed, i));
		}

		CHECK(res.staticScore.count == 0);
		CHECK(std::isnan(res.staticScore.mean));
	}

	SECTION("Failures exceed threshold")
	{
		tlca::MonteCarloPropagator mc(config);
		try
		{
			mc.run(graph, {{"X", 1.0}});
			FAIL("Expected ExcessiveSampleFailureRateException");
		}
		catch (const tlca::ExcessiveSampleFailureRateException& e)
		{
			CHECK(e.failureRate() == 1.0);
			CHECK(e.threshold() == config.maxFailureRate);
			CHECK(e.failedSamples().size() == 10);
		}
	}
}

TEST_CASE("Monte Carlo records singular samples", "[MonteCarlo],[CI]")
{
	const tlca::ProcessGraph graph = createSingularGraph();
	tlca::MonteCarloConfig config = createConfig(10, 2);

	SECTION("Failures tolerated")
	{
		config.maxFailureRate = 1.0;
		tlca::MonteCarloPropagator mc(config);
		const tlca::MonteCarloResult res = mc.run(graph, {{"X", 1.0}});

		CHECK(res.nSucceeded == 0);
		CHECK_FALSE(res.cancelled);
		REQUIRE(res.failedSamples.size() == 10);
		for (std::size_t i = 0; i < res.failedSamples.size(); ++i)
		{
			CHECK(res.failedSamples[i].index == i);
			CHECK(res.failedSamples[i].kind == tlca::SampleFailureKind::Singular);
			CHECK(res.failedSamples[i].seed == tlca::deriveSampleSeed(config.seed, i));
			CHECK(res.failedSamples[i].message.find("'Y'") != std::string::npos);
		}

		CHECK(res.inventory.at("Carbon dioxide, fossil").count == 0);
		CHECK(res.scaling.at("X").count == 0);
	}

	SECTION("Failures exceed threshold")
	{
		tlca::MonteCarloPropagator mc(config);
		try
		{
			mc.run(graph, {{"X", 1.0}});
			FAIL("Expected ExcessiveSampleFailureRateException");
		}
		catch (const tlca::ExcessiveSampleFailureRateException& e)
		{
			CHECK(e.failureRate() == 1.0);
			CHECK(e.threshold() == config.maxFailureRate);
			CHECK(e.failedSamples() == std::vector<uint64_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
		}
	}
}

TEST_CASE("Monte Carlo statistics skip failed samples", "[MonteCarlo],[CI]")
{
	const tlca::ProcessGraph graph = createOverflowingGraph();
	tlca::MonteCarloConfig config = createConfig(40, 3);
	config.maxFailureRate = 1.0;
	config.keepSamples = true;

	tlca::MonteCarloPropagator mc(config);
	const tlca::MonteCarloResult res = mc.run(graph, {{"X", 1.0}});

	REQUIRE(res.nCompleted() == 40);
	REQUIRE(res.nSucceeded > 0);
	REQUIRE_FALSE(res.failedSamples.empty());
	CHECK(res.failureRate() == Approx(static_cast<double>(res.failedSamples.size()) / 40.0));

	std::set<uint64_t> failed;
	for (const tlca::FailedSample& fs : res.failedSamples)
	{
		CHECK(fs.kind == tlca::SampleFailureKind::Singular);
		failed.insert(fs.index);
	}

	REQUIRE(res.samples.size() == res.nSucceeded);
	for (const tlca::SampleResult& sr : res.samples)
	{
		CHECK(failed.count(sr.index) == 0);
		CHECK(std::isfinite(sr.scaling[2]));
	}

	const tlca::SummaryStatistics& co2 = res.inventory.at("Carbon dioxide, fossil");
	CHECK(co2.count == res.nSucceeded);
	CHECK(co2.mean == Approx(2.0));
	CHECK(co2.stdDev == Approx(0.0).margin(1e-12));
	CHECK(res.staticScore.count == res.nSucceeded);
	CHECK(res.scaling.at("X").count == res.nSucceeded);

	// Same seed, same failures
	tlca::MonteCarloPropagator again(config);
	const tlca::MonteCarloResult res2 = again.run(graph, {{"X", 1.0}});
	REQUIRE(res2.failedSamples.size() == res.failedSamples.size());
	for (std::size_t i = 0; i < res.failedSamples.size(); ++i)
		CHECK(res2.failedSamples[i].index == res.failedSamples[i].index);
}

TEST_CASE("Monte Carlo impact curves require kernels", "[MonteCarlo],[CI]")
{
	tlca::MonteCarloConfig config = createConfig(20, 2);
	config.impactCurves = true;
	config.maxFailureRate = 1.0;

	tlca::MonteCarloPropagator mc(config);
	tlca::CharacterizationMethod method(100.0, 2024);

	SECTION("Missing kernel is fatal")
	{
		mc.setCharacterizationMethod(method);
		CHECK_THROWS_AS(mc.run(createExampleGraph(), {{"X", 1.0}}), tlca::UnresolvedFlowException);
	}

	SECTION("Flows outside the subset are skipped")
	{
		method.addKernel("Carbon dioxide, fossil", tlca::createKernel("co2"));
		method.restrictTo({"Carbon dioxide, fossil"});
		mc.setCharacterizationMethod(method);

		const tlca::MonteCarloResult res = mc.run(createExampleGraph(), {{"X", 1.0}});
		CHECK(res.nSucceeded == 20);
		CHECK(res.dynamicScore.mean == 0.0);
	}

	SECTION("Remapped flows resolve")
	{
		method.addKernel("Carbon dioxide, fossil", tlca::createKernel("co2"));
		method.addRemapping("Z", "Carbon dioxide, fossil");
		mc.setCharacterizationMethod(method);

		const tlca::MonteCarloResult res = mc.run(createExampleGraph(), {{"X", 1.0}});
		CHECK(res.nSucceeded == 20);
		CHECK(res.dynamicScore.mean > 0.0);
	}
}

TEST_CASE("Monte Carlo cancellation before run", "[MonteCarlo],[CI]")
{
	tlca::MonteCarloPropagator mc(createConfig(100, 2));
	mc.cancel();

	const tlca::MonteCarloResult res = mc.run(createUncertainGraph(), {{"X", 1.0}});
	CHECK(res.cancelled);
	CHECK(res.nCompleted() == 0);

	const tlca::MonteCarloResult again = mc.run(createUncertainGraph(), {{"X", 1.0}});
	CHECK_FALSE(again.cancelled);
	CHECK(again.nCompleted() == 100);
}

TEST_CASE("Monte Carlo run can be cancelled", "[MonteCarlo],[CI]")
{
	tlca::MonteCarloConfig config = createConfig(1000, 1);
	config.channelCapacity = 2;

	tlca::MonteCarloPropagator mc(config);
	CountingCallback callback(5);
	mc.setNotificationCallback(&callback);

	const tlca::MonteCarloResult res = mc.run(createUncertainGraph(), {{"X", 1.0}});

	CHECK(res.cancelled);
	CHECK(res.nCompleted() >= 5);
	CHECK(res.nCompleted() < 1000);
	CHECK(res.nCompleted() == callback.nCompleted);
	CHECK(res.inventory.at("Carbon dioxide, fossil").count == res.nSucceeded);
	CHECK(callback.nStart == 1);
	CHECK(callback.nEnd == 1);
	CHECK(callback.endCancelled);

	// A new run starts without the previous cancellation
	mc.setNotificationCallback(nullptr);
	const tlca::MonteCarloResult again = mc.run(createUncertainGraph(), {{"X", 1.0}});
	CHECK_FALSE(again.cancelled);
	CHECK(again.nCompleted() == 1000);
}

TEST_CASE("Monte Carlo with impact curves", "[MonteCarlo],[CI]")
{
	tlca::MonteCarloConfig config = createConfig(20, 0);
	config.impactCurves = true;
	config.resampleTemporal = true;

	tlca::MonteCarloPropagator mc(config);
	const tlca::MonteCarloResult res = mc.run(createUncertainGraph(), {{"X", 1.0}});

	REQUIRE(res.nSucceeded == 20);
	REQUIRE(res.curveTimes.size() == 101);
	REQUIRE(res.curve.size() == 101);
	CHECK(res.curveTimes.front() == 0.0);
	CHECK(res.curveTimes.back() == 100.0);

	CHECK(res.dynamicScore.count == 20);
	CHECK(res.curve.back().mean == Approx(res.dynamicScore.mean));
	CHECK(res.curve.front().mean == 0.0);
	CHECK(res.dynamicScore.mean > 0.0);
	CHECK(res.staticScore.mean > 0.0);
}

TEST_CASE("Monte Carlo rejects invalid input", "[MonteCarlo],[CI]")
{
	CHECK_THROWS_AS(tlca::MonteCarloPropagator(createConfig(0, 1)), tlca::InvalidParameterException);

	tlca::MonteCarloConfig config = createConfig(10, 1);
	config.maxFailureRate = 1.5;
	CHECK_THROWS_AS(config.validate(), tlca::InvalidParameterException);

	config = createConfig(10, 1);
	config.percentiles = {50.0, 120.0};
	CHECK_THROWS_AS(config.validate(), tlca::InvalidParameterException);

	tlca::MonteCarloPropagator mc(createConfig(10, 1));
	CHECK_THROWS_AS(mc.run(createUncertainGraph(), {{"W", 1.0}}), tlca::UnknownNodeException);

	CHECK(std::string(tlca::to_string(tlca::SampleFailureKind::MassBalance)) == "mass_balance");
}

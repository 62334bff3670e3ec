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

#include "tlca/Characterization.hpp"
#include "tlca/Timeline.hpp"
#include "tlca/StaticLca.hpp"
#include "tlca/TemporalLca.hpp"
#include "tlca/Exceptions.hpp"
#include "TestModels.hpp"

#include <cmath>
#include <memory>
#include <numeric>
#include <vector>

namespace
{
	tlca::Timeline createExampleTimeline()
	{
		return tlca::Timeline(std::vector<tlca::TimelineEntry>{
			tlca::TimelineEntry{10.0, "Z", "Y", 2.5},
			tlca::TimelineEntry{0.0, "Z", "Y", 2.5}
		});
	}

	tlca::CharacterizationMethod createPulseMethod(double factor)
	{
		tlca::CharacterizationMethod method(100.0, 2024);
		method.addKernel("Z", std::make_shared<tlca::PulseKernel>(factor));
		method.setStaticFactor("Z", factor);
		return method;
	}

	double sumImpacts(const std::vector<tlca::AnnualImpact>& rows)
	{
		double sum = 0.0;
		for (const tlca::AnnualImpact& r : rows)
			sum += r.impact;
		return sum;
	}
}

TEST_CASE("Kernel values", "[Characterization],[CI]")
{
	const tlca::Co2Kernel co2;
	const tlca::Ch4Kernel ch4;

	CHECK(co2.cumulative(-1.0) == 0.0);
	CHECK(co2.cumulative(0.0) == 0.0);
	CHECK(ch4.cumulative(-5.0) == 0.0);

	// AGWP100 of carbon dioxide and GWP100 of methane
	const double agwpCo2 = co2.cumulative(100.0);
	CHECK(agwpCo2 > 8e-14);
	CHECK(agwpCo2 < 1e-13);

	const double gwpCh4 = ch4.cumulative(100.0) / agwpCo2;
	CHECK(gwpCh4 > 20.0);
	CHECK(gwpCh4 < 35.0);

	// Cumulative impact never decreases
	for (int t = 1; t <= 200; ++t)
	{
		CHECK(co2.cumulative(t) >= co2.cumulative(t - 1));
		CHECK(ch4.cumulative(t) >= ch4.cumulative(t - 1));
	}

	const tlca::DecayKernel decay(2.0, 0.5);
	CHECK(decay.cumulative(1.0) == Approx(2.0 * (1.0 - std::exp(-0.5))));
	CHECK(decay.cumulative(1000.0) == Approx(2.0));
	CHECK(decay.cumulative(0.0) == 0.0);

	const tlca::PulseKernel pulse(3.0);
	CHECK(pulse.cumulative(0.0) == 3.0);
	CHECK(pulse.cumulative(50.0) == 3.0);
	CHECK(pulse.cumulative(-0.5) == 0.0);
}

TEST_CASE("Kernel factory", "[Characterization],[CI]")
{
	CHECK(std::string(tlca::createKernel("co2")->name()) == "co2");
	CHECK(std::string(tlca::createKernel("ch4")->name()) == "ch4");
	CHECK(tlca::createKernel("pulse", 4.0)->cumulative(1.0) == 4.0);
	CHECK(tlca::createKernel("decay", 1.0, 0.1)->cumulative(10.0) == Approx(1.0 - std::exp(-1.0)));

	CHECK_THROWS_AS(tlca::createKernel("gaussian"), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::createKernel("decay", 1.0, 0.0), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::PulseKernel(std::nan("")), tlca::InvalidParameterException);
}

TEST_CASE("Characterization of example timeline with pulse kernel", "[Characterization],[CI]")
{
	const tlca::Timeline timeline = createExampleTimeline();
	const tlca::CharacterizationMethod method = createPulseMethod(2.0);

	const tlca::ImpactCurve curve = tlca::characterize(timeline, method);
	REQUIRE(curve.times.size() == 111);
	REQUIRE(curve.values.size() == 111);
	CHECK(curve.times.front() == 0.0);
	CHECK(curve.times.back() == 110.0);

	CHECK(curve.values[0] == Approx(5.0));
	CHECK(curve.values[9] == Approx(5.0));
	CHECK(curve.values[10] == Approx(10.0));
	CHECK(curve.finalValue() == Approx(10.0));

	// Cumulative curve of a positive inventory is monotone
	for (std::size_t i = 1; i < curve.values.size(); ++i)
		CHECK(curve.values[i] >= curve.values[i - 1]);
}

TEST_CASE("Characterization on explicit interval", "[Characterization],[CI]")
{
	const tlca::CharacterizationMethod method = createPulseMethod(1.0);

	const tlca::ImpactCurve curve = tlca::characterize(createExampleTimeline(), method, 0.0, 100.0);
	REQUIRE(curve.times.size() == 101);
	CHECK(curve.finalValue() == Approx(5.0));

	const tlca::ImpactCurve partial = tlca::characterize(createExampleTimeline(), method, 0.0, 2.5);
	REQUIRE(partial.times.size() == 4);
	CHECK(partial.times.back() == 2.5);

	CHECK_THROWS_AS(tlca::characterize(createExampleTimeline(), method, 5.0, 1.0), tlca::InvalidParameterException);
}

TEST_CASE("Characterization with carbon dioxide and methane", "[Characterization],[CI]")
{
	const tlca::CharacterizationMethod method = tlca::CharacterizationMethod::climateChange();
	const tlca::Timeline timeline(std::vector<tlca::TimelineEntry>{
		tlca::TimelineEntry{0.0, "Carbon dioxide, fossil", "A", 1.0},
		tlca::TimelineEntry{0.0, "Methane, fossil", "A", 1.0}
	});

	const tlca::ImpactCurve curve = tlca::characterize(timeline, method);
	REQUIRE(curve.times.size() == 101);

	const tlca::Co2Kernel co2;
	const tlca::Ch4Kernel ch4;
	CHECK(curve.finalValue() == Approx(co2.cumulative(100.0) + ch4.cumulative(100.0)));

	// Emissions beyond the horizon do not grow further
	const tlca::ImpactCurve late = tlca::characterize(timeline, method, 0.0, 150.0);
	CHECK(late.finalValue() == Approx(curve.finalValue()));
}

TEST_CASE("Annual impacts sum to final impact", "[Characterization],[CI]")
{
	const tlca::Timeline timeline = createExampleTimeline();

	SECTION("Pulse kernel")
	{
		const tlca::CharacterizationMethod method = createPulseMethod(2.0);
		const std::vector<tlca::AnnualImpact> rows = tlca::annualImpacts(timeline, method);

		CHECK(sumImpacts(rows) == Approx(tlca::characterize(timeline, method).finalValue()));

		// Non-zero impacts in the years of emission
		std::vector<int> years;
		for (const tlca::AnnualImpact& r : rows)
		{
			if (r.impact != 0.0)
				years.push_back(r.year);
		}
		REQUIRE(years.size() == 2);
		CHECK(years[0] == 2024);
		CHECK(years[1] == 2034);
	}

	SECTION("Climate change kernels")
	{
		tlca::TraversalOptions opts;
		opts.allowNegativeOffsets = true;
		const tlca::TemporalResult res = tlca::TemporalLcaEngine(opts).run(createChainGraph(), {{"A", 1.0}});

		const tlca::CharacterizationMethod method = tlca::CharacterizationMethod::climateChange(100.0, 2030);
		const std::vector<tlca::AnnualImpact> rows = tlca::annualImpacts(res.timeline, method);

		CHECK(sumImpacts(rows) == Approx(tlca::characterize(res.timeline, method).finalValue()).epsilon(1e-9));
		REQUIRE_FALSE(rows.empty());
		CHECK(rows.front().year == 2029);

		// Rows are ordered by year
		for (std::size_t i = 1; i < rows.size(); ++i)
			CHECK(rows[i - 1].year <= rows[i].year);
	}
}

TEST_CASE("Flow remapping", "[Characterization],[CI]")
{
	tlca::CharacterizationMethod method(100.0, 2024);
	method.addKernel("new-id", std::make_shared<tlca::PulseKernel>(1.0));
	method.setStaticFactor("new-id", 3.0);
	method.addRemapping("old-id", "new-id");

	CHECK(method.resolveFlow("old-id") == "new-id");
	CHECK(method.resolveFlow("new-id") == "new-id");
	CHECK(method.originalFlow("new-id") == "old-id");
	CHECK(method.originalFlow("other") == "other");
	CHECK(method.hasStaticFactor("old-id"));
	CHECK(method.staticFactor("old-id") == 3.0);
	CHECK(method.findKernel("other") == nullptr);

	const tlca::Timeline timeline(std::vector<tlca::TimelineEntry>{tlca::TimelineEntry{0.0, "old-id", "A", 2.0}});
	CHECK(tlca::characterize(timeline, method).finalValue() == Approx(2.0));

	CHECK_THROWS_AS(method.addRemapping("same", "same"), tlca::InvalidParameterException);

	method.addEcoinventMigration();
	CHECK(method.originalFlow("90f722bf-cb9b-571a-88fc-34286632bdc4") == "9c2a7dc9-8b1f-46ba-bc16-0d761a4f6016");
}

TEST_CASE("Unresolved and excluded flows", "[Characterization],[CI]")
{
	const tlca::Timeline timeline = createExampleTimeline();

	SECTION("Flow without kernel")
	{
		tlca::CharacterizationMethod method;
		method.addKernel("Carbon dioxide, fossil", std::make_shared<tlca::Co2Kernel>());

		try
		{
			tlca::characterize(timeline, method);
			FAIL("Expected UnresolvedFlowException");
		}
		catch (const tlca::UnresolvedFlowException& e)
		{
			CHECK(e.flowId() == "Z");
		}

		CHECK_THROWS_AS(tlca::annualImpacts(timeline, method), tlca::UnresolvedFlowException);
		CHECK_THROWS_AS(method.resolveFlow("Z"), tlca::UnresolvedFlowException);
	}

	SECTION("Flow outside restricted subset is skipped")
	{
		const tlca::CharacterizationMethod method = tlca::CharacterizationMethod::climateChange();
		CHECK_FALSE(method.includes("Z"));

		const tlca::ImpactCurve curve = tlca::characterize(timeline, method);
		REQUIRE(curve.times.size() == 101);
		CHECK(curve.finalValue() == 0.0);
		CHECK(tlca::annualImpacts(timeline, method).empty());
	}
}

TEST_CASE("Method settings validation", "[Characterization],[CI]")
{
	tlca::CharacterizationMethod method;
	CHECK(method.horizon() == 100.0);
	CHECK(method.finestResolution() == 1.0);

	CHECK_THROWS_AS(method.horizon(0.0), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::CharacterizationMethod(-1.0, 2024), tlca::InvalidParameterException);
	CHECK_THROWS_AS(method.setStaticFactor("Z", std::nan("")), tlca::InvalidParameterException);
	CHECK_THROWS_AS(method.addKernel("Z", nullptr), tlca::InvalidParameterException);
}

TEST_CASE("Static score", "[Characterization],[CI]")
{
	const tlca::LcaResult res({"A"}, {"Carbon dioxide, fossil", "Methane, fossil", "Z"}, {1.0}, {2.0, 1.0, 5.0}, true);
	CHECK(tlca::staticScore(res, tlca::CharacterizationMethod::climateChange()) == Approx(31.8));

	const tlca::LcaResult example = tlca::StaticLcaSolver().solve(createExampleGraph(), {{"X", 1.0}});
	CHECK(tlca::staticScore(example, createPulseMethod(2.0)) == Approx(10.0));
}

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

#include "tlca/Statistics.hpp"
#include "tlca/Exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

TEST_CASE("Percentile interpolates linearly", "[Statistics],[CI]")
{
	const std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0};

	CHECK(tlca::percentile(sorted, 0.0) == 1.0);
	CHECK(tlca::percentile(sorted, 100.0) == 4.0);
	CHECK(tlca::percentile(sorted, 50.0) == Approx(2.5));
	CHECK(tlca::percentile(sorted, 25.0) == Approx(1.75));

	CHECK(tlca::percentile({7.0}, 95.0) == 7.0);
	CHECK(std::isnan(tlca::percentile(std::vector<double>(), 50.0)));

	CHECK_THROWS_AS(tlca::percentile(sorted, -1.0), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::percentile(sorted, 100.5), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::percentile(sorted, std::nan("")), tlca::InvalidParameterException);
}

TEST_CASE("Summary statistics", "[Statistics],[CI]")
{
	const tlca::SummaryStatistics stats = tlca::summarize({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}, {5.0, 50.0, 95.0});

	CHECK(stats.count == 8);
	CHECK(stats.mean == Approx(5.0));
	CHECK(stats.stdDev == Approx(std::sqrt(32.0 / 7.0)));
	CHECK(stats.min == 2.0);
	CHECK(stats.max == 9.0);
	REQUIRE(stats.percentiles.size() == 3);
	CHECK(stats.percentiles.at(50.0) == Approx(4.5));
	CHECK(stats.percentiles.at(5.0) == Approx(2.7));
	CHECK(stats.percentiles.at(95.0) == Approx(8.3));
}

TEST_CASE("Summary statistics of single and empty samples", "[Statistics],[CI]")
{
	const tlca::SummaryStatistics single = tlca::summarize({3.0}, {50.0});
	CHECK(single.count == 1);
	CHECK(single.mean == 3.0);
	CHECK(single.stdDev == 0.0);
	CHECK(single.percentiles.at(50.0) == 3.0);

	const tlca::SummaryStatistics empty = tlca::summarize(std::vector<double>(), {50.0});
	CHECK(empty.count == 0);
	CHECK(std::isnan(empty.mean));
	CHECK(std::isnan(empty.stdDev));
	CHECK(std::isnan(empty.min));
	CHECK(std::isnan(empty.max));
	CHECK(std::isnan(empty.percentiles.at(50.0)));

	CHECK_THROWS_AS(tlca::summarize({1.0, 2.0}, {101.0}), tlca::InvalidParameterException);
}

TEST_CASE("Summary statistics do not depend on sample order", "[Statistics],[CI]")
{
	std::mt19937_64 rng(7);
	std::lognormal_distribution<double> dist(0.0, 1.5);

	std::vector<double> values(1000);
	for (double& v : values)
		v = dist(rng);

	const std::vector<double> perc = {2.5, 50.0, 97.5};
	const tlca::SummaryStatistics ref = tlca::summarize(values, perc);

	std::reverse(values.begin(), values.end());
	const tlca::SummaryStatistics reversed = tlca::summarize(values, perc);

	std::shuffle(values.begin(), values.end(), rng);
	const tlca::SummaryStatistics shuffled = tlca::summarize(values, perc);

	CHECK(ref.mean == reversed.mean);
	CHECK(ref.mean == shuffled.mean);
	CHECK(ref.stdDev == shuffled.stdDev);
	CHECK(ref.percentiles == shuffled.percentiles);
	CHECK(ref.min <= ref.percentiles.at(2.5));
	CHECK(ref.percentiles.at(97.5) <= ref.max);
}

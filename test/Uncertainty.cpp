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

#include "tlca/Uncertainty.hpp"
#include "tlca/Exceptions.hpp"

#include <cmath>
#include <random>

TEST_CASE("Uncertainty type names", "[Uncertainty]")
{
	CHECK(tlca::toUncertaintyType("lognormal") == tlca::UncertaintyType::Lognormal);
	CHECK(tlca::toUncertaintyType("2") == tlca::UncertaintyType::Lognormal);
	CHECK(tlca::toUncertaintyType("5") == tlca::UncertaintyType::Triangular);
	CHECK(tlca::toUncertaintyType(tlca::to_string(tlca::UncertaintyType::Uniform)) == tlca::UncertaintyType::Uniform);
	CHECK_THROWS_AS(tlca::toUncertaintyType("beta"), tlca::InvalidParameterException);

	CHECK_FALSE(tlca::UncertaintySpec().isStochastic());
	CHECK(tlca::UncertaintySpec::normal(1.0).isStochastic());
}

TEST_CASE("Uncertainty validation", "[Uncertainty]")
{
	CHECK_NOTHROW(tlca::validateUncertainty(tlca::UncertaintySpec(), 0.0, "x"));
	CHECK_NOTHROW(tlca::validateUncertainty(tlca::UncertaintySpec::lognormal(0.1), 2.0, "x"));
	CHECK_THROWS_AS(tlca::validateUncertainty(tlca::UncertaintySpec::lognormal(0.1), 0.0, "x"), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::validateUncertainty(tlca::UncertaintySpec::lognormal(0.0), 1.0, "x"), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::validateUncertainty(tlca::UncertaintySpec::normal(-1.0), 1.0, "x"), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::validateUncertainty(tlca::UncertaintySpec::uniform(1.0, 1.0), 1.0, "x"), tlca::InvalidParameterException);
	CHECK_THROWS_AS(tlca::validateUncertainty(tlca::UncertaintySpec::triangular(0.0, 1.0), 2.0, "x"), tlca::InvalidParameterException);
	CHECK_NOTHROW(tlca::validateUncertainty(tlca::UncertaintySpec::triangular(0.0, 1.0), 1.0, "x"));
}

TEST_CASE("Uncertainty sampling respects supports", "[Uncertainty]")
{
	std::mt19937_64 rng(1234);

	const tlca::UncertaintySpec uniform = tlca::UncertaintySpec::uniform(0.4, 0.6);
	const tlca::UncertaintySpec triangular = tlca::UncertaintySpec::triangular(0.1, 0.4);
	const tlca::UncertaintySpec lognormal = tlca::UncertaintySpec::lognormal(0.2);

	for (int i = 0; i < 1000; ++i)
	{
		const double u = tlca::sampleAmount(uniform, 0.5, rng);
		CHECK(u >= 0.4);
		CHECK(u <= 0.6);

		const double t = tlca::sampleAmount(triangular, 0.2, rng);
		CHECK(t >= 0.1);
		CHECK(t <= 0.4);

		CHECK(tlca::sampleAmount(lognormal, 10.0, rng) > 0.0);
		CHECK(tlca::sampleAmount(lognormal, -10.0, rng) < 0.0);
	}

	// Deterministic amounts do not consume random numbers
	std::mt19937_64 a(99);
	std::mt19937_64 b(99);
	CHECK(tlca::sampleAmount(tlca::UncertaintySpec(), 3.0, a) == 3.0);
	CHECK(a() == b());
}

TEST_CASE("Uncertainty sample mean approaches expected value", "[Uncertainty]")
{
	const tlca::UncertaintySpec specs[] = {
		tlca::UncertaintySpec::lognormal(0.2),
		tlca::UncertaintySpec::normal(0.5),
		tlca::UncertaintySpec::uniform(0.4, 0.6),
		tlca::UncertaintySpec::triangular(0.1, 0.4)
	};
	const double amounts[] = {10.0, 2.0, 0.5, 0.2};

	for (int k = 0; k < 4; ++k)
	{
		std::mt19937_64 rng(42 + k);
		const int n = 20000;
		double sum = 0.0;
		for (int i = 0; i < n; ++i)
			sum += tlca::sampleAmount(specs[k], amounts[k], rng);

		CHECK(sum / n == Approx(tlca::expectedAmount(specs[k], amounts[k])).epsilon(0.02));
	}

	CHECK(tlca::expectedAmount(tlca::UncertaintySpec::uniform(0.4, 0.6), 0.5) == Approx(0.5));
	CHECK(tlca::expectedAmount(tlca::UncertaintySpec::triangular(0.1, 0.4), 0.2) == Approx(0.7 / 3.0));
	CHECK(tlca::expectedAmount(tlca::UncertaintySpec::lognormal(0.2), 10.0) == Approx(10.0 * std::exp(0.02)));
}

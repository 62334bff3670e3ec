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

#include "tlca/TemporalDistribution.hpp"
#include "tlca/Exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <utility>

namespace
{
	/**
	 * @brief Sorts (offset, fraction) pairs by offset and merges nearly equal offsets
	 */
	void sortAndMerge(std::vector<std::pair<double, double>>& points, std::vector<double>& offsets, std::vector<double>& fractions)
	{
		std::sort(points.begin(), points.end(), [](const std::pair<double, double>& a, const std::pair<double, double>& b) { return a.first < b.first; });

		offsets.clear();
		fractions.clear();
		offsets.reserve(points.size());
		fractions.reserve(points.size());

		for (const std::pair<double, double>& p : points)
		{
			if (!offsets.empty() && (std::abs(p.first - offsets.back()) <= tlca::TemporalDistribution::offsetTolerance))
				fractions.back() += p.second;
			else
			{
				offsets.push_back(p.first);
				fractions.push_back(p.second);
			}
		}
	}
}

namespace tlca
{

TemporalDistribution::TemporalDistribution(std::vector<double>&& offsets, std::vector<double>&& fractions, Unchecked) TLCA_NOEXCEPT
	: _offsets(std::move(offsets)), _fractions(std::move(fractions))
{
}

TemporalDistribution::TemporalDistribution(const std::vector<double>& offsets, const std::vector<double>& fractions)
{
	if (offsets.size() != fractions.size())
		throw InvalidTemporalDistributionException("Temporal distribution has " + std::to_string(offsets.size()) + " offsets but " + std::to_string(fractions.size()) + " fractions");

	if (offsets.empty())
		throw InvalidTemporalDistributionException("Temporal distribution has no points");

	std::vector<std::pair<double, double>> points;
	points.reserve(offsets.size());
	for (std::size_t i = 0; i < offsets.size(); ++i)
	{
		if (!std::isfinite(offsets[i]) || !std::isfinite(fractions[i]))
			throw InvalidTemporalDistributionException("Temporal distribution has non-finite value at point " + std::to_string(i));

		points.emplace_back(offsets[i], fractions[i]);
	}

	sortAndMerge(points, _offsets, _fractions);

	const double sum = fractionSum();
	if (std::abs(sum - 1.0) > sumTolerance)
	{
		std::ostringstream oss;
		oss.precision(17);
		oss << "Temporal distribution fractions sum to " << sum << " instead of 1 (tolerance " << sumTolerance << ")";
		throw InvalidTemporalDistributionException(oss.str());
	}
}

TemporalDistribution TemporalDistribution::immediate()
{
	return TemporalDistribution(std::vector<double>(1, 0.0), std::vector<double>(1, 1.0), Unchecked());
}

TemporalDistribution TemporalDistribution::exponentialDecay(double rate, unsigned int period)
{
	if (!(rate > 0.0) || !std::isfinite(rate))
		throw InvalidTemporalDistributionException("Exponential decay requires a positive finite rate, got " + std::to_string(rate));

	std::vector<double> years(period + 1);
	std::vector<double> weights(period + 1);
	for (unsigned int t = 0; t <= period; ++t)
	{
		years[t] = t;
		weights[t] = rate * std::exp(-rate * t);
	}

	const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
	for (double& w : weights)
		w /= total;

	return TemporalDistribution(std::move(years), std::move(weights), Unchecked());
}

TemporalDistribution TemporalDistribution::uniform(double start, double end, unsigned int steps)
{
	if (steps == 0)
		throw InvalidTemporalDistributionException("Uniform distribution requires at least one step");

	if (!std::isfinite(start) || !std::isfinite(end) || (end < start))
		throw InvalidTemporalDistributionException("Uniform distribution requires finite start <= end");

	std::vector<std::pair<double, double>> points;
	points.reserve(steps);

	const double h = (steps > 1) ? (end - start) / static_cast<double>(steps - 1) : 0.0;
	for (unsigned int i = 0; i < steps; ++i)
		points.emplace_back(std::trunc(start + h * i), 1.0 / static_cast<double>(steps));

	std::vector<double> offsets;
	std::vector<double> fractions;
	sortAndMerge(points, offsets, fractions);
	return TemporalDistribution(std::move(offsets), std::move(fractions), Unchecked());
}

double TemporalDistribution::fractionSum() const TLCA_NOEXCEPT
{
	return std::accumulate(_fractions.begin(), _fractions.end(), 0.0);
}

void TemporalDistribution::checkOffsets(bool allowNegativeOffsets, const std::string& context) const
{
	if (!allowNegativeOffsets && hasNegativeOffsets())
	{
		std::ostringstream oss;
		oss << "Temporal distribution of " << context << " has negative offset " << _offsets.front() << " but negative offsets are not allowed";
		throw InvalidTemporalDistributionException(oss.str());
	}
}

TemporalDistribution TemporalDistribution::convolve(const TemporalDistribution& other) const
{
	if (other.empty())
		return *this;
	if (empty())
		return other;

	// Convolution with a single point is a shift and scale
	if (other.size() == 1)
	{
		std::vector<double> offsets(_offsets);
		std::vector<double> fractions(_fractions);
		for (std::size_t i = 0; i < offsets.size(); ++i)
		{
			offsets[i] += other._offsets[0];
			fractions[i] *= other._fractions[0];
		}
		return TemporalDistribution(std::move(offsets), std::move(fractions), Unchecked());
	}

	std::vector<std::pair<double, double>> points;
	points.reserve(size() * other.size());
	for (std::size_t i = 0; i < size(); ++i)
	{
		for (std::size_t j = 0; j < other.size(); ++j)
			points.emplace_back(_offsets[i] + other._offsets[j], _fractions[i] * other._fractions[j]);
	}

	std::vector<double> offsets;
	std::vector<double> fractions;
	sortAndMerge(points, offsets, fractions);
	return TemporalDistribution(std::move(offsets), std::move(fractions), Unchecked());
}

TemporalDistribution TemporalDistribution::reweighted(const std::vector<double>& weights) const
{
	if (weights.size() != _offsets.size())
		throw InvalidTemporalDistributionException("Expected " + std::to_string(_offsets.size()) + " weights but got " + std::to_string(weights.size()));

	const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
	if (!(total > 0.0) || !std::isfinite(total))
		throw InvalidTemporalDistributionException("Weights of temporal distribution must have a positive finite sum");

	std::vector<double> fractions(weights.size());
	for (std::size_t i = 0; i < weights.size(); ++i)
		fractions[i] = weights[i] / total;

	return TemporalDistribution(std::vector<double>(_offsets), std::move(fractions), Unchecked());
}

} // namespace tlca

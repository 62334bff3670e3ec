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

#include "tlca/Statistics.hpp"
#include "tlca/Exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace tlca
{

double percentile(const std::vector<double>& sorted, double p)
{
	if (!(p >= 0.0) || !(p <= 100.0))
		throw InvalidParameterException("Percentile has to be in [0, 100], got " + std::to_string(p));

	if (sorted.empty())
		return std::numeric_limits<double>::quiet_NaN();

	const double rank = p / 100.0 * static_cast<double>(sorted.size() - 1);
	const std::size_t lower = static_cast<std::size_t>(std::floor(rank));
	const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
	const double frac = rank - static_cast<double>(lower);

	return sorted[lower] + frac * (sorted[upper] - sorted[lower]);
}

SummaryStatistics summarize(std::vector<double> values, const std::vector<double>& percentiles)
{
	SummaryStatistics stats;
	stats.count = values.size();

	if (values.empty())
	{
		for (double p : percentiles)
			stats.percentiles[p] = percentile(values, p);
		return stats;
	}

	// Sorting first makes the sums independent of the input order
	std::sort(values.begin(), values.end());

	double sum = 0.0;
	for (double v : values)
		sum += v;
	stats.mean = sum / static_cast<double>(values.size());

	if (values.size() > 1)
	{
		double sqSum = 0.0;
		for (double v : values)
			sqSum += (v - stats.mean) * (v - stats.mean);
		stats.stdDev = std::sqrt(sqSum / static_cast<double>(values.size() - 1));
	}
	else
		stats.stdDev = 0.0;

	stats.min = values.front();
	stats.max = values.back();

	for (double p : percentiles)
		stats.percentiles[p] = percentile(values, p);

	return stats;
}

} // namespace tlca

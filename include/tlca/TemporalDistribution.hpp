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
 * Defines the TemporalDistribution of an exchange.
 */

#ifndef LIBTLCA_TEMPORALDISTRIBUTION_HPP_
#define LIBTLCA_TEMPORALDISTRIBUTION_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <string>
#include <vector>

namespace tlca
{

/**
 * @brief Normalized split of an amount across time offsets (in years)
 * @details Offsets are kept sorted in ascending order and are unique. The fractions
 *          sum to 1 within TemporalDistribution::sumTolerance. A default constructed
 *          distribution is empty and denotes the absence of temporal information,
 *          which is treated as an immediate exchange.
 */
class TLCA_API TemporalDistribution
{
public:

	/**
	 * @brief Maximum deviation of the fraction sum from 1
	 */
	static TLCA_CONSTEXPR double sumTolerance = 1e-9;

	/**
	 * @brief Offsets closer than this are merged
	 */
	static TLCA_CONSTEXPR double offsetTolerance = 1e-9;

	TemporalDistribution() TLCA_NOEXCEPT { }

	/**
	 * @brief Creates a distribution from (offset, fraction) pairs
	 * @details Pairs are sorted by offset and equal offsets are merged. Throws
	 *          InvalidTemporalDistributionException if the vectors have different
	 *          or zero length, contain non-finite values, or if the fractions do
	 *          not sum to 1. The distribution is never normalized silently.
	 * @param [in] offsets Time offsets in years
	 * @param [in] fractions Fraction of the amount at each offset
	 */
	TemporalDistribution(const std::vector<double>& offsets, const std::vector<double>& fractions);

	/**
	 * @brief Single point at offset 0
	 */
	static TemporalDistribution immediate();

	/**
	 * @brief Discretized exponential decay over yearly points
	 * @details Points at t = 0, 1, ..., @p period with weights @f$ k e^{-k t} @f$
	 *          normalized to sum 1.
	 * @param [in] rate Decay constant @f$ k > 0 @f$ in 1/year
	 * @param [in] period Last year of the distribution
	 */
	static TemporalDistribution exponentialDecay(double rate, unsigned int period);

	/**
	 * @brief Equal fractions at @p steps evenly spaced years between @p start and @p end
	 * @details The spacing is truncated to whole years, coinciding years are merged.
	 * @param [in] start First year
	 * @param [in] end Last year
	 * @param [in] steps Number of points
	 */
	static TemporalDistribution uniform(double start, double end, unsigned int steps);

	inline bool empty() const TLCA_NOEXCEPT { return _offsets.empty(); }
	inline std::size_t size() const TLCA_NOEXCEPT { return _offsets.size(); }
	inline const std::vector<double>& offsets() const TLCA_NOEXCEPT { return _offsets; }
	inline const std::vector<double>& fractions() const TLCA_NOEXCEPT { return _fractions; }
	inline double offset(std::size_t idx) const { return _offsets[idx]; }
	inline double fraction(std::size_t idx) const { return _fractions[idx]; }

	double fractionSum() const TLCA_NOEXCEPT;

	inline bool hasNegativeOffsets() const TLCA_NOEXCEPT { return !_offsets.empty() && (_offsets.front() < 0.0); }

	/**
	 * @brief Checks offsets against the configured policy
	 * @details Throws InvalidTemporalDistributionException naming @p context if a negative
	 *          offset is present and @p allowNegativeOffsets is @c false.
	 * @param [in] allowNegativeOffsets Whether offsets before the triggering activation are allowed
	 * @param [in] context Description of the owner (e.g., the exchange)
	 */
	void checkOffsets(bool allowNegativeOffsets, const std::string& context) const;

	/**
	 * @brief Convolves this distribution with another one
	 * @details Offsets are added and fractions multiplied. An empty distribution acts
	 *          as the neutral element.
	 * @param [in] other Distribution to convolve with
	 * @return Convolved distribution
	 */
	TemporalDistribution convolve(const TemporalDistribution& other) const;

	/**
	 * @brief Replaces the fractions and renormalizes them
	 * @details Offsets are kept. Throws InvalidTemporalDistributionException if the
	 *          new fractions have the wrong size or do not have a positive finite sum.
	 * @param [in] weights Unnormalized weights, one per offset
	 * @return Distribution with the same offsets and normalized @p weights
	 */
	TemporalDistribution reweighted(const std::vector<double>& weights) const;

private:
	struct Unchecked { };
	TemporalDistribution(std::vector<double>&& offsets, std::vector<double>&& fractions, Unchecked) TLCA_NOEXCEPT;

	std::vector<double> _offsets;
	std::vector<double> _fractions;
};

} // namespace tlca

#endif  // LIBTLCA_TEMPORALDISTRIBUTION_HPP_

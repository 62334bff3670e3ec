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
 * Summary statistics of Monte Carlo samples.
 */

#ifndef LIBTLCA_STATISTICS_HPP_
#define LIBTLCA_STATISTICS_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <vector>

namespace tlca
{

/**
 * @brief Summary of a set of samples
 * @details Mean, standard deviation, minimum and maximum are NaN for an empty set.
 *          The standard deviation is the sample standard deviation (0 for a single sample).
 */
struct TLCA_API SummaryStatistics
{
	uint64_t count = 0;
	double mean = std::numeric_limits<double>::quiet_NaN();
	double stdDev = std::numeric_limits<double>::quiet_NaN();
	double min = std::numeric_limits<double>::quiet_NaN();
	double max = std::numeric_limits<double>::quiet_NaN();
	std::map<double, double> percentiles; //!< Percentile (in [0, 100]) to value
};

/**
 * @brief Computes the percentile of sorted values
 * @details Linear interpolation between the two closest order statistics.
 *          Throws InvalidParameterException if @p p is outside [0, 100].
 * @param [in] sorted Values in ascending order
 * @param [in] p Percentile in [0, 100]
 * @return Percentile, NaN if @p sorted is empty
 */
TLCA_API double percentile(const std::vector<double>& sorted, double p);

/**
 * @brief Summarizes samples
 * @details Values are sorted before they are accumulated, so the result does not
 *          depend on their order.
 * @param [in] values Samples
 * @param [in] percentiles Requested percentiles in [0, 100]
 * @return Summary statistics
 */
TLCA_API SummaryStatistics summarize(std::vector<double> values, const std::vector<double>& percentiles);

} // namespace tlca

#endif  // LIBTLCA_STATISTICS_HPP_

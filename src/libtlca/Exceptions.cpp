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

#include "tlca/Exceptions.hpp"

#include <sstream>

namespace tlca
{

namespace
{
	std::string massBalanceMessage(const std::string& flowId, double expected, double actual, double tolerance)
	{
		std::ostringstream oss;
		oss.precision(17);
		oss << "Temporal mass balance violated for flow '" << flowId << "': timeline plus residual yields " << actual
			<< " but static inventory is " << expected << " (divergence " << (actual - expected) << ", tolerance " << tolerance << ")";
		return oss.str();
	}

	std::string failureRateMessage(double failureRate, double threshold, const std::vector<uint64_t>& failedSamples)
	{
		std::ostringstream oss;
		oss << "Monte Carlo failure rate " << failureRate << " exceeds threshold " << threshold << ", failed samples: [";
		for (std::size_t i = 0; i < failedSamples.size(); ++i)
		{
			if (i > 0)
				oss << ",";
			oss << failedSamples[i];
		}
		oss << "]";
		return oss.str();
	}
}

TemporalMassBalanceException::TemporalMassBalanceException(const std::string& flowId, double expected, double actual, double tolerance)
	: std::runtime_error(massBalanceMessage(flowId, expected, actual, tolerance)), _flowId(flowId), _expected(expected), _actual(actual), _tolerance(tolerance)
{
}

ExcessiveSampleFailureRateException::ExcessiveSampleFailureRateException(double failureRate, double threshold, const std::vector<uint64_t>& failedSamples)
	: std::runtime_error(failureRateMessage(failureRate, threshold, failedSamples)), _failureRate(failureRate), _threshold(threshold), _failedSamples(failedSamples)
{
}

} // namespace tlca

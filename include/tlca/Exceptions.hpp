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
 * Defines exceptions.
 */

#ifndef LIBTLCA_EXCEPTIONS_HPP_
#define LIBTLCA_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

#include "tlca/LibExportImport.hpp"

namespace tlca
{

/**
 * @brief Signals invalid parameter or option values
 */
class TLCA_API InvalidParameterException : public std::domain_error
{
public:
	explicit InvalidParameterException(const std::string& what_arg) : std::domain_error(what_arg) { }
	explicit InvalidParameterException(const char* what_arg) : std::domain_error(what_arg) { }
};

/**
 * @brief Signals a reference to a node that does not exist or has the wrong kind
 */
class TLCA_API UnknownNodeException : public InvalidParameterException
{
public:
	UnknownNodeException(const std::string& nodeId, const std::string& context)
		: InvalidParameterException("Unknown node '" + nodeId + "' " + context), _nodeId(nodeId) { }

	inline const std::string& nodeId() const { return _nodeId; }

private:
	std::string _nodeId;
};

/**
 * @brief Signals an invalid temporal distribution
 * @details Raised for fractions that do not sum to 1, mismatched or non-finite values,
 *          and negative offsets that are not allowed.
 */
class TLCA_API InvalidTemporalDistributionException : public InvalidParameterException
{
public:
	explicit InvalidTemporalDistributionException(const std::string& what_arg) : InvalidParameterException(what_arg) { }
};

/**
 * @brief Signals a technosphere matrix that cannot be inverted for the given demand
 */
class TLCA_API SingularSystemException : public std::runtime_error
{
public:
	SingularSystemException(const std::string& what_arg, const std::string& nodeId)
		: std::runtime_error(what_arg), _nodeId(nodeId) { }
	explicit SingularSystemException(const std::string& what_arg) : std::runtime_error(what_arg) { }

	/**
	 * @brief Returns the offending node or an empty string if it is unknown
	 */
	inline const std::string& nodeId() const { return _nodeId; }

private:
	std::string _nodeId;
};

/**
 * @brief Signals a divergence between traversal-derived and matrix-derived inventory
 */
class TLCA_API TemporalMassBalanceException : public std::runtime_error
{
public:
	TemporalMassBalanceException(const std::string& flowId, double expected, double actual, double tolerance);

	inline const std::string& flowId() const { return _flowId; }
	inline double expected() const { return _expected; }
	inline double actual() const { return _actual; }
	inline double divergence() const { return _actual - _expected; }
	inline double tolerance() const { return _tolerance; }

private:
	std::string _flowId;
	double _expected;
	double _actual;
	double _tolerance;
};

/**
 * @brief Signals a flow without characterization kernel
 */
class TLCA_API UnresolvedFlowException : public std::runtime_error
{
public:
	explicit UnresolvedFlowException(const std::string& flowId)
		: std::runtime_error("No characterization kernel for flow '" + flowId + "' (also checked remapping table)"), _flowId(flowId) { }

	inline const std::string& flowId() const { return _flowId; }

private:
	std::string _flowId;
};

/**
 * @brief Signals a Monte Carlo sample that exceeded its wall-clock budget
 */
class TLCA_API SampleTimeoutException : public std::runtime_error
{
public:
	SampleTimeoutException(uint64_t sampleIndex, double timeout)
		: std::runtime_error("Sample " + std::to_string(sampleIndex) + " exceeded timeout of " + std::to_string(timeout) + " s"),
		_sampleIndex(sampleIndex), _timeout(timeout) { }

	inline uint64_t sampleIndex() const { return _sampleIndex; }
	inline double timeout() const { return _timeout; }

private:
	uint64_t _sampleIndex;
	double _timeout;
};

/**
 * @brief Signals a Monte Carlo run with too many failed samples
 */
class TLCA_API ExcessiveSampleFailureRateException : public std::runtime_error
{
public:
	ExcessiveSampleFailureRateException(double failureRate, double threshold, const std::vector<uint64_t>& failedSamples);

	inline double failureRate() const { return _failureRate; }
	inline double threshold() const { return _threshold; }
	inline const std::vector<uint64_t>& failedSamples() const { return _failedSamples; }

private:
	double _failureRate;
	double _threshold;
	std::vector<uint64_t> _failedSamples;
};

} // namespace tlca

#endif  // LIBTLCA_EXCEPTIONS_HPP_

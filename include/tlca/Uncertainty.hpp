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
 * Defines uncertainty specifications of exchange amounts and how to sample them.
 */

#ifndef LIBTLCA_UNCERTAINTY_HPP_
#define LIBTLCA_UNCERTAINTY_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <limits>
#include <random>
#include <string>

namespace tlca
{

/**
 * @brief Distribution family of an uncertain amount
 * @details The numeric values follow the common LCA uncertainty type codes.
 */
enum class UncertaintyType : int
{
	Undefined = 0,
	None = 1,
	Lognormal = 2,
	Normal = 3,
	Uniform = 4,
	Triangular = 5
};

TLCA_API const char* to_string(UncertaintyType type) TLCA_NOEXCEPT;

/**
 * @brief Parses an uncertainty type from its name (e.g., @c lognormal) or numeric code
 * @details Throws InvalidParameterException for unknown names.
 */
TLCA_API UncertaintyType toUncertaintyType(const std::string& name);

/**
 * @brief Uncertainty specification of an exchange amount
 * @details Parameters not used by a distribution family are NaN. The meaning of the
 *          parameters depends on the family:
 *          - Lognormal: @c loc is the mean of the underlying normal distribution
 *            (defaults to @f$ \ln |a| @f$ of the amount @f$ a @f$), @c scale its standard deviation.
 *            The sign of the amount is preserved.
 *          - Normal: @c loc is the mean (defaults to the amount), @c scale the standard deviation.
 *          - Uniform: @c minimum and @c maximum bound the interval.
 *          - Triangular: @c minimum, mode @c loc (defaults to the amount), @c maximum.
 */
struct TLCA_API UncertaintySpec
{
	UncertaintyType type = UncertaintyType::Undefined;
	double loc = std::numeric_limits<double>::quiet_NaN();
	double scale = std::numeric_limits<double>::quiet_NaN();
	double shape = std::numeric_limits<double>::quiet_NaN();
	double minimum = std::numeric_limits<double>::quiet_NaN();
	double maximum = std::numeric_limits<double>::quiet_NaN();

	inline bool isStochastic() const TLCA_NOEXCEPT { return (type != UncertaintyType::Undefined) && (type != UncertaintyType::None); }

	static UncertaintySpec lognormal(double sigma);
	static UncertaintySpec normal(double stdDev);
	static UncertaintySpec uniform(double minimum, double maximum);
	static UncertaintySpec triangular(double minimum, double maximum);
};

/**
 * @brief Checks whether an uncertainty specification is usable for a given amount
 * @details Throws InvalidParameterException naming @p context if not.
 * @param [in] spec Uncertainty specification
 * @param [in] amount Deterministic amount of the exchange
 * @param [in] context Description of the exchange
 */
TLCA_API void validateUncertainty(const UncertaintySpec& spec, double amount, const std::string& context);

/**
 * @brief Draws an amount from an uncertainty specification
 * @details Returns @p amount for deterministic specifications without touching @p rng.
 *          The specification has to be valid (see validateUncertainty()).
 * @param [in] spec Uncertainty specification
 * @param [in] amount Deterministic amount of the exchange
 * @param [in,out] rng Random number generator
 * @return Sampled amount
 */
TLCA_API double sampleAmount(const UncertaintySpec& spec, double amount, std::mt19937_64& rng);

/**
 * @brief Returns the expected value of the distribution
 * @param [in] spec Uncertainty specification
 * @param [in] amount Deterministic amount of the exchange
 * @return Expected value
 */
TLCA_API double expectedAmount(const UncertaintySpec& spec, double amount);

} // namespace tlca

#endif  // LIBTLCA_UNCERTAINTY_HPP_

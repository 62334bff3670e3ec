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
 * Defines the interface through which configurations are read.
 */

#ifndef LIBTLCA_PARAMPROVIDER_HPP_
#define LIBTLCA_PARAMPROVIDER_HPP_

#include <string>
#include <vector>
#include <cstdint>

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

namespace tlca
{

/**
 * @brief Read access to a hierarchical configuration
 * @details A configuration consists of groups (e.g., @c model, @c temporal, @c montecarlo)
 *          that contain fields and numbered subgroups such as @c node_000 or @c exchange_012.
 *          All field names are relative to the group opened last.
 *
 *          Getters throw InvalidParameterException if a field is missing or cannot be
 *          converted to the requested type.
 */
class TLCA_API IParameterProvider
{
public:

	virtual ~IParameterProvider() TLCA_NOEXCEPT { }

	virtual double getDouble(const std::string& paramName) = 0;
	virtual int getInt(const std::string& paramName) = 0;

	/**
	 * @brief Returns a non-negative integer field
	 * @details Used for counts and seeds that exceed the range of @c int.
	 * @param [in] paramName Name of the field
	 * @return Value of the field
	 */
	virtual uint64_t getUint64(const std::string& paramName) = 0;

	virtual bool getBool(const std::string& paramName) = 0;
	virtual std::string getString(const std::string& paramName) = 0;

	virtual std::vector<double> getDoubleArray(const std::string& paramName) = 0;
	virtual std::vector<std::string> getStringArray(const std::string& paramName) = 0;

	/**
	 * @brief Checks whether the opened group contains a field or subgroup
	 * @param [in] paramName Name of the field or subgroup
	 * @return @c true if it exists, otherwise @c false
	 */
	virtual bool exists(const std::string& paramName) = 0;

	/**
	 * @brief Opens a subgroup of the currently opened group
	 * @param [in] scope Name of the subgroup
	 */
	virtual void pushScope(const std::string& scope) = 0;

	/**
	 * @brief Returns to the parent of the currently opened group
	 */
	virtual void popScope() = 0;
};

} // namespace tlca

#endif  // LIBTLCA_PARAMPROVIDER_HPP_

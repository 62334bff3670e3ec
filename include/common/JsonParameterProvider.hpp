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
 * Defines a ParameterProvider that uses JSON.
 */

#ifndef TLCA_JSONPARAMETERPROVIDER_HPP_
#define TLCA_JSONPARAMETERPROVIDER_HPP_

#include "tlca/ParameterProvider.hpp"
#include "common/CompilerSpecific.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <stack>
#include <ostream>

namespace tlca
{

/**
 * @brief IParameterProvider backed by an nlohmann::json document
 * @details Scalars given as single element arrays are accepted by scalar getters,
 *          and scalars are accepted by array getters. The setters write into the
 *          currently opened scope, which allows assembling result documents.
 */
class TLCA_API JsonParameterProvider : public tlca::IParameterProvider
{
public:

	JsonParameterProvider(const char* data);
	JsonParameterProvider(const std::string& data);
	JsonParameterProvider(const nlohmann::json& data);
	JsonParameterProvider(const JsonParameterProvider& cpy);
	JsonParameterProvider(JsonParameterProvider&& cpy) TLCA_NOEXCEPT;

	virtual ~JsonParameterProvider() TLCA_NOEXCEPT;

	JsonParameterProvider& operator=(const JsonParameterProvider& cpy);
	JsonParameterProvider& operator=(JsonParameterProvider&& cpy) TLCA_NOEXCEPT;

	virtual double getDouble(const std::string& paramName);
	virtual int getInt(const std::string& paramName);
	virtual uint64_t getUint64(const std::string& paramName);
	virtual bool getBool(const std::string& paramName);
	virtual std::string getString(const std::string& paramName);
	virtual std::vector<double> getDoubleArray(const std::string& paramName);
	virtual std::vector<std::string> getStringArray(const std::string& paramName);
	virtual bool exists(const std::string& paramName);
	virtual void pushScope(const std::string& scope);
	virtual void popScope();

	/**
	 * @brief Creates an empty scope in the current scope unless it already exists
	 * @param [in] scope Name of the scope
	 */
	void addScope(const std::string& scope);

	void set(const std::string& paramName, double val);
	void set(const std::string& paramName, int val);
	void set(const std::string& paramName, uint64_t val);
	void set(const std::string& paramName, bool val);
	void set(const std::string& paramName, char const* val);
	void set(const std::string& paramName, const std::string& val);
	void set(const std::string& paramName, const std::vector<double>& val);
	void set(const std::string& paramName, const std::vector<int>& val);
	void set(const std::string& paramName, const std::vector<uint64_t>& val);
	void set(const std::string& paramName, const std::vector<std::string>& val);

	void remove(const std::string& name);

	inline nlohmann::json* data() { return _root; }
	inline nlohmann::json const* data() const { return _root; }

	/**
	 * @brief Writes the whole document (not only the current scope) to a file
	 * @param [in] fileName Path of the file
	 */
	void toFile(const std::string& fileName) const;

	/**
	 * @brief Reads a document from a file
	 * @details Throws InvalidParameterException if the file cannot be read or parsed.
	 * @param [in] fileName Path of the file
	 * @return Provider with the root scope opened
	 */
	static JsonParameterProvider fromFile(const std::string& fileName);

private:
	JsonParameterProvider(nlohmann::json* data);

	const nlohmann::json& scalarParameter(const std::string& paramName) const;
	const nlohmann::json& parameter(const std::string& paramName) const;
	std::string scopedName(const std::string& paramName) const;

	nlohmann::json* _root;
	std::stack<nlohmann::json*> _opened;
	std::string _scopePath;
};

std::ostream& operator<<(std::ostream& out, const JsonParameterProvider& jpp);

} // namespace tlca

#endif  // TLCA_JSONPARAMETERPROVIDER_HPP_

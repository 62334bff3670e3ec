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

#include <nlohmann/json.hpp>

#include <sstream>
#include <fstream>

#include "common/JsonParameterProvider.hpp"
#include "tlca/Exceptions.hpp"

using json = nlohmann::json;

namespace tlca
{

namespace
{
	json* parseDocument(const std::string& data)
	{
		try
		{
			return new json(json::parse(data));
		}
		catch (const json::exception& e)
		{
			throw InvalidParameterException(std::string("Cannot parse JSON document: ") + e.what());
		}
	}
}

JsonParameterProvider::JsonParameterProvider(const char* data) : _root(parseDocument(data)), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const std::string& data) : _root(parseDocument(data)), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const json& data) : _root(new json(data)), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(json* data) : _root(data), _scopePath("/")
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const JsonParameterProvider& cpy) : _root(new json(*cpy._root)), _scopePath("/")
{
	// Scope pointers refer to the source document, so the copy starts at its root
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(JsonParameterProvider&& cpy) TLCA_NOEXCEPT : _root(cpy._root), _opened(std::move(cpy._opened)), _scopePath(std::move(cpy._scopePath))
{
	cpy._root = nullptr;
	cpy._opened = std::stack<json*>();
}

JsonParameterProvider::~JsonParameterProvider() TLCA_NOEXCEPT
{
	delete _root;
}

JsonParameterProvider& JsonParameterProvider::operator=(const JsonParameterProvider& cpy)
{
	if (this == &cpy)
		return *this;

	json* const newRoot = new json(*cpy._root);
	delete _root;

	_root = newRoot;
	_opened = std::stack<json*>();
	_opened.push(_root);
	_scopePath = "/";

	return *this;
}

JsonParameterProvider& JsonParameterProvider::operator=(JsonParameterProvider&& cpy) TLCA_NOEXCEPT
{
	delete _root;
	_root = cpy._root;
	_opened = std::move(cpy._opened);
	_scopePath = std::move(cpy._scopePath);

	cpy._root = nullptr;
	cpy._opened = std::stack<json*>();

	return *this;
}

std::string JsonParameterProvider::scopedName(const std::string& paramName) const
{
	if (_scopePath.back() == '/')
		return _scopePath + paramName;
	return _scopePath + "/" + paramName;
}

const json& JsonParameterProvider::parameter(const std::string& paramName) const
{
	const json& scope = *_opened.top();
	const json::const_iterator it = scope.find(paramName);
	if (it == scope.end())
		throw InvalidParameterException("Missing parameter " + scopedName(paramName));

	return *it;
}

const json& JsonParameterProvider::scalarParameter(const std::string& paramName) const
{
	const json& p = parameter(paramName);
	if (p.is_array() && (p.size() == 1))
		return p[0];
	return p;
}

double JsonParameterProvider::getDouble(const std::string& paramName)
{
	const json& p = scalarParameter(paramName);
	if (!p.is_number())
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not a number");

	return p.get<double>();
}

int JsonParameterProvider::getInt(const std::string& paramName)
{
	const json& p = scalarParameter(paramName);
	if (p.is_boolean())
		return p.get<bool>();

	if (!p.is_number_integer())
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not an integer");

	return p.get<int>();
}

uint64_t JsonParameterProvider::getUint64(const std::string& paramName)
{
	const json& p = scalarParameter(paramName);
	if (!p.is_number_unsigned() && !(p.is_number_integer() && (p.get<int64_t>() >= 0)))
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not a non-negative integer");

	return p.get<uint64_t>();
}

bool JsonParameterProvider::getBool(const std::string& paramName)
{
	const json& p = scalarParameter(paramName);
	if (p.is_number_integer())
		return p.get<int>() != 0;

	if (!p.is_boolean())
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not a boolean");

	return p.get<bool>();
}

std::string JsonParameterProvider::getString(const std::string& paramName)
{
	const json& p = scalarParameter(paramName);
	if (!p.is_string())
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not a string");

	return p.get<std::string>();
}

std::vector<double> JsonParameterProvider::getDoubleArray(const std::string& paramName)
{
	const json& p = parameter(paramName);
	try
	{
		if (!p.is_array())
			return std::vector<double>(1, p.get<double>());

		return p.get<std::vector<double>>();
	}
	catch (const json::exception& e)
	{
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not a number array: " + e.what());
	}
}

std::vector<std::string> JsonParameterProvider::getStringArray(const std::string& paramName)
{
	const json& p = parameter(paramName);
	try
	{
		if (!p.is_array())
			return std::vector<std::string>(1, p.get<std::string>());

		return p.get<std::vector<std::string>>();
	}
	catch (const json::exception& e)
	{
		throw InvalidParameterException("Parameter " + scopedName(paramName) + " is not a string array: " + e.what());
	}
}

bool JsonParameterProvider::exists(const std::string& paramName)
{
	return _opened.top()->find(paramName) != _opened.top()->end();
}

void JsonParameterProvider::pushScope(const std::string& scope)
{
	json& s = const_cast<json&>(parameter(scope));
	if (!s.is_object())
		throw InvalidParameterException("Parameter " + scopedName(scope) + " is not a scope");

	_opened.push(&s);
	_scopePath = scopedName(scope);
}

void JsonParameterProvider::popScope()
{
	if (_opened.size() <= 1)
		throw InvalidParameterException("Cannot leave root scope");

	_opened.pop();

	const std::size_t idx = _scopePath.find_last_of('/');
	_scopePath.erase((idx == 0) ? 1 : idx);
}

void JsonParameterProvider::addScope(const std::string& scope)
{
	if (!exists(scope))
		(*_opened.top())[scope] = json::object();
}

void JsonParameterProvider::set(const std::string& paramName, double val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, int val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, uint64_t val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, bool val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, char const* val)
{
	(*_opened.top())[paramName] = std::string(val);
}

void JsonParameterProvider::set(const std::string& paramName, const std::string& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<double>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<int>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<uint64_t>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<std::string>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::remove(const std::string& name)
{
	(*_opened.top()).erase(name);
}

void JsonParameterProvider::toFile(const std::string& fileName) const
{
	std::ofstream ofs(fileName, std::ios::out | std::ios::trunc);
	if (!ofs)
		throw InvalidParameterException("Cannot open file " + fileName + " for writing");

	ofs << _root->dump(4);
}

JsonParameterProvider JsonParameterProvider::fromFile(const std::string& fileName)
{
	std::ifstream ifs(fileName);
	if (!ifs)
		throw InvalidParameterException("Cannot open file " + fileName);

	json* root = new json();
	try
	{
		ifs >> (*root);
	}
	catch (const json::exception& e)
	{
		delete root;
		throw InvalidParameterException("Cannot parse JSON file " + fileName + ": " + e.what());
	}

	return JsonParameterProvider(root);
}

std::ostream& operator<<(std::ostream& out, const JsonParameterProvider& jpp)
{
	out << jpp.data()->dump(4);
	return out;
}

} // namespace tlca

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
 * Scope guards for parameter providers.
 */

#ifndef LIBTLCA_PARAMSCOPES_HPP_
#define LIBTLCA_PARAMSCOPES_HPP_

#include "tlca/ParameterProvider.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace tlca
{
namespace util
{

	/**
	 * @brief Returns the name of an indexed group, e.g. @c node_007
	 * @param [in] prefix Name of the group without index
	 * @param [in] idx Index of the group
	 */
	inline std::string indexedGroup(const std::string& prefix, unsigned int idx)
	{
		std::ostringstream oss;
		oss << prefix << "_" << std::setfill('0') << std::setw(3) << std::setprecision(0) << idx;
		return oss.str();
	}

	/**
	 * @brief ParameterProvider scope guard for existent group
	 * @details Opens and closes the given ParameterProvider scope.
	 */
	class GroupScope
	{
	public:

		/**
		 * @brief Enters a given scope
		 * @details The group has to exist.
		 * @param [in,out] pp ParameterProvider
		 * @param [in] grp Name of group
		 */
		GroupScope(tlca::IParameterProvider& pp, const std::string& grp) : _pp(pp)
		{
			_pp.pushScope(grp);
		}

		~GroupScope()
		{
			_pp.popScope();
		}

		GroupScope(const GroupScope&) = delete;
		GroupScope& operator=(const GroupScope&) = delete;

	private:
		tlca::IParameterProvider& _pp;
	};

	/**
	 * @brief ParameterProvider scope guard for possibly existent group
	 * @details Opens and closes the given ParameterProvider scope if it exists.
	 */
	class OptionalGroupScope
	{
	public:

		/**
		 * @brief Enters a given scope if it exists
		 * @param [in,out] pp ParameterProvider
		 * @param [in] grp Name of group
		 */
		OptionalGroupScope(tlca::IParameterProvider& pp, const std::string& grp) : _pp(pp)
		{
			_active = pp.exists(grp);
			if (_active)
				_pp.pushScope(grp);
		}

		~OptionalGroupScope()
		{
			if (_active)
				_pp.popScope();
		}

		OptionalGroupScope(const OptionalGroupScope&) = delete;
		OptionalGroupScope& operator=(const OptionalGroupScope&) = delete;

		inline bool active() const TLCA_NOEXCEPT { return _active; }

	private:
		bool _active;
		tlca::IParameterProvider& _pp;
	};

} // namespace util
} // namespace tlca

#endif  // LIBTLCA_PARAMSCOPES_HPP_

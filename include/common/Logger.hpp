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
 * Write policies for the console.
 */

#ifndef TLCA_LOGGER_HPP_
#define TLCA_LOGGER_HPP_

#include "common/LoggerBase.hpp"

#include <iostream>

namespace tlca
{
namespace log
{
	/**
	 * @brief Writes warnings and more severe messages to std::cerr and the rest to std::cout
	 */
	class SelectiveStdWritePolicy
	{
	public:
		static inline void writeLine(const char*, const char*, unsigned int, LogLevel lvl, const std::string& msg)
		{
			std::ostream& os = (static_cast<unsigned int>(lvl) <= 3u) ? std::cerr : std::cout;
			os << msg << std::flush;
		}
	};

} // namespace log
} // namespace tlca

#endif  // TLCA_LOGGER_HPP_

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
 * Logging configuration for tlca-cli.
 */

#ifndef TLCACLI_LOGGING_IMPL_HPP_
#define TLCACLI_LOGGING_IMPL_HPP_

#include "tlca/Logging.hpp"
#include "common/Logger.hpp"

namespace tlca
{
namespace log
{

	/**
	 * @brief Prefixes messages with their level only, tlca-cli logs from few places
	 */
	struct CliFormattingPolicy
	{
		template <class params_t>
		static inline void format(std::ostream& os, const char*, const char*, unsigned int, LogLevel lvl, const params_t& p)
		{
			os << "tlca-cli " << to_string(lvl) << ": ";
			streamParams(os, p);
		}
	};

	typedef LineWritingLogger<CliFormattingPolicy, SelectiveStdWritePolicy> GlobalLogger;

#ifndef TLCA_LOGGING_DISABLE
	typedef Logger<RuntimeFilteringLogger<GlobalLogger>, LogLevel::TLCA_LOGLEVEL_MIN> CliLogger;
#else
	typedef Logger<GlobalLogger, LogLevel::None> CliLogger;
#endif

} // namespace log
} // namespace tlca

#define LOG(lvl) tlca::log::CliLogger::statement(__FILE__, __func__, __LINE__) = tlca::log::CliLogger::template createMessage<tlca::LogLevel::lvl>()

#endif  // TLCACLI_LOGGING_IMPL_HPP_

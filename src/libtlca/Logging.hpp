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
 * Adapter for transmitting the log messages to a receiver.
 */

#ifndef LIBTLCA_LOGGING_IMPL_HPP_
#define LIBTLCA_LOGGING_IMPL_HPP_

#include "tlca/Logging.hpp"
#include "common/LoggerBase.hpp"

namespace tlca
{
namespace log
{

	/**
	 * @brief Dispatches a log message to the registered receiver
	 * @param [in] file Filename in which the log message was raised
	 * @param [in] func Name of the function (implementation defined @c __func__ variable)
	 * @param [in] line Number of the line in which the log message was raised
	 * @param [in] lvl LogLevel representing the severity of the message
	 * @param [in] message Message string
	 */
	void emitLog(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* message);

	/**
	 * @brief Passes the bare message, the receiver gets position and level separately
	 */
	struct LibTlcaFormattingPolicy
	{
		template <class params_t>
		static inline void format(std::ostream& os, const char*, const char*, unsigned int, LogLevel, const params_t& p)
		{
			streamParams(os, p);
		}
	};

	struct EmitterWritePolicy
	{
		static inline void writeLine(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const std::string& msg)
		{
			emitLog(fileName, funcName, line, lvl, msg.c_str());
		}
	};

	typedef LineWritingLogger<LibTlcaFormattingPolicy, EmitterWritePolicy> GlobalLogger;

#ifndef TLCA_LOGGING_DISABLE
	typedef Logger<RuntimeFilteringLogger<GlobalLogger>, LogLevel::TLCA_LOGLEVEL_MIN> DoubleFilterLogger;
	
	#ifdef __clang__
		// Silence -Wundefined-var-template, the level is instantiated in Logging.cpp
		template<> LogLevel RuntimeFilteringLogger<GlobalLogger>::_minLvl;
		extern template class RuntimeFilteringLogger<GlobalLogger>;
	#endif
#else
	typedef Logger<GlobalLogger, LogLevel::None> DiscardingLogger;
#endif

} // namespace log
} // namespace tlca

#ifndef TLCA_LOGGING_DISABLE

	/**
	 * @brief Base for logging macros
	 * @details Used as
	 *          <pre>LOG(Info) << "Processed " << n << " nodes";</pre>
	 */
	#define LOG(lvl) tlca::log::DoubleFilterLogger::statement(__FILE__, __func__, __LINE__) = tlca::log::DoubleFilterLogger::template createMessage<tlca::LogLevel::lvl>()

#else

	#define LOG(lvl) tlca::log::DiscardingLogger::statement(__FILE__, __func__, __LINE__) = tlca::log::DiscardingLogger::template createMessage<tlca::LogLevel::lvl>()

#endif

#endif  // LIBTLCA_LOGGING_IMPL_HPP_

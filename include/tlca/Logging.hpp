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
 * Log levels and the receiver interface of library log messages.
 */

#ifndef LIBTLCA_LOGGING_HPP_
#define LIBTLCA_LOGGING_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <string>
#include <cctype>

namespace tlca
{
	/**
	 * @brief Severity of a log message
	 * @details Levels are nested, a level includes all levels of higher severity.
	 */
	enum class LogLevel : unsigned int
	{
		None = 0,
		Fatal = 1, //!< Computation cannot continue
		Error = 2, //!< Failed solve or sample
		Warning = 3,
		Normal = 4,
		Info = 5, //!< Run summaries and timings
		Debug = 6, //!< Solver paths and intermediate results
		Trace = 7 //!< Every traversal and sampling step
	};

	namespace detail
	{
		static const char* const logLevelNames[] = {"None", "Fatal", "Error", "Warning", "Normal", "Info", "Debug", "Trace"};
		static const unsigned int numLogLevels = sizeof(logLevelNames) / sizeof(logLevelNames[0]);
	}

	inline const char* to_string(LogLevel lvl) TLCA_NOEXCEPT
	{
		const unsigned int idx = static_cast<unsigned int>(lvl);
		return (idx < detail::numLogLevels) ? detail::logLevelNames[idx] : "Unknown";
	}

	/**
	 * @brief Parses a LogLevel from its name (case insensitive) or its numeric value
	 * @details Returns LogLevel::None for anything else.
	 * @param [in] ll Name or number of the level
	 * @return Parsed level
	 */
	inline LogLevel to_loglevel(const std::string& ll) TLCA_NOEXCEPT
	{
		if ((ll.size() == 1) && (ll[0] >= '0') && (ll[0] < static_cast<char>('0' + detail::numLogLevels)))
			return static_cast<LogLevel>(ll[0] - '0');

		for (unsigned int i = 0; i < detail::numLogLevels; ++i)
		{
			const char* name = detail::logLevelNames[i];
			std::size_t j = 0;
			while ((j < ll.size()) && name[j] && (std::tolower(static_cast<unsigned char>(ll[j])) == std::tolower(static_cast<unsigned char>(name[j]))))
				++j;

			if ((j == ll.size()) && !name[j])
				return static_cast<LogLevel>(i);
		}

		return LogLevel::None;
	}

	/**
	 * @brief Receives the log messages of the library
	 * @details Messages of concurrent Monte Carlo samples are delivered one at a time.
	 */
	class TLCA_API ILogReceiver
	{
	public:
		virtual ~ILogReceiver() TLCA_NOEXCEPT { }

		/**
		 * @brief Receives a single message including its trailing newline
		 * @param [in] file Source file of the LOG statement
		 * @param [in] func Enclosing function
		 * @param [in] line Source line
		 * @param [in] lvl Severity
		 * @param [in] message Message text
		 */
		virtual void message(const char* file, const char* func, unsigned int line, LogLevel lvl, const char* message) = 0;
	};

	/**
	 * @brief Installs @p recv as receiver of all library messages, @c nullptr silences the library
	 * @details The receiver is not owned.
	 */
	TLCA_API void setLogReceiver(ILogReceiver* recv);

	/**
	 * @brief Sets the least severe level that still reaches the receiver
	 * @details Levels above the compile-time minimum (TLCA_LOGLEVEL_MIN) are never delivered.
	 */
	TLCA_API void setLogLevel(LogLevel lvl);

	TLCA_API LogLevel getLogLevel();

} // namespace tlca

extern "C"
{
	TLCA_API void tlcaSetLogReceiver(tlca::ILogReceiver* recv);
	TLCA_API void tlcaSetLogLevel(unsigned int lvl);
}

#endif  // LIBTLCA_LOGGING_HPP_

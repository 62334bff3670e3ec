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
 * Policy based logger that filters messages at compile- and runtime.
 *
 * The design follows templog, a logging library created by Hendrik Schober
 * distributed under the Boost Software License, Version 1.0 (see http://www.boost.org/LICENSE_1_0.txt).
 * Templog can be found at http://templog.sourceforge.net/
 */

#ifndef TLCA_LOGGERBASE_HPP_
#define TLCA_LOGGERBASE_HPP_

#include "tlca/tlcaCompilerInfo.hpp"

#include <vector>
#include <string>
#include <sstream>
#include <ostream>

namespace tlca
{

enum class LogLevel : unsigned int;
inline const char* to_string(LogLevel lvl) TLCA_NOEXCEPT;

namespace log
{

	namespace detail
	{
		struct NullType { };

		/**
		 * @brief Chain of pointers to the streamed values of a message
		 * @details The chain grows to the left, so the first streamed value is the leftmost leaf.
		 */
		template <class Head_t, class Tail_t>
		struct ParamChain
		{
			Head_t head;
			Tail_t tail;

			ParamChain(const Head_t& h, const Tail_t& t) TLCA_NOEXCEPT : head(h), tail(t) { }
		};

		/**
		 * @brief Message of severity @p lvl under construction
		 * @details Messages that did not pass compile-time filtering (@p keep is @c false)
		 *          drop every streamed value, so that no formatting code is generated for them.
		 */
		template <LogLevel lvl, bool keep, class params_t>
		struct LogMessage
		{
			params_t params;

			LogMessage(const params_t& p = params_t()) TLCA_NOEXCEPT : params(p) { }
		};

		template <LogLevel lvl, class params_t, class value_t>
		inline LogMessage<lvl, false, NullType> operator<<(const LogMessage<lvl, false, params_t>&, const value_t&) TLCA_NOEXCEPT
		{
			return LogMessage<lvl, false, NullType>();
		}

		template <LogLevel lvl, class params_t, class value_t>
		inline LogMessage<lvl, true, ParamChain<params_t, const value_t*>> operator<<(const LogMessage<lvl, true, params_t>& msg, const value_t& v) TLCA_NOEXCEPT
		{
			return LogMessage<lvl, true, ParamChain<params_t, const value_t*>>(ParamChain<params_t, const value_t*>(msg.params, &v));
		}

		/**
		 * @brief Source position of a LOG statement
		 * @details Assigning the finished LogMessage hands it to @p logger_t. The streamed values
		 *          are referenced by pointer and stay alive until the end of the full expression.
		 */
		template <class logger_t>
		struct LogStatement
		{
			const char* fileName;
			const char* funcName;
			unsigned int line;

			LogStatement(const char* fin, const char* fun, unsigned int ln) TLCA_NOEXCEPT : fileName(fin), funcName(fun), line(ln) { }

			template <LogLevel lvl, bool keep, class params_t>
			inline void operator=(const LogMessage<lvl, keep, params_t>& msg)
			{
				logger_t::forward(fileName, funcName, line, msg);
			}
		};

	} // namespace detail

	template <class T>
	inline std::ostream& operator<<(std::ostream& os, const std::vector<T>& v)
	{
		os << "[";
		for (std::size_t i = 0; i < v.size(); ++i)
		{
			if (i > 0)
				os << ",";
			os << v[i];
		}
		os << "]";
		return os;
	}

	/**
	 * @brief Streams the values of a message in the order they were logged
	 */
	inline void streamParams(std::ostream&, detail::NullType) { }

	template <class value_t>
	inline void streamParams(std::ostream& os, const value_t* v)
	{
		os << *v;
	}

	template <class Head_t, class Tail_t>
	inline void streamParams(std::ostream& os, const detail::ParamChain<Head_t, Tail_t>& chain)
	{
		streamParams(os, chain.head);
		streamParams(os, chain.tail);
	}

	/**
	 * @brief First logger of a chain, discards messages above @p maxLvl at compile time
	 * @tparam next_t Logger that receives the remaining messages
	 * @tparam maxLvl Least severe level that is kept
	 */
	template <class next_t, LogLevel maxLvl>
	class Logger
	{
	public:

		typedef Logger<next_t, maxLvl> this_logger_t;

		static inline detail::LogStatement<this_logger_t> statement(const char* fileName, const char* funcName, unsigned int line)
		{
			return detail::LogStatement<this_logger_t>(fileName, funcName, line);
		}

		template <LogLevel stmtLvl>
		static inline detail::LogMessage<stmtLvl, (maxLvl >= stmtLvl), detail::NullType> createMessage()
		{
			return detail::LogMessage<stmtLvl, (maxLvl >= stmtLvl), detail::NullType>();
		}

		template <LogLevel stmtLvl, class params_t>
		static inline void forward(const char*, const char*, unsigned int, const detail::LogMessage<stmtLvl, false, params_t>&) { }

		template <LogLevel stmtLvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<stmtLvl, true, params_t>& msg)
		{
			next_t::forward(fileName, funcName, line, msg);
		}
	};

	/**
	 * @brief Discards messages less severe than a level that can be changed at runtime
	 * @details The level has to be defined once per @p next_t in a translation unit.
	 */
	template <class next_t>
	class RuntimeFilteringLogger
	{
	public:
		template <LogLevel lvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<lvl, true, params_t>& msg)
		{
			if (lvl <= _minLvl)
				next_t::forward(fileName, funcName, line, msg);
		}

		static inline LogLevel level() TLCA_NOEXCEPT { return _minLvl; }
		static inline void level(LogLevel newLvl) TLCA_NOEXCEPT { _minLvl = newLvl; }

	private:
		static LogLevel _minLvl;
	};

	/**
	 * @brief Last logger of a chain, renders every message into a line and writes it
	 * @details The formatting policy implements
	 *          <pre>
	 *             template <class params_t>
	 *             static void format(std::ostream& os, const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const params_t& p);
	 *          </pre>
	 *          and streams the values with streamParams(). The write policy implements
	 *          <pre>
	 *             static void writeLine(const char* fileName, const char* funcName, unsigned int line, LogLevel lvl, const std::string& msg);
	 *          </pre>
	 *          and receives the line including its trailing newline.
	 */
	template <class formattingPolicy_t, class writePolicy_t>
	class LineWritingLogger
	{
	public:
		template <LogLevel lvl, class params_t>
		static inline void forward(const char*, const char*, unsigned int, const detail::LogMessage<lvl, false, params_t>&) { }

		template <LogLevel lvl, class params_t>
		static inline void forward(const char* fileName, const char* funcName, unsigned int line, const detail::LogMessage<lvl, true, params_t>& msg)
		{
			std::ostringstream oss;
			formattingPolicy_t::format(oss, fileName, funcName, line, lvl, msg.params);
			oss << "\n";
			writePolicy_t::writeLine(fileName, funcName, line, lvl, oss.str());
		}
	};

} // namespace log
} // namespace tlca

#endif  // TLCA_LOGGERBASE_HPP_

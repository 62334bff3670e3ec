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

#include "Logging.hpp"

#include <mutex>

#ifndef TLCA_LOGGING_DISABLE
	namespace
	{
		/**
		 * @brief Receiver of all log messages created in the libtlca library
		 */
		tlca::ILogReceiver* logReceiver = nullptr;

		/**
		 * @brief Serializes delivery to the receiver, messages may come from sampling threads
		 */
		std::mutex logMutex;
	}

	template <>
	tlca::LogLevel tlca::log::RuntimeFilteringLogger<tlca::log::GlobalLogger>::_minLvl = tlca::LogLevel::Warning;

	#ifdef __clang__
		template class tlca::log::RuntimeFilteringLogger<tlca::log::GlobalLogger>;
	#endif
#endif

namespace tlca
{

#ifdef TLCA_LOGGING_DISABLE

	void setLogReceiver(ILogReceiver* recv) { }
	void setLogLevel(LogLevel lvl) { }
	LogLevel getLogLevel() { return LogLevel::None; }

#else

	namespace log
	{
		void emitLog(const char* file, const char* func, const unsigned int line, LogLevel lvl, const char* message)
		{
			std::lock_guard<std::mutex> lock(logMutex);
			if (logReceiver)
				logReceiver->message(file, func, line, lvl, message);
		}
	}

	void setLogReceiver(ILogReceiver* recv)
	{
		std::lock_guard<std::mutex> lock(logMutex);
		logReceiver = recv;
	}

	void setLogLevel(LogLevel lvl)
	{
		tlca::log::RuntimeFilteringLogger<tlca::log::GlobalLogger>::level(lvl);
	}

	LogLevel getLogLevel()
	{
		return tlca::log::RuntimeFilteringLogger<tlca::log::GlobalLogger>::level();
	}

#endif

} // namespace tlca

extern "C"
{
	void tlcaSetLogReceiver(tlca::ILogReceiver* recv)
	{
		tlca::setLogReceiver(recv);
	}

	void tlcaSetLogLevel(unsigned int lvl)
	{
		tlca::setLogLevel(static_cast<tlca::LogLevel>(lvl));
	}
}

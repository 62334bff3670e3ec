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

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <tbb/global_control.h>
#include <tbb/task_arena.h>

#include "tlca/Logging.hpp"

#include <cstdlib>
#include <iostream>

namespace
{
	class TestLogReceiver : public tlca::ILogReceiver
	{
	public:
		virtual void message(const char* file, const char* func, unsigned int line, tlca::LogLevel lvl, const char* message)
		{
			std::clog << "  libtlca " << tlca::to_string(lvl) << " [" << func << ':' << line << "] " << message << std::flush;
		}
	};
}

int main(int argc, char* argv[])
{
	// Library log output is enabled by setting TLCATEST_LOGLEVEL, e.g., to Debug or 6
	TestLogReceiver receiver;
	const char* const logLevel = std::getenv("TLCATEST_LOGLEVEL");
	if (logLevel)
	{
		tlca::setLogReceiver(&receiver);
		tlca::setLogLevel(tlca::to_loglevel(logLevel));
	}

	int nThreads = tbb::this_task_arena::max_concurrency();

	Catch::Session session;
	session.cli(session.cli() | Catch::clara::Opt(nThreads, "number")["--tbbthreads"]("maximum number of TBB threads"));

	const int returnCode = session.applyCommandLine(argc, argv);
	if (returnCode != 0)
		return returnCode;

	tbb::global_control tbbGlobalControl(tbb::global_control::max_allowed_parallelism, (nThreads <= 0) ? tbb::this_task_arena::max_concurrency() : nThreads);

	const int result = session.run();
	tlca::setLogReceiver(nullptr);
	return result;
}

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

#include "SignalHandler.hpp"

#include <signal.h>

namespace
{
	volatile sig_atomic_t interrupts = 0;

	void onInterrupt(int sig)
	{
		++interrupts;
		if (interrupts > 1)
		{
			// Fall back to the default action and deliver the signal again
			signal(sig, SIG_DFL);
			raise(sig);
		}
	}

	bool installFor(int sig)
	{
		struct sigaction action;
		action.sa_handler = &onInterrupt;
		sigemptyset(&action.sa_mask);
		action.sa_flags = 0;
		return sigaction(sig, &action, nullptr) == 0;
	}
} // namespace

namespace tlca
{
	bool installInterruptHandler()
	{
		const bool intInstalled = installFor(SIGINT);
		const bool termInstalled = installFor(SIGTERM);
		return intInstalled && termInstalled;
	}

	bool interruptRequested()
	{
		return interrupts > 0;
	}

} // namespace tlca

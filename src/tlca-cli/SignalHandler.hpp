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
 * Interrupt handling for tlca-cli.
 */

#ifndef TLCACLI_SIGNALHANDLER_HPP_
#define TLCACLI_SIGNALHANDLER_HPP_

namespace tlca
{
	/**
	 * @brief   Installs handlers for SIGINT and SIGTERM
	 * @details The first signal requests a graceful stop, a Monte Carlo run then finishes
	 *          the samples in flight and writes partial results. The second signal
	 *          restores the default handler and terminates the process.
	 * @return  @c true if both handlers were installed, otherwise @c false
	 */
	bool installInterruptHandler();

	bool interruptRequested();

} // namespace tlca

#endif  // TLCACLI_SIGNALHANDLER_HPP_

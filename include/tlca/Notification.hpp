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
 * Defines interfaces for progress notification and cancellation.
 */

#ifndef LIBTLCA_NOTIFICATION_HPP_
#define LIBTLCA_NOTIFICATION_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <cstdint>

namespace tlca
{

/**
 * @brief Defines callback functions that are called from a MonteCarloPropagator
 * @details All functions are called from the thread that collects sample results,
 *          never concurrently.
 */
class TLCA_API INotificationCallback
{
public:
	virtual ~INotificationCallback() TLCA_NOEXCEPT { }

	/**
	 * @brief Called before the first sample is dispatched
	 * @param[in]  nSamples  Number of requested samples
	 */
	virtual void monteCarloStart(uint64_t nSamples) = 0;

	/**
	 * @brief Called after all dispatched samples have been collected
	 * @param[in]  cancelled  @c true if the run was stopped before all samples were dispatched
	 */
	virtual void monteCarloEnd(bool cancelled) = 0;

	/**
	 * @brief Called when a sample has been collected
	 * @param[in]  sampleIndex  Index of the sample
	 * @param[in]  success      @c true if the sample was solved, @c false if it failed
	 * @param[in]  nCollected   Number of samples collected so far
	 * @param[in]  nSamples     Number of requested samples
	 * @return @c true if the run should continue, otherwise @c false
	 */
	virtual bool sampleCompleted(uint64_t sampleIndex, bool success, uint64_t nCollected, uint64_t nSamples) = 0;
};

/**
 * @brief Observes the temporal graph traversal
 * @details Implementations abort the traversal by throwing an exception.
 */
class TLCA_API ITraversalMonitor
{
public:
	virtual ~ITraversalMonitor() TLCA_NOEXCEPT { }

	/**
	 * @brief Called before a frontier item is expanded
	 * @param[in]  numExpanded  Number of items expanded so far
	 */
	virtual void traversalStep(unsigned int numExpanded) = 0;
};

} // namespace tlca

#endif  // LIBTLCA_NOTIFICATION_HPP_

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
 * Provides a monitor that aborts a Monte Carlo sample when a given amount of
 * wall-clock time has been exceeded.
 */

#ifndef TLCA_TIMEOUT_MONITOR_HPP_
#define TLCA_TIMEOUT_MONITOR_HPP_
 
#include "common/Timer.hpp"
#include "tlca/Notification.hpp"
#include "tlca/Exceptions.hpp"

namespace tlca
{

	/**
	 * @brief Throws SampleTimeoutException once the sample has exceeded its budget
	 * @details A timeout of @c 0 or less disables the monitor.
	 */
	class TimeoutMonitor : public tlca::ITraversalMonitor
	{
	public:
		TimeoutMonitor(uint64_t sampleIndex, double timeout) : _sampleIndex(sampleIndex), _timeout(timeout)
		{
			_timer.start();
		}

		virtual ~TimeoutMonitor() TLCA_NOEXCEPT { }

		virtual void traversalStep(unsigned int) { check(); }

		inline void check() const
		{
			if ((_timeout > 0.0) && (_timer.elapsed() > _timeout))
				throw SampleTimeoutException(_sampleIndex, _timeout);
		}

	protected:
		Timer _timer;
		uint64_t _sampleIndex;
		double _timeout;
	};
}

#endif  // TLCA_TIMEOUT_MONITOR_HPP_

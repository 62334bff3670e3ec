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
 * Provides an accumulating timer for measuring execution time.
 */

#ifndef TLCA_TIMER_HPP_
#define TLCA_TIMER_HPP_

#include <chrono>

namespace tlca 
{

	/**
	 * @brief Base class for all timers
	 * @details Uses policy design pattern to inject the actual timer implementation. A valid
	 *          timer implementation has to provide the following functions:
	 *          <pre>
	 *              void start()
	 *              double stopCore() const
	 *          </pre>
	 * @tparam timer_t Actual timer implementation
	 */
	template <class timer_t>
	class BaseTimer : public timer_t
	{
	public:
		BaseTimer() : timer_t(), _totalElapsed(0.0) { }

		/**
		 * @brief Stops the currently running timer and returns the elapsed time
		 * @details Accumulates the total elapsed time over all start() and stop() calls.
		 * @return Elapsed time since the last call to start() in seconds
		 */
		inline double stop() 
		{
			const double elapsed = timer_t::stopCore();
			_totalElapsed += elapsed;

			return elapsed;
		}

		/**
		 * @brief Returns the elapsed time since the last call to start() without stopping
		 * @return Elapsed time in seconds
		 */
		inline double elapsed() const
		{
			return timer_t::stopCore();
		}

		inline double totalElapsedTime() const
		{
			return _totalElapsed;
		}

		inline double totalElapsedTimeMs() const
		{
			return _totalElapsed * 1000.0;
		}

	protected:
		double _totalElapsed;
	};

	/**
	 * @brief Monotonic timer based on std::chrono::steady_clock
	 */
	class SteadyTimer
	{
	public:
		SteadyTimer() : _startTime(std::chrono::steady_clock::now()) { }

		inline void start()
		{
			_startTime = std::chrono::steady_clock::now();
		}

	protected:

		inline double stopCore() const
		{
			return std::chrono::duration<double>(std::chrono::steady_clock::now() - _startTime).count();
		}

		std::chrono::steady_clock::time_point _startTime;
	};

	typedef BaseTimer<SteadyTimer> Timer;

} // namespace tlca

#endif  // TLCA_TIMER_HPP_

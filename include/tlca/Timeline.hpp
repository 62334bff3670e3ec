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
 * Defines the Timeline of biosphere emissions.
 */

#ifndef LIBTLCA_TIMELINE_HPP_
#define LIBTLCA_TIMELINE_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <map>
#include <string>
#include <vector>

namespace tlca
{

/**
 * @brief Amount of a flow emitted by an activity at a point in time
 * @details The time is given in years relative to the activation of the functional unit.
 */
struct TLCA_API TimelineEntry
{
	double time;
	std::string flow;
	std::string activity;
	double amount;
};

/**
 * @brief Time-ordered sequence of emissions
 * @details Entries are sorted by time, flow and activity. Entries of the same flow
 *          and activity whose times differ by less than TemporalDistribution::offsetTolerance
 *          are merged.
 */
class TLCA_API Timeline
{
public:
	typedef std::vector<TimelineEntry>::const_iterator const_iterator;

	Timeline() { }
	explicit Timeline(std::vector<TimelineEntry> entries);

	inline const std::vector<TimelineEntry>& entries() const TLCA_NOEXCEPT { return _entries; }
	inline std::size_t size() const TLCA_NOEXCEPT { return _entries.size(); }
	inline bool empty() const TLCA_NOEXCEPT { return _entries.empty(); }
	inline const TimelineEntry& operator[](std::size_t idx) const { return _entries[idx]; }

	inline const_iterator begin() const TLCA_NOEXCEPT { return _entries.begin(); }
	inline const_iterator end() const TLCA_NOEXCEPT { return _entries.end(); }

	/**
	 * @brief Total emitted amount per flow
	 */
	std::map<std::string, double> totalByFlow() const;

	/**
	 * @brief Total emitted amount of a single flow (0 if it never occurs)
	 */
	double total(const std::string& flow) const;

	/**
	 * @brief Returns the time of the first and last entry
	 * @details Both are 0 for an empty timeline.
	 */
	double firstTime() const TLCA_NOEXCEPT;
	double lastTime() const TLCA_NOEXCEPT;

private:
	std::vector<TimelineEntry> _entries;
};

} // namespace tlca

#endif  // LIBTLCA_TIMELINE_HPP_

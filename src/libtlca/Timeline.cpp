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

#include "tlca/Timeline.hpp"
#include "tlca/TemporalDistribution.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tlca
{

Timeline::Timeline(std::vector<TimelineEntry> entries)
{
	if (entries.empty())
		return;

	// Group by flow and activity to merge coinciding times
	std::sort(entries.begin(), entries.end(), [](const TimelineEntry& a, const TimelineEntry& b)
		{
			if (a.flow != b.flow)
				return a.flow < b.flow;
			if (a.activity != b.activity)
				return a.activity < b.activity;
			return a.time < b.time;
		});

	_entries.reserve(entries.size());
	_entries.push_back(std::move(entries.front()));
	for (std::size_t i = 1; i < entries.size(); ++i)
	{
		TimelineEntry& last = _entries.back();
		if ((entries[i].flow == last.flow) && (entries[i].activity == last.activity) && (std::abs(entries[i].time - last.time) < TemporalDistribution::offsetTolerance))
			last.amount += entries[i].amount;
		else
			_entries.push_back(std::move(entries[i]));
	}

	std::sort(_entries.begin(), _entries.end(), [](const TimelineEntry& a, const TimelineEntry& b)
		{
			if (a.time != b.time)
				return a.time < b.time;
			if (a.flow != b.flow)
				return a.flow < b.flow;
			return a.activity < b.activity;
		});
}

std::map<std::string, double> Timeline::totalByFlow() const
{
	std::map<std::string, double> totals;
	for (const TimelineEntry& e : _entries)
		totals[e.flow] += e.amount;
	return totals;
}

double Timeline::total(const std::string& flow) const
{
	double sum = 0.0;
	for (const TimelineEntry& e : _entries)
	{
		if (e.flow == flow)
			sum += e.amount;
	}
	return sum;
}

double Timeline::firstTime() const TLCA_NOEXCEPT
{
	return _entries.empty() ? 0.0 : _entries.front().time;
}

double Timeline::lastTime() const TLCA_NOEXCEPT
{
	return _entries.empty() ? 0.0 : _entries.back().time;
}

} // namespace tlca

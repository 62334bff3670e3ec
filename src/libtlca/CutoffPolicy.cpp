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

#include "tlca/TemporalLca.hpp"
#include "tlca/Exceptions.hpp"

#include <cmath>

namespace
{
	class RelativeCutoffPolicy : public tlca::ICutoffPolicy
	{
	public:
		explicit RelativeCutoffPolicy(double cutoff) : _cutoff(cutoff) { }

		virtual const char* name() const TLCA_NOEXCEPT { return "Relative"; }

		virtual bool cut(const tlca::TraversalItem& item) const
		{
			return item.contribution < _cutoff;
		}

	private:
		double _cutoff;
	};

	class DepthCutoffPolicy : public tlca::ICutoffPolicy
	{
	public:
		explicit DepthCutoffPolicy(unsigned int maxDepth) : _maxDepth(maxDepth) { }

		virtual const char* name() const TLCA_NOEXCEPT { return "Depth"; }

		virtual bool cut(const tlca::TraversalItem& item) const
		{
			return item.depth > _maxDepth;
		}

	private:
		unsigned int _maxDepth;
	};

	class HorizonCutoffPolicy : public tlca::ICutoffPolicy
	{
	public:
		explicit HorizonCutoffPolicy(double horizon) : _horizon(horizon) { }

		virtual const char* name() const TLCA_NOEXCEPT { return "Horizon"; }

		virtual bool cut(const tlca::TraversalItem& item) const
		{
			// Offsets are sorted, the branch is cut if it starts beyond the horizon
			const double start = item.timing.empty() ? 0.0 : item.timing.offset(0);
			return start > _horizon;
		}

	private:
		double _horizon;
	};
}

namespace tlca
{

const char* to_string(CutoffPolicyType type) TLCA_NOEXCEPT
{
	switch (type)
	{
		case CutoffPolicyType::Relative:
			return "relative";
		case CutoffPolicyType::Depth:
			return "depth";
		case CutoffPolicyType::Horizon:
			return "horizon";
	}
	return "unknown";
}

CutoffPolicyType toCutoffPolicyType(const std::string& name)
{
	if (name == "relative")
		return CutoffPolicyType::Relative;
	else if (name == "depth")
		return CutoffPolicyType::Depth;
	else if (name == "horizon")
		return CutoffPolicyType::Horizon;

	throw InvalidParameterException("Unknown cutoff policy '" + name + "' (expected relative, depth, or horizon)");
}

void TraversalOptions::validate() const
{
	if (!std::isfinite(cutoff) || (cutoff < 0.0) || (cutoff >= 1.0))
		throw InvalidParameterException("Cutoff has to be in [0, 1), got " + std::to_string(cutoff));
	if (!std::isfinite(timeHorizon))
		throw InvalidParameterException("Time horizon has to be finite");
	if (maxCalc == 0)
		throw InvalidParameterException("Maximum number of expanded items (MAX_CALC) has to be positive");
	if (!std::isfinite(massBalanceTolerance) || (massBalanceTolerance <= 0.0))
		throw InvalidParameterException("Mass balance tolerance has to be positive, got " + std::to_string(massBalanceTolerance));
}

std::shared_ptr<const ICutoffPolicy> createCutoffPolicy(const TraversalOptions& opts)
{
	switch (opts.policy)
	{
		case CutoffPolicyType::Relative:
			return std::make_shared<RelativeCutoffPolicy>(opts.cutoff);
		case CutoffPolicyType::Depth:
			return std::make_shared<DepthCutoffPolicy>(opts.maxDepth);
		case CutoffPolicyType::Horizon:
			return std::make_shared<HorizonCutoffPolicy>(opts.timeHorizon);
	}
	throw InvalidParameterException("Unknown cutoff policy");
}

} // namespace tlca

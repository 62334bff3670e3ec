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

#include "tlca/Uncertainty.hpp"
#include "tlca/Exceptions.hpp"

#include <cmath>
#include <sstream>

namespace
{
	inline double lognormalMu(const tlca::UncertaintySpec& spec, double amount)
	{
		return std::isnan(spec.loc) ? std::log(std::abs(amount)) : spec.loc;
	}

	inline double locOrAmount(const tlca::UncertaintySpec& spec, double amount)
	{
		return std::isnan(spec.loc) ? amount : spec.loc;
	}

	inline bool isPositiveFinite(double v)
	{
		return std::isfinite(v) && (v > 0.0);
	}
}

namespace tlca
{

const char* to_string(UncertaintyType type) TLCA_NOEXCEPT
{
	switch (type)
	{
		case UncertaintyType::Undefined:
			return "undefined";
		case UncertaintyType::None:
			return "none";
		case UncertaintyType::Lognormal:
			return "lognormal";
		case UncertaintyType::Normal:
			return "normal";
		case UncertaintyType::Uniform:
			return "uniform";
		case UncertaintyType::Triangular:
			return "triangular";
	}
	return "unknown";
}

UncertaintyType toUncertaintyType(const std::string& name)
{
	if ((name == "undefined") || (name == "0"))
		return UncertaintyType::Undefined;
	else if ((name == "none") || (name == "1"))
		return UncertaintyType::None;
	else if ((name == "lognormal") || (name == "2"))
		return UncertaintyType::Lognormal;
	else if ((name == "normal") || (name == "3"))
		return UncertaintyType::Normal;
	else if ((name == "uniform") || (name == "4"))
		return UncertaintyType::Uniform;
	else if ((name == "triangular") || (name == "5"))
		return UncertaintyType::Triangular;

	throw InvalidParameterException("Unknown uncertainty type '" + name + "'");
}

UncertaintySpec UncertaintySpec::lognormal(double sigma)
{
	UncertaintySpec spec;
	spec.type = UncertaintyType::Lognormal;
	spec.scale = sigma;
	return spec;
}

UncertaintySpec UncertaintySpec::normal(double stdDev)
{
	UncertaintySpec spec;
	spec.type = UncertaintyType::Normal;
	spec.scale = stdDev;
	return spec;
}

UncertaintySpec UncertaintySpec::uniform(double minimum, double maximum)
{
	UncertaintySpec spec;
	spec.type = UncertaintyType::Uniform;
	spec.minimum = minimum;
	spec.maximum = maximum;
	return spec;
}

UncertaintySpec UncertaintySpec::triangular(double minimum, double maximum)
{
	UncertaintySpec spec;
	spec.type = UncertaintyType::Triangular;
	spec.minimum = minimum;
	spec.maximum = maximum;
	return spec;
}

void validateUncertainty(const UncertaintySpec& spec, double amount, const std::string& context)
{
	std::ostringstream oss;
	switch (spec.type)
	{
		case UncertaintyType::Undefined:
		case UncertaintyType::None:
			return;
		case UncertaintyType::Lognormal:
			if (std::isnan(spec.loc) && (amount == 0.0))
				oss << "lognormal distribution requires a non-zero amount or an explicit location";
			else if (!std::isfinite(lognormalMu(spec, amount)))
				oss << "lognormal location is not finite";
			else if (!isPositiveFinite(spec.scale))
				oss << "lognormal scale must be positive, got " << spec.scale;
			break;
		case UncertaintyType::Normal:
			if (!std::isfinite(locOrAmount(spec, amount)))
				oss << "normal location is not finite";
			else if (!isPositiveFinite(spec.scale))
				oss << "normal scale must be positive, got " << spec.scale;
			break;
		case UncertaintyType::Uniform:
			if (!std::isfinite(spec.minimum) || !std::isfinite(spec.maximum) || !(spec.minimum < spec.maximum))
				oss << "uniform distribution requires finite minimum < maximum, got [" << spec.minimum << ", " << spec.maximum << "]";
			break;
		case UncertaintyType::Triangular:
		{
			const double mode = locOrAmount(spec, amount);
			if (!std::isfinite(spec.minimum) || !std::isfinite(spec.maximum) || !(spec.minimum < spec.maximum))
				oss << "triangular distribution requires finite minimum < maximum, got [" << spec.minimum << ", " << spec.maximum << "]";
			else if (!(mode >= spec.minimum) || !(mode <= spec.maximum))
				oss << "triangular mode " << mode << " lies outside [" << spec.minimum << ", " << spec.maximum << "]";
			break;
		}
	}

	const std::string msg = oss.str();
	if (!msg.empty())
		throw InvalidParameterException("Invalid uncertainty of " + context + ": " + msg);
}

double sampleAmount(const UncertaintySpec& spec, double amount, std::mt19937_64& rng)
{
	switch (spec.type)
	{
		case UncertaintyType::Undefined:
		case UncertaintyType::None:
			return amount;
		case UncertaintyType::Lognormal:
		{
			std::lognormal_distribution<double> dist(lognormalMu(spec, amount), spec.scale);
			const double value = dist(rng);
			return (amount < 0.0) ? -value : value;
		}
		case UncertaintyType::Normal:
		{
			std::normal_distribution<double> dist(locOrAmount(spec, amount), spec.scale);
			return dist(rng);
		}
		case UncertaintyType::Uniform:
		{
			std::uniform_real_distribution<double> dist(spec.minimum, spec.maximum);
			return dist(rng);
		}
		case UncertaintyType::Triangular:
		{
			// Inverse transform, valid for a mode on either bound
			const double a = spec.minimum;
			const double b = spec.maximum;
			const double c = locOrAmount(spec, amount);
			std::uniform_real_distribution<double> dist(0.0, 1.0);
			const double u = dist(rng);
			if (u < (c - a) / (b - a))
				return a + std::sqrt(u * (b - a) * (c - a));
			return b - std::sqrt((1.0 - u) * (b - a) * (b - c));
		}
	}
	return amount;
}

double expectedAmount(const UncertaintySpec& spec, double amount)
{
	switch (spec.type)
	{
		case UncertaintyType::Undefined:
		case UncertaintyType::None:
			return amount;
		case UncertaintyType::Lognormal:
		{
			const double value = std::exp(lognormalMu(spec, amount) + 0.5 * spec.scale * spec.scale);
			return (amount < 0.0) ? -value : value;
		}
		case UncertaintyType::Normal:
			return locOrAmount(spec, amount);
		case UncertaintyType::Uniform:
			return 0.5 * (spec.minimum + spec.maximum);
		case UncertaintyType::Triangular:
			return (spec.minimum + locOrAmount(spec, amount) + spec.maximum) / 3.0;
	}
	return amount;
}

} // namespace tlca

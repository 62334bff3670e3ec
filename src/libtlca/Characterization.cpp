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

#include "tlca/Characterization.hpp"
#include "tlca/Timeline.hpp"
#include "tlca/StaticLca.hpp"
#include "tlca/Exceptions.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>
#include <utility>

namespace
{
	const double massAtmosphere = 5.1352e18; //!< kg
	const double molarMassAir = 28.97; //!< g/mol

	// Converts W/m^2/ppb into W/m^2/kg
	inline double perKg(double radiativeEfficiencyPpb, double molarMass)
	{
		return radiativeEfficiencyPpb * (molarMassAir / molarMass) * 1e9 / massAtmosphere;
	}

	// Bern carbon cycle model
	const double co2A0 = 0.2173;
	const double co2A[] = {0.2240, 0.2824, 0.2763};
	const double co2Tau[] = {394.4, 36.54, 4.304};

	// Legacy ecoinvent 3.5 biosphere flows and their current ids
	const char* const ecoinventMigration[][2] = {
		{"9c2a7dc9-8b1f-46ba-bc16-0d761a4f6016", "90f722bf-cb9b-571a-88fc-34286632bdc4"}, // Ethene
		{"c941d6d0-a56c-4e6c-95de-ac685635218d", "c9a8073a-8a19-5b9b-a120-7d549563b67b"}, // Hydrogen chloride
		{"b53d3744-3629-4219-be20-980865e54031", "5f7aad3d-566c-4d0d-ad59-e765f971aa0f"}, // Methane (air, urban)
		{"43b2649e-26f8-400d-bc0a-a0667e850915", "0d218f74-181d-49b6-978c-8af836611102"}, // Gangue, bauxite
		{"d07867e3-66a8-4454-babd-78dc7f9a21f8", "91d68678-7ed7-417a-86a7-a486c7b8a973"}, // Carfentrazone ethyl ester
		{"66a6dad0-e450-4206-88e1-f823a04f8b1d", "a058168e-9a1e-5126-80b6-2d202e746835"}, // Haloxyfop-(R) methylester
		{"f9c73aca-3d5c-4072-81dd-b8e0643530a6", "9ae11925-3df9-5fde-b7af-1627c0818347"}, // Quizalofop ethyl ester
		{"e3043a7f-5347-4c7b-89ee-93f11b2f6d9b", "33fd8342-58e7-45c9-ad92-0951c002c403"}, // Iron (water, ground-)
		{"e030108f-2125-4bcb-a73b-ad72130fcca3", "56815b4f-6138-4e0b-9fac-c94fd6b102b3"}, // Nickel, ion
		{"a07b8a8c-8cab-4656-a82f-310e8069e323", "c21a1397-82dc-427a-a6cb-c790ba2626f4"}, // Potassium, ion
		{"b8c794de-ac20-47f6-ae87-84d91e95da93", "31eacbfc-683a-4d36-afc1-80dee42a3b94"}  // Sulfate, ion
	};

	struct ResolvedEntry
	{
		double time;
		double amount;
		const tlca::ICharacterizationKernel* kernel;
	};

	std::vector<ResolvedEntry> resolveEntries(const tlca::Timeline& timeline, const tlca::CharacterizationMethod& method)
	{
		std::vector<ResolvedEntry> resolved;
		resolved.reserve(timeline.size());
		for (const tlca::TimelineEntry& e : timeline)
		{
			if (!method.includes(e.flow))
				continue;

			resolved.push_back(ResolvedEntry{e.time, e.amount, &method.kernel(e.flow)});
		}
		return resolved;
	}
}

namespace tlca
{

double Co2Kernel::radiativeEfficiency() TLCA_NOEXCEPT
{
	return perKg(radiativeEfficiencyPpb, molarMass);
}

double Co2Kernel::cumulative(double elapsed) const
{
	if (elapsed <= 0.0)
		return 0.0;

	double integral = co2A0 * elapsed;
	for (int i = 0; i < 3; ++i)
		integral += co2A[i] * co2Tau[i] * (1.0 - std::exp(-elapsed / co2Tau[i]));

	return radiativeEfficiency() * integral;
}

double Ch4Kernel::radiativeEfficiency() TLCA_NOEXCEPT
{
	return perKg(radiativeEfficiencyPpb, molarMass);
}

double Ch4Kernel::cumulative(double elapsed) const
{
	if (elapsed <= 0.0)
		return 0.0;

	return radiativeEfficiency() * lifetime * (1.0 - std::exp(-elapsed / lifetime));
}

DecayKernel::DecayKernel(double factor, double rate) : _factor(factor), _rate(rate)
{
	if (!std::isfinite(factor))
		throw InvalidParameterException("Factor of decay kernel has to be finite");
	if (!std::isfinite(rate) || (rate <= 0.0))
		throw InvalidParameterException("Rate of decay kernel has to be positive, got " + std::to_string(rate));
}

double DecayKernel::cumulative(double elapsed) const
{
	if (elapsed <= 0.0)
		return 0.0;

	return _factor * (1.0 - std::exp(-_rate * elapsed));
}

PulseKernel::PulseKernel(double factor) : _factor(factor)
{
	if (!std::isfinite(factor))
		throw InvalidParameterException("Factor of pulse kernel has to be finite");
}

double PulseKernel::cumulative(double elapsed) const
{
	if (elapsed < 0.0)
		return 0.0;

	return _factor;
}

std::shared_ptr<const ICharacterizationKernel> createKernel(const std::string& name, double factor, double rate)
{
	if (name == "co2")
		return std::make_shared<Co2Kernel>();
	else if (name == "ch4")
		return std::make_shared<Ch4Kernel>();
	else if (name == "decay")
		return std::make_shared<DecayKernel>(factor, rate);
	else if (name == "pulse")
		return std::make_shared<PulseKernel>(factor);

	throw InvalidParameterException("Unknown characterization kernel '" + name + "' (expected co2, ch4, decay, or pulse)");
}

CharacterizationMethod::CharacterizationMethod() : _horizon(100.0), _startYear(2024) { }

CharacterizationMethod::CharacterizationMethod(double horizon, int startYear) : _horizon(100.0), _startYear(startYear)
{
	this->horizon(horizon);
}

CharacterizationMethod CharacterizationMethod::climateChange(double horizon, int startYear)
{
	CharacterizationMethod method(horizon, startYear);

	const std::shared_ptr<const ICharacterizationKernel> co2 = std::make_shared<Co2Kernel>();
	method.addKernel("Carbon dioxide, fossil", co2);
	method.addKernel("Carbon dioxide, non-fossil", co2);
	method.addKernel("Methane, fossil", std::make_shared<Ch4Kernel>());

	method.setStaticFactor("Carbon dioxide, fossil", 1.0);
	method.setStaticFactor("Carbon dioxide, non-fossil", 1.0);
	method.setStaticFactor("Methane, fossil", 29.8);

	method.restrictTo({"Carbon dioxide, fossil", "Carbon dioxide, non-fossil", "Methane, fossil"});
	return method;
}

void CharacterizationMethod::horizon(double horizon)
{
	if (!std::isfinite(horizon) || (horizon <= 0.0))
		throw InvalidParameterException("Characterization horizon has to be positive, got " + std::to_string(horizon));

	_horizon = horizon;
}

void CharacterizationMethod::addKernel(const std::string& flow, std::shared_ptr<const ICharacterizationKernel> kernel)
{
	if (!kernel)
		throw InvalidParameterException("Kernel of flow '" + flow + "' must not be empty");

	_kernels[flow] = std::move(kernel);
}

void CharacterizationMethod::setStaticFactor(const std::string& flow, double factor)
{
	if (!std::isfinite(factor))
		throw InvalidParameterException("Static factor of flow '" + flow + "' is not finite");

	_staticFactors[flow] = factor;
}

void CharacterizationMethod::addRemapping(const std::string& from, const std::string& to)
{
	if (from == to)
		throw InvalidParameterException("Flow '" + from + "' cannot be remapped to itself");

	_remap[from] = to;
	_reverseRemap[to] = from;
}

void CharacterizationMethod::addEcoinventMigration()
{
	for (const auto& pair : ecoinventMigration)
		addRemapping(pair[0], pair[1]);
}

void CharacterizationMethod::restrictTo(std::set<std::string> flows)
{
	_subset = std::move(flows);
}

const std::string* CharacterizationMethod::remapped(const std::string& flow) const
{
	const std::map<std::string, std::string>::const_iterator it = _remap.find(flow);
	if (it == _remap.end())
		return nullptr;
	return &it->second;
}

bool CharacterizationMethod::includes(const std::string& flow) const
{
	if (_subset.empty() || (_subset.count(flow) > 0))
		return true;

	const std::string* const target = remapped(flow);
	return target && (_subset.count(*target) > 0);
}

const ICharacterizationKernel* CharacterizationMethod::findKernel(const std::string& flow) const
{
	std::map<std::string, std::shared_ptr<const ICharacterizationKernel>>::const_iterator it = _kernels.find(flow);
	if (it != _kernels.end())
		return it->second.get();

	const std::string* const target = remapped(flow);
	if (!target)
		return nullptr;

	it = _kernels.find(*target);
	if (it != _kernels.end())
		return it->second.get();

	return nullptr;
}

const ICharacterizationKernel& CharacterizationMethod::kernel(const std::string& flow) const
{
	const ICharacterizationKernel* const k = findKernel(flow);
	if (!k)
		throw UnresolvedFlowException(flow);
	return *k;
}

std::string CharacterizationMethod::resolveFlow(const std::string& flow) const
{
	if (_kernels.count(flow) > 0)
		return flow;

	const std::string* const target = remapped(flow);
	if (target && (_kernels.count(*target) > 0))
		return *target;

	throw UnresolvedFlowException(flow);
}

std::string CharacterizationMethod::originalFlow(const std::string& flow) const
{
	const std::map<std::string, std::string>::const_iterator it = _reverseRemap.find(flow);
	if (it == _reverseRemap.end())
		return flow;
	return it->second;
}

bool CharacterizationMethod::hasStaticFactor(const std::string& flow) const
{
	if (_staticFactors.count(flow) > 0)
		return true;

	const std::string* const target = remapped(flow);
	return target && (_staticFactors.count(*target) > 0);
}

double CharacterizationMethod::staticFactor(const std::string& flow) const
{
	std::map<std::string, double>::const_iterator it = _staticFactors.find(flow);
	if (it != _staticFactors.end())
		return it->second;

	const std::string* const target = remapped(flow);
	if (target)
	{
		it = _staticFactors.find(*target);
		if (it != _staticFactors.end())
			return it->second;
	}
	return 0.0;
}

double CharacterizationMethod::finestResolution() const TLCA_NOEXCEPT
{
	double res = 1.0;
	bool first = true;
	for (const std::pair<const std::string, std::shared_ptr<const ICharacterizationKernel>>& k : _kernels)
	{
		if (first || (k.second->resolution() < res))
			res = k.second->resolution();
		first = false;
	}
	return res;
}

ImpactCurve characterize(const Timeline& timeline, const CharacterizationMethod& method)
{
	double first = 0.0;
	double last = 0.0;
	bool found = false;
	for (const TimelineEntry& e : timeline)
	{
		if (!method.includes(e.flow))
			continue;

		if (!found)
		{
			first = e.time;
			last = e.time;
			found = true;
		}
		first = std::min(first, e.time);
		last = std::max(last, e.time);
	}

	return characterize(timeline, method, std::floor(first), last + method.horizon());
}

ImpactCurve characterize(const Timeline& timeline, const CharacterizationMethod& method, double start, double end)
{
	if (!std::isfinite(start) || !std::isfinite(end) || (end < start))
		throw InvalidParameterException("Invalid characterization interval [" + std::to_string(start) + ", " + std::to_string(end) + "]");

	const std::vector<ResolvedEntry> entries = resolveEntries(timeline, method);
	const double res = method.finestResolution();
	const double horizon = method.horizon();

	ImpactCurve curve;
	const std::size_t nPoints = static_cast<std::size_t>(std::floor((end - start) / res + 1e-9)) + 1;
	curve.times.reserve(nPoints + 1);
	for (std::size_t i = 0; i < nPoints; ++i)
		curve.times.push_back(start + static_cast<double>(i) * res);
	if (curve.times.back() < end - 1e-9)
		curve.times.push_back(end);

	curve.values.resize(curve.times.size(), 0.0);
	for (std::size_t i = 0; i < curve.times.size(); ++i)
	{
		const double t = curve.times[i];
		double value = 0.0;
		for (const ResolvedEntry& e : entries)
		{
			if (t >= e.time)
				value += e.amount * e.kernel->cumulative(std::min(t - e.time, horizon));
		}
		curve.values[i] = value;
	}

	LOG(Debug) << "Characterized " << entries.size() << " emissions on " << curve.times.size() << " time points, final value " << curve.finalValue();
	return curve;
}

std::vector<AnnualImpact> annualImpacts(const Timeline& timeline, const CharacterizationMethod& method)
{
	const double horizon = method.horizon();
	const int nYears = static_cast<int>(std::ceil(horizon));

	std::map<std::tuple<int, std::string, std::string>, double> rows;
	for (const TimelineEntry& e : timeline)
	{
		if (!method.includes(e.flow))
			continue;

		const ICharacterizationKernel& k = method.kernel(e.flow);
		double prev = 0.0;
		for (int y = 0; y < nYears; ++y)
		{
			const double next = k.cumulative(std::min(static_cast<double>(y + 1), horizon));
			const int year = method.startYear() + static_cast<int>(std::floor(e.time + y));
			rows[std::make_tuple(year, e.flow, e.activity)] += e.amount * (next - prev);
			prev = next;
		}
	}

	std::vector<AnnualImpact> result;
	result.reserve(rows.size());
	for (const std::pair<const std::tuple<int, std::string, std::string>, double>& r : rows)
		result.push_back(AnnualImpact{std::get<0>(r.first), std::get<1>(r.first), std::get<2>(r.first), r.second});

	return result;
}

double staticScore(const LcaResult& result, const CharacterizationMethod& method)
{
	double score = 0.0;
	for (std::size_t k = 0; k < result.flows().size(); ++k)
	{
		const std::string& flow = result.flows()[k];
		if (!method.hasStaticFactor(flow))
		{
			LOG(Debug) << "No static characterization factor for flow " << flow << ", skipped";
			continue;
		}

		score += method.staticFactor(flow) * result.inventory()[k];
	}
	return score;
}

} // namespace tlca

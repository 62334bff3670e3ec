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
 * Dynamic and static characterization of emissions.
 */

#ifndef LIBTLCA_CHARACTERIZATION_HPP_
#define LIBTLCA_CHARACTERIZATION_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tlca
{

class Timeline;
class LcaResult;

/**
 * @brief Time response of a unit emission
 */
class TLCA_API ICharacterizationKernel
{
public:
	virtual ~ICharacterizationKernel() TLCA_NOEXCEPT { }

	virtual const char* name() const TLCA_NOEXCEPT = 0;

	/**
	 * @brief Cumulative impact of one unit emitted @p elapsed years ago
	 * @details Returns 0 for negative @p elapsed.
	 */
	virtual double cumulative(double elapsed) const = 0;

	/**
	 * @brief Native time resolution in years
	 */
	virtual double resolution() const TLCA_NOEXCEPT = 0;
};

/**
 * @brief Absolute global warming potential of carbon dioxide
 * @details Integrated radiative forcing (W/m^2 yr per kg) of the Bern carbon cycle
 *          impulse response function with IPCC AR5 parameters.
 */
class TLCA_API Co2Kernel : public ICharacterizationKernel
{
public:
	static TLCA_CONSTEXPR double radiativeEfficiencyPpb = 1.33e-5; //!< W/m^2/ppb
	static TLCA_CONSTEXPR double molarMass = 44.01; //!< g/mol

	virtual const char* name() const TLCA_NOEXCEPT { return "co2"; }
	virtual double cumulative(double elapsed) const;
	virtual double resolution() const TLCA_NOEXCEPT { return 1.0; }

	/**
	 * @brief Radiative efficiency in W/m^2/kg
	 */
	static double radiativeEfficiency() TLCA_NOEXCEPT;
};

/**
 * @brief Absolute global warming potential of methane
 * @details Single exponential decay with the IPCC AR6 perturbation lifetime, the
 *          radiative efficiency includes indirect effects.
 */
class TLCA_API Ch4Kernel : public ICharacterizationKernel
{
public:
	static TLCA_CONSTEXPR double radiativeEfficiencyPpb = 5.7e-4; //!< W/m^2/ppb
	static TLCA_CONSTEXPR double molarMass = 16.04; //!< g/mol
	static TLCA_CONSTEXPR double lifetime = 11.8; //!< years

	virtual const char* name() const TLCA_NOEXCEPT { return "ch4"; }
	virtual double cumulative(double elapsed) const;
	virtual double resolution() const TLCA_NOEXCEPT { return 1.0; }

	static double radiativeEfficiency() TLCA_NOEXCEPT;
};

/**
 * @brief Impact that approaches @p factor exponentially with rate @p rate
 */
class TLCA_API DecayKernel : public ICharacterizationKernel
{
public:
	DecayKernel(double factor, double rate);

	virtual const char* name() const TLCA_NOEXCEPT { return "decay"; }
	virtual double cumulative(double elapsed) const;
	virtual double resolution() const TLCA_NOEXCEPT { return 1.0; }

private:
	double _factor;
	double _rate;
};

/**
 * @brief Impact of @p factor that occurs entirely at emission
 */
class TLCA_API PulseKernel : public ICharacterizationKernel
{
public:
	explicit PulseKernel(double factor);

	virtual const char* name() const TLCA_NOEXCEPT { return "pulse"; }
	virtual double cumulative(double elapsed) const;
	virtual double resolution() const TLCA_NOEXCEPT { return 1.0; }

private:
	double _factor;
};

/**
 * @brief Creates a kernel by name (@c co2, @c ch4, @c decay, or @c pulse)
 * @details @p factor is used by @c decay and @c pulse, @p rate by @c decay.
 *          Throws InvalidParameterException for unknown names.
 */
TLCA_API std::shared_ptr<const ICharacterizationKernel> createKernel(const std::string& name, double factor = 1.0, double rate = 0.0);

/**
 * @brief Characterization kernels and static factors per flow
 * @details Flows are looked up by their id first, then by their remapped id. An optional
 *          subset restricts the flows that are characterized, all other flows are skipped.
 */
class TLCA_API CharacterizationMethod
{
public:
	CharacterizationMethod();
	CharacterizationMethod(double horizon, int startYear);

	/**
	 * @brief Creates the default climate change method
	 * @details Fossil and non-fossil carbon dioxide use Co2Kernel, fossil methane uses
	 *          Ch4Kernel. Static factors are the GWP100 values (1 and 29.8). The method
	 *          is restricted to these three flows.
	 */
	static CharacterizationMethod climateChange(double horizon = 100.0, int startYear = 2024);

	void addKernel(const std::string& flow, std::shared_ptr<const ICharacterizationKernel> kernel);
	void setStaticFactor(const std::string& flow, double factor);

	/**
	 * @brief Adds a migration of flow id @p from to flow id @p to
	 */
	void addRemapping(const std::string& from, const std::string& to);

	/**
	 * @brief Adds the migration of legacy ecoinvent 3.5 biosphere flow ids
	 */
	void addEcoinventMigration();

	/**
	 * @brief Restricts characterization to the given flows (empty for all flows)
	 */
	void restrictTo(std::set<std::string> flows);

	inline double horizon() const TLCA_NOEXCEPT { return _horizon; }
	inline int startYear() const TLCA_NOEXCEPT { return _startYear; }
	void horizon(double horizon);
	inline void startYear(int year) TLCA_NOEXCEPT { _startYear = year; }

	/**
	 * @brief Returns whether @p flow is part of the characterized subset
	 */
	bool includes(const std::string& flow) const;

	/**
	 * @brief Returns the id under which @p flow has a kernel
	 * @details Throws UnresolvedFlowException if neither the id nor its remapped id has a kernel.
	 */
	std::string resolveFlow(const std::string& flow) const;

	/**
	 * @brief Returns the id @p flow was migrated from, or @p flow itself
	 */
	std::string originalFlow(const std::string& flow) const;

	/**
	 * @brief Returns the kernel of a flow, or @c nullptr if it cannot be resolved
	 */
	const ICharacterizationKernel* findKernel(const std::string& flow) const;

	/**
	 * @brief Returns the kernel of a flow, throws UnresolvedFlowException if it cannot be resolved
	 */
	const ICharacterizationKernel& kernel(const std::string& flow) const;

	/**
	 * @brief Returns whether a static factor exists for a flow (or its remapped id)
	 */
	bool hasStaticFactor(const std::string& flow) const;

	/**
	 * @brief Returns the static factor of a flow (or its remapped id), 0 if there is none
	 */
	double staticFactor(const std::string& flow) const;

	/**
	 * @brief Smallest resolution of all kernels (1 year if there are none)
	 */
	double finestResolution() const TLCA_NOEXCEPT;

	inline const std::map<std::string, std::shared_ptr<const ICharacterizationKernel>>& kernels() const TLCA_NOEXCEPT { return _kernels; }
	inline const std::map<std::string, std::string>& remapping() const TLCA_NOEXCEPT { return _remap; }

private:
	const std::string* remapped(const std::string& flow) const;

	double _horizon;
	int _startYear;
	std::map<std::string, std::shared_ptr<const ICharacterizationKernel>> _kernels;
	std::map<std::string, double> _staticFactors;
	std::map<std::string, std::string> _remap;
	std::map<std::string, std::string> _reverseRemap;
	std::set<std::string> _subset;
};

/**
 * @brief Cumulative impact sampled on a time grid
 */
struct TLCA_API ImpactCurve
{
	std::vector<double> times;
	std::vector<double> values;

	inline double finalValue() const TLCA_NOEXCEPT { return values.empty() ? 0.0 : values.back(); }
};

/**
 * @brief Impact of one calendar year
 */
struct TLCA_API AnnualImpact
{
	int year;
	std::string flow;
	std::string activity;
	double impact;
};

/**
 * @brief Convolves a timeline with the kernels of a method
 * @details The curve is sampled from the floor of the first emission time to the last
 *          emission time plus the horizon at the finest kernel resolution. Each emission
 *          contributes @f$ a K(\min(T - t_e, H)) @f$ for @f$ T \geq t_e @f$.
 *          Throws UnresolvedFlowException for included flows without kernel.
 * @param [in] timeline Emission timeline
 * @param [in] method Characterization method
 * @return Cumulative impact curve
 */
TLCA_API ImpactCurve characterize(const Timeline& timeline, const CharacterizationMethod& method);

/**
 * @brief Convolves a timeline with the kernels of a method on the grid [@p start, @p end]
 */
TLCA_API ImpactCurve characterize(const Timeline& timeline, const CharacterizationMethod& method, double start, double end);

/**
 * @brief Characterized impact per calendar year, flow, and activity
 * @details Year @c k after an emission at @f$ t_e @f$ receives the increment
 *          @f$ a (K(\min(k+1, H)) - K(k)) @f$ and is attributed to the calendar year
 *          @f$ Y_0 + \lfloor t_e + k \rfloor @f$. Rows are sorted by year, flow, and activity.
 *          The increments sum to the impact at the end of the full characterization period.
 */
TLCA_API std::vector<AnnualImpact> annualImpacts(const Timeline& timeline, const CharacterizationMethod& method);

/**
 * @brief Static impact score @f$ \sum_k CF_k g_k @f$
 * @details Flows without static factor do not contribute.
 */
TLCA_API double staticScore(const LcaResult& result, const CharacterizationMethod& method);

} // namespace tlca

#endif  // LIBTLCA_CHARACTERIZATION_HPP_

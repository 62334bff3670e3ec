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

#include "tlca/Configuration.hpp"
#include "tlca/ParameterProvider.hpp"
#include "tlca/Exceptions.hpp"
#include "ParamScopes.hpp"
#include "Logging.hpp"

#include <unordered_map>
#include <utility>

namespace
{
	double readOptionalDouble(tlca::IParameterProvider& paramProvider, const std::string& name, double defaultValue)
	{
		if (paramProvider.exists(name))
			return paramProvider.getDouble(name);
		return defaultValue;
	}

	unsigned int readCount(tlca::IParameterProvider& paramProvider, const std::string& name)
	{
		const int n = paramProvider.getInt(name);
		if (n < 0)
			throw tlca::InvalidParameterException(name + " must not be negative");
		return static_cast<unsigned int>(n);
	}

	tlca::TemporalDistribution readTemporalDistribution(tlca::IParameterProvider& paramProvider, const std::string& context)
	{
		if (paramProvider.exists("TEMPORAL_OFFSETS") || paramProvider.exists("TEMPORAL_FRACTIONS"))
		{
			const std::vector<double> offsets = paramProvider.getDoubleArray("TEMPORAL_OFFSETS");
			const std::vector<double> fractions = paramProvider.getDoubleArray("TEMPORAL_FRACTIONS");
			try
			{
				return tlca::TemporalDistribution(offsets, fractions);
			}
			catch (const tlca::InvalidTemporalDistributionException& e)
			{
				throw tlca::InvalidTemporalDistributionException(context + ": " + e.what());
			}
		}

		if (!paramProvider.exists("TEMPORAL_PROFILE"))
			return tlca::TemporalDistribution();

		const std::string profile = paramProvider.getString("TEMPORAL_PROFILE");
		if (profile == "immediate")
			return tlca::TemporalDistribution::immediate();
		else if (profile == "exponential_decay")
		{
			const double rate = paramProvider.getDouble("DECAY_RATE");
			return tlca::TemporalDistribution::exponentialDecay(rate, readCount(paramProvider, "PERIOD"));
		}
		else if (profile == "uniform")
		{
			const double start = readOptionalDouble(paramProvider, "START", 0.0);
			const double end = paramProvider.getDouble("END");
			return tlca::TemporalDistribution::uniform(start, end, readCount(paramProvider, "STEPS"));
		}

		throw tlca::InvalidParameterException("Unknown TEMPORAL_PROFILE '" + profile + "' of " + context + " (expected immediate, exponential_decay, or uniform)");
	}

	tlca::UncertaintySpec readUncertainty(tlca::IParameterProvider& paramProvider)
	{
		tlca::UncertaintySpec spec;
		if (!paramProvider.exists("UNCERTAINTY_TYPE"))
			return spec;

		spec.type = tlca::toUncertaintyType(paramProvider.getString("UNCERTAINTY_TYPE"));
		spec.loc = readOptionalDouble(paramProvider, "UNCERTAINTY_LOC", spec.loc);
		spec.scale = readOptionalDouble(paramProvider, "UNCERTAINTY_SCALE", spec.scale);
		spec.shape = readOptionalDouble(paramProvider, "UNCERTAINTY_SHAPE", spec.shape);
		spec.minimum = readOptionalDouble(paramProvider, "UNCERTAINTY_MINIMUM", spec.minimum);
		spec.maximum = readOptionalDouble(paramProvider, "UNCERTAINTY_MAXIMUM", spec.maximum);
		return spec;
	}
}

namespace tlca
{

ProcessGraph readProcessGraph(IParameterProvider& paramProvider)
{
	util::GroupScope model(paramProvider, "model");

	const unsigned int nNodes = readCount(paramProvider, "NNODES");
	std::vector<Node> nodes;
	nodes.reserve(nNodes);

	std::unordered_map<std::string, NodeKind> kinds;
	for (unsigned int i = 0; i < nNodes; ++i)
	{
		util::GroupScope grp(paramProvider, util::indexedGroup("node", i));

		Node n;
		n.id = paramProvider.getString("ID");
		n.kind = paramProvider.exists("KIND") ? toNodeKind(paramProvider.getString("KIND")) : NodeKind::Technosphere;
		if (paramProvider.exists("UNIT"))
			n.unit = paramProvider.getString("UNIT");
		n.name = paramProvider.exists("NAME") ? paramProvider.getString("NAME") : n.id;

		kinds[n.id] = n.kind;
		nodes.push_back(std::move(n));
	}

	const unsigned int nExchanges = readCount(paramProvider, "NEXCHANGES");
	std::vector<Exchange> exchanges;
	exchanges.reserve(nExchanges);
	for (unsigned int i = 0; i < nExchanges; ++i)
	{
		const std::string grpName = util::indexedGroup("exchange", i);
		util::GroupScope grp(paramProvider, grpName);

		Exchange ex;
		ex.input = paramProvider.getString("INPUT");
		ex.output = paramProvider.getString("OUTPUT");
		ex.amount = paramProvider.getDouble("AMOUNT");

		if (paramProvider.exists("TYPE"))
			ex.type = toExchangeType(paramProvider.getString("TYPE"));
		else if (ex.input == ex.output)
			ex.type = ExchangeType::Production;
		else
		{
			// Infer from the kind of the input node, unknown nodes are reported by the graph
			const std::unordered_map<std::string, NodeKind>::const_iterator it = kinds.find(ex.input);
			ex.type = ((it != kinds.end()) && (it->second == NodeKind::Biosphere)) ? ExchangeType::Biosphere : ExchangeType::Technosphere;
		}

		ex.uncertainty = readUncertainty(paramProvider);
		ex.temporal = readTemporalDistribution(paramProvider, grpName + " (" + ex.input + " -> " + ex.output + ")");

		exchanges.push_back(std::move(ex));
	}

	LOG(Debug) << "Read " << nNodes << " nodes and " << nExchanges << " exchanges";

	return ProcessGraph(std::move(nodes), std::move(exchanges));
}

std::string readLinearSolver(IParameterProvider& paramProvider)
{
	util::OptionalGroupScope model(paramProvider, "model");
	if (model.active() && paramProvider.exists("LINEAR_SOLVER"))
		return paramProvider.getString("LINEAR_SOLVER");

	return "Auto";
}

FunctionalUnit readFunctionalUnit(IParameterProvider& paramProvider)
{
	util::GroupScope demand(paramProvider, "demand");

	const std::vector<std::string> activities = paramProvider.getStringArray("ACTIVITIES");
	const std::vector<double> amounts = paramProvider.getDoubleArray("AMOUNTS");
	if (activities.size() != amounts.size())
		throw InvalidParameterException("ACTIVITIES and AMOUNTS of demand differ in size (" + std::to_string(activities.size()) + " vs. " + std::to_string(amounts.size()) + ")");

	FunctionalUnit fu;
	for (std::size_t i = 0; i < activities.size(); ++i)
		fu[activities[i]] += amounts[i];

	return fu;
}

TraversalOptions readTraversalOptions(IParameterProvider& paramProvider)
{
	TraversalOptions opts;

	util::OptionalGroupScope temporal(paramProvider, "temporal");
	if (temporal.active())
	{
		if (paramProvider.exists("CUTOFF_POLICY"))
			opts.policy = toCutoffPolicyType(paramProvider.getString("CUTOFF_POLICY"));

		opts.cutoff = readOptionalDouble(paramProvider, "CUTOFF", opts.cutoff);
		if (paramProvider.exists("MAX_DEPTH"))
			opts.maxDepth = readCount(paramProvider, "MAX_DEPTH");
		opts.timeHorizon = readOptionalDouble(paramProvider, "TIME_HORIZON", opts.timeHorizon);
		if (paramProvider.exists("MAX_CALC"))
			opts.maxCalc = readCount(paramProvider, "MAX_CALC");
		if (paramProvider.exists("ALLOW_NEGATIVE_OFFSETS"))
			opts.allowNegativeOffsets = paramProvider.getBool("ALLOW_NEGATIVE_OFFSETS");
		opts.massBalanceTolerance = readOptionalDouble(paramProvider, "MASS_BALANCE_TOLERANCE", opts.massBalanceTolerance);
	}

	opts.validate();
	return opts;
}

CharacterizationMethod readCharacterizationMethod(IParameterProvider& paramProvider)
{
	util::OptionalGroupScope charac(paramProvider, "characterization");
	if (!charac.active())
		return CharacterizationMethod::climateChange();

	const double horizon = readOptionalDouble(paramProvider, "HORIZON", 100.0);
	const int startYear = paramProvider.exists("START_YEAR") ? paramProvider.getInt("START_YEAR") : 2024;

	CharacterizationMethod method(horizon, startYear);
	if (!paramProvider.exists(util::indexedGroup("flow", 0)))
		method = CharacterizationMethod::climateChange(horizon, startYear);
	else
	{
		for (unsigned int i = 0; paramProvider.exists(util::indexedGroup("flow", i)); ++i)
		{
			util::GroupScope grp(paramProvider, util::indexedGroup("flow", i));

			const std::string flow = paramProvider.getString("FLOW");
			if (paramProvider.exists("KERNEL"))
			{
				const double factor = readOptionalDouble(paramProvider, "KERNEL_FACTOR", 1.0);
				const double rate = readOptionalDouble(paramProvider, "DECAY_RATE", 0.0);
				method.addKernel(flow, createKernel(paramProvider.getString("KERNEL"), factor, rate));
			}

			if (paramProvider.exists("FACTOR"))
				method.setStaticFactor(flow, paramProvider.getDouble("FACTOR"));
		}
	}

	if (paramProvider.exists("MIGRATE_ECOINVENT") && paramProvider.getBool("MIGRATE_ECOINVENT"))
		method.addEcoinventMigration();

	if (paramProvider.exists("REMAP_FROM") || paramProvider.exists("REMAP_TO"))
	{
		const std::vector<std::string> from = paramProvider.getStringArray("REMAP_FROM");
		const std::vector<std::string> to = paramProvider.getStringArray("REMAP_TO");
		if (from.size() != to.size())
			throw InvalidParameterException("REMAP_FROM and REMAP_TO differ in size (" + std::to_string(from.size()) + " vs. " + std::to_string(to.size()) + ")");

		for (std::size_t i = 0; i < from.size(); ++i)
			method.addRemapping(from[i], to[i]);
	}

	if (paramProvider.exists("FLOWS"))
	{
		const std::vector<std::string> flows = paramProvider.getStringArray("FLOWS");
		method.restrictTo(std::set<std::string>(flows.begin(), flows.end()));
	}

	return method;
}

MonteCarloConfig readMonteCarloConfig(IParameterProvider& paramProvider)
{
	MonteCarloConfig config;

	util::OptionalGroupScope mc(paramProvider, "montecarlo");
	if (mc.active())
	{
		if (paramProvider.exists("NSAMPLES"))
			config.nSamples = paramProvider.getUint64("NSAMPLES");
		if (paramProvider.exists("SEED"))
			config.seed = paramProvider.getUint64("SEED");
		if (paramProvider.exists("NTHREADS"))
			config.nThreads = paramProvider.getInt("NTHREADS");
		if (paramProvider.exists("IMPACT_CURVES"))
			config.impactCurves = paramProvider.getBool("IMPACT_CURVES");
		if (paramProvider.exists("RESAMPLE_TEMPORAL"))
			config.resampleTemporal = paramProvider.getBool("RESAMPLE_TEMPORAL");
		config.temporalSigma = readOptionalDouble(paramProvider, "TEMPORAL_SIGMA", config.temporalSigma);
		config.maxFailureRate = readOptionalDouble(paramProvider, "MAX_FAILURE_RATE", config.maxFailureRate);
		if (paramProvider.exists("PERCENTILES"))
			config.percentiles = paramProvider.getDoubleArray("PERCENTILES");
		config.sampleTimeout = readOptionalDouble(paramProvider, "SAMPLE_TIMEOUT", config.sampleTimeout);
		if (paramProvider.exists("KEEP_SAMPLES"))
			config.keepSamples = paramProvider.getBool("KEEP_SAMPLES");
		if (paramProvider.exists("CHANNEL_CAPACITY"))
			config.channelCapacity = readCount(paramProvider, "CHANNEL_CAPACITY");
	}

	config.validate();
	return config;
}

} // namespace tlca

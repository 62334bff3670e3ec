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

#include <catch2/catch.hpp>

#include "tlca/ProcessGraph.hpp"
#include "tlca/Exceptions.hpp"
#include "TestModels.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace
{
	tlca::Node makeNode(const std::string& id, tlca::NodeKind kind)
	{
		tlca::Node n;
		n.id = id;
		n.kind = kind;
		return n;
	}

	tlca::Exchange makeExchange(const std::string& input, const std::string& output, tlca::ExchangeType type, double amount)
	{
		tlca::Exchange ex;
		ex.input = input;
		ex.output = output;
		ex.type = type;
		ex.amount = amount;
		return ex;
	}
}

TEST_CASE("ProcessGraph numbers activities and flows separately", "[ProcessGraph]")
{
	const tlca::ProcessGraph graph = createExampleGraph();

	REQUIRE(graph.numActivities() == 2);
	REQUIRE(graph.numFlows() == 1);
	REQUIRE(graph.numExchanges() == 4);

	CHECK(graph.activityIndex("X") == 0);
	CHECK(graph.activityIndex("Y") == 1);
	CHECK(graph.activityIndex("Z") == -1);
	CHECK(graph.flowIndex("Z") == 0);
	CHECK(graph.flowIndex("X") == -1);
	CHECK(graph.contains("Z"));
	CHECK_FALSE(graph.contains("W"));

	CHECK(graph.node("Z").kind == tlca::NodeKind::Biosphere);
	CHECK_THROWS_AS(graph.node("W"), tlca::UnknownNodeException);
}

TEST_CASE("ProcessGraph derives connectivity from exchanges", "[ProcessGraph]")
{
	const tlca::ProcessGraph graph = createExampleGraph();

	CHECK(graph.production(0) == 1.0);
	CHECK(graph.production(1) == 1.0);

	REQUIRE(graph.numInputs(0) == 1);
	const int in = graph.inputs(0)[0];
	CHECK(graph.exchangeSource(in) == 1);
	CHECK(graph.exchangeTarget(in) == 0);
	CHECK(graph.numInputs(1) == 0);

	CHECK(graph.numEmissions(0) == 0);
	REQUIRE(graph.numEmissions(1) == 1);
	CHECK(graph.exchangeSource(graph.emissions(1)[0]) == 0);

	CHECK(graph.findExchange("Y", "X") == in);
	CHECK(graph.findExchange("X", "Y") == -1);
}

TEST_CASE("ProcessGraph defaults and sums production", "[ProcessGraph]")
{
	std::vector<tlca::Node> nodes = {makeNode("A", tlca::NodeKind::Technosphere), makeNode("B", tlca::NodeKind::Technosphere)};
	std::vector<tlca::Exchange> exchanges = {
		makeExchange("A", "A", tlca::ExchangeType::Production, 2.0),
		makeExchange("A", "A", tlca::ExchangeType::Production, 0.5)
	};

	const tlca::ProcessGraph graph(nodes, exchanges);
	CHECK(graph.production(0) == 2.5);
	CHECK(graph.production(1) == 1.0);
}

TEST_CASE("ProcessGraph rejects invalid definitions", "[ProcessGraph]")
{
	const std::vector<tlca::Node> nodes = {
		makeNode("A", tlca::NodeKind::Technosphere),
		makeNode("B", tlca::NodeKind::Technosphere),
		makeNode("F", tlca::NodeKind::Biosphere)
	};

	SECTION("Duplicate node id")
	{
		std::vector<tlca::Node> dup = nodes;
		dup.push_back(makeNode("A", tlca::NodeKind::Biosphere));
		CHECK_THROWS_AS(tlca::ProcessGraph(dup, std::vector<tlca::Exchange>()), tlca::InvalidParameterException);
	}

	SECTION("Exchange with unknown input")
	{
		const std::vector<tlca::Exchange> ex = {makeExchange("Q", "A", tlca::ExchangeType::Technosphere, 1.0)};
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::UnknownNodeException);
	}

	SECTION("Exchange consumed by a flow")
	{
		const std::vector<tlca::Exchange> ex = {makeExchange("A", "F", tlca::ExchangeType::Technosphere, 1.0)};
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::UnknownNodeException);
	}

	SECTION("Biosphere exchange from an activity")
	{
		const std::vector<tlca::Exchange> ex = {makeExchange("B", "A", tlca::ExchangeType::Biosphere, 1.0)};
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::UnknownNodeException);
	}

	SECTION("Production between different nodes")
	{
		const std::vector<tlca::Exchange> ex = {makeExchange("B", "A", tlca::ExchangeType::Production, 1.0)};
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::InvalidParameterException);
	}

	SECTION("Production with temporal distribution")
	{
		std::vector<tlca::Exchange> ex = {makeExchange("A", "A", tlca::ExchangeType::Production, 1.0)};
		ex[0].temporal = tlca::TemporalDistribution::immediate();
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::InvalidTemporalDistributionException);
	}

	SECTION("NaN amount")
	{
		const std::vector<tlca::Exchange> ex = {makeExchange("B", "A", tlca::ExchangeType::Technosphere, std::numeric_limits<double>::quiet_NaN())};
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::InvalidParameterException);
	}

	SECTION("Invalid uncertainty")
	{
		std::vector<tlca::Exchange> ex = {makeExchange("B", "A", tlca::ExchangeType::Technosphere, 1.0)};
		ex[0].uncertainty = tlca::UncertaintySpec::uniform(2.0, 1.0);
		CHECK_THROWS_AS(tlca::ProcessGraph(nodes, ex), tlca::InvalidParameterException);
	}
}

TEST_CASE("ProcessGraph snapshots with changed amounts", "[ProcessGraph]")
{
	const tlca::ProcessGraph graph = createExampleGraph();

	SECTION("Single exchange")
	{
		const tlca::ProcessGraph changed = graph.withAmount("Y", "X", 0.75);
		CHECK(changed.exchange(changed.findExchange("Y", "X")).amount == 0.75);

		// Base snapshot is untouched
		CHECK(graph.exchange(graph.findExchange("Y", "X")).amount == 0.5);
	}

	SECTION("Production amount updates production")
	{
		const tlca::ProcessGraph changed = graph.withAmount("Y", "Y", 4.0);
		CHECK(changed.production(1) == 4.0);
		CHECK(graph.production(1) == 1.0);
	}

	SECTION("Unknown exchange")
	{
		CHECK_THROWS_AS(graph.withAmount("W", "X", 1.0), tlca::UnknownNodeException);
		CHECK_THROWS_AS(graph.withAmount("X", "Y", 1.0), tlca::UnknownNodeException);
	}

	SECTION("NaN amount")
	{
		CHECK_THROWS_AS(graph.withAmount("Y", "X", std::numeric_limits<double>::quiet_NaN()), tlca::InvalidParameterException);
	}

	SECTION("All exchanges")
	{
		const tlca::ProcessGraph changed = graph.withAmounts({2.0, 1.0, 0.25, 20.0});
		CHECK(changed.production(0) == 2.0);
		CHECK(changed.exchange(3).amount == 20.0);
		CHECK_THROWS_AS(graph.withAmounts({1.0, 2.0}), tlca::InvalidParameterException);
	}
}

TEST_CASE("ProcessGraph validates offsets of temporal distributions", "[ProcessGraph]")
{
	const tlca::ProcessGraph graph = createChainGraph();

	CHECK_THROWS_AS(graph.validateTemporalDistributions(false), tlca::InvalidTemporalDistributionException);
	CHECK_NOTHROW(graph.validateTemporalDistributions(true));
	CHECK_NOTHROW(createExampleGraph().validateTemporalDistributions(false));
}

TEST_CASE("ProcessGraph temporal fractions sum to one", "[ProcessGraph]")
{
	const tlca::ProcessGraph graphs[] = {createExampleGraph(), createChainGraph(), createUncertainGraph()};
	for (const tlca::ProcessGraph& g : graphs)
	{
		for (const tlca::Exchange& ex : g.exchanges())
		{
			if (!ex.temporal.empty())
				CHECK(std::abs(ex.temporal.fractionSum() - 1.0) <= 1e-9);
		}
	}
}

TEST_CASE("Node kind and exchange type names", "[ProcessGraph]")
{
	CHECK(tlca::toNodeKind("biosphere") == tlca::NodeKind::Biosphere);
	CHECK(tlca::toNodeKind("process") == tlca::NodeKind::Technosphere);
	CHECK_THROWS_AS(tlca::toNodeKind("economy"), tlca::InvalidParameterException);

	CHECK(tlca::toExchangeType(tlca::to_string(tlca::ExchangeType::Biosphere)) == tlca::ExchangeType::Biosphere);
	CHECK_THROWS_AS(tlca::toExchangeType("substitution"), tlca::InvalidParameterException);
}

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

#include "tlca/StaticLca.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/Exceptions.hpp"
#include "TestModels.hpp"

#include <string>
#include <vector>

TEST_CASE("Static LCA of acyclic example", "[StaticLca],[CI]")
{
	const tlca::ProcessGraph graph = createExampleGraph();
	const tlca::StaticLcaSolver solver;

	const tlca::LcaResult res = solver.solve(graph, {{"X", 1.0}});

	CHECK(res.solvedTriangular());
	CHECK(res.scaling("X") == Approx(1.0));
	CHECK(res.scaling("Y") == Approx(0.5));
	CHECK(res.inventory("Z") == Approx(5.0));

	REQUIRE(res.activities() == graph.activityIds());
	REQUIRE(res.flows() == graph.flowIds());
	CHECK(res.inventoryMap().at("Z") == Approx(5.0));
	CHECK(res.scalingMap().size() == 2);

	CHECK_THROWS_AS(res.scaling("Z"), tlca::UnknownNodeException);
	CHECK_THROWS_AS(res.inventory("X"), tlca::UnknownNodeException);
}

TEST_CASE("Static LCA scales linearly with demand", "[StaticLca],[CI]")
{
	const tlca::ProcessGraph graph = createExampleGraph();
	const tlca::StaticLcaSolver solver;

	const tlca::LcaResult res = solver.solve(graph, {{"X", 2.0}, {"Y", 1.0}});
	CHECK(res.scaling("X") == Approx(2.0));
	CHECK(res.scaling("Y") == Approx(2.0));
	CHECK(res.inventory("Z") == Approx(20.0));

	const tlca::LcaResult empty = solver.solve(graph, tlca::FunctionalUnit());
	CHECK(empty.inventory("Z") == 0.0);
}

TEST_CASE("Static LCA is idempotent", "[StaticLca],[CI]")
{
	const tlca::ProcessGraph graph = createChainGraph();
	const tlca::StaticLcaSolver solver;

	const tlca::LcaResult first = solver.solve(graph, {{"A", 1.0}});
	const tlca::LcaResult second = solver.solve(graph, {{"A", 1.0}});

	CHECK(first.scaling() == second.scaling());
	CHECK(first.inventory() == second.inventory());
}

TEST_CASE("Static LCA of chain with production amounts", "[StaticLca],[CI]")
{
	const tlca::LcaResult res = tlca::StaticLcaSolver().solve(createChainGraph(), {{"A", 1.0}});

	CHECK(res.solvedTriangular());
	CHECK(res.scaling("A") == Approx(1.0));
	CHECK(res.scaling("B") == Approx(1.0));
	CHECK(res.scaling("C") == Approx(0.5));
	CHECK(res.inventory("Carbon dioxide, fossil") == Approx(5.0));
	CHECK(res.inventory("Methane, fossil") == Approx(0.1));
}

TEST_CASE("Static LCA of cyclic graph", "[StaticLca],[CI]")
{
	const tlca::ProcessGraph graph = createCyclicGraph();
	const std::string solverName = GENERATE(as<std::string>{}, "Auto", "SparseLU", "SparseLU_NaturalOrdering", "SparseQR", "BiCGSTAB_IncompleteLUT");

	INFO("Linear solver " << solverName);

	const tlca::LcaResult res = tlca::StaticLcaSolver(solverName).solve(graph, {{"X", 1.0}});

	CHECK_FALSE(res.solvedTriangular());
	CHECK(res.scaling("X") == Approx(1.0 / 0.98).epsilon(1e-8));
	CHECK(res.scaling("Y") == Approx(0.1 / 0.98).epsilon(1e-8));
	CHECK(res.inventory("Carbon dioxide, fossil") == Approx(1.2 / 0.98).epsilon(1e-8));
}

TEST_CASE("Static LCA with explicit solver on acyclic graph", "[StaticLca],[CI]")
{
	const tlca::LcaResult res = tlca::StaticLcaSolver("SparseQR").solve(createExampleGraph(), {{"X", 1.0}});
	CHECK_FALSE(res.solvedTriangular());
	CHECK(res.inventory("Z") == Approx(5.0));
}

TEST_CASE("Static LCA rejects unknown solver and demand", "[StaticLca],[CI]")
{
	CHECK_THROWS_AS(tlca::StaticLcaSolver("Cholesky"), tlca::InvalidParameterException);

	const tlca::ProcessGraph graph = createExampleGraph();
	CHECK_THROWS_AS(tlca::StaticLcaSolver().solve(graph, {{"W", 1.0}}), tlca::UnknownNodeException);
	CHECK_THROWS_AS(tlca::StaticLcaSolver().solve(graph, {{"Z", 1.0}}), tlca::UnknownNodeException);
}

TEST_CASE("Static LCA detects singular technosphere", "[StaticLca],[CI]")
{
	const tlca::ProcessGraph graph = createExampleGraph().withAmount("Y", "Y", 0.0);

	try
	{
		tlca::StaticLcaSolver().solve(graph, {{"X", 1.0}});
		FAIL("Expected SingularSystemException");
	}
	catch (const tlca::SingularSystemException& e)
	{
		CHECK(e.nodeId() == "Y");
	}

	// Singular cycle: X and Y supply each other exactly
	const tlca::ProcessGraph cyclic = createCyclicGraph().withAmount("Y", "X", 1.0).withAmount("X", "Y", 1.0);
	CHECK_THROWS_AS(tlca::StaticLcaSolver("SparseLU").solve(cyclic, {{"X", 1.0}}), tlca::SingularSystemException);
}

TEST_CASE("Mass flow sums scaling of activity groups", "[StaticLca],[CI]")
{
	const tlca::LcaResult res({"treatment_a", "treatment_b", "transport"}, {"CO2"}, {1.0, 2.5, 4.0}, {3.0}, true);

	CHECK(res.massFlow("treatment") == Approx(3.5));
	CHECK(res.massFlow("trans") == Approx(4.0));
	CHECK(res.massFlow("landfill") == 0.0);
	CHECK(res.massFlow("") == Approx(7.5));
}

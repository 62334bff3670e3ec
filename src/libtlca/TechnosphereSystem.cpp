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

#include "TechnosphereSystem.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/Exceptions.hpp"
#include "graph/GraphAlgos.hpp"
#include "Logging.hpp"

#include <cmath>

namespace tlca
{

TechnosphereSystem::TechnosphereSystem(const ProcessGraph& graph, const std::string& solverName) : _graph(graph), _triangular(false)
{
	const unsigned int nAct = _graph.numActivities();

	for (unsigned int j = 0; j < nAct; ++j)
	{
		if (_graph.production(j) == 0.0)
			throw SingularSystemException("Activity '" + _graph.activityIds()[j] + "' has zero self-production (|A[j,j]| = 0)", _graph.activityIds()[j]);
	}

	bool useTriangular = false;
	std::vector<int> topoOrder;
	if (solverName == "Auto")
	{
		const tlca::util::SlicedVector<int> adj = graph::adjacencyListFromProcessGraph(_graph);
		topoOrder.reserve(nAct);
		useTriangular = !graph::topologicalSort(adj, topoOrder);
	}

	// Biosphere matrix is not permuted
	std::vector<Eigen::Triplet<double>> bioTriplets;
	bioTriplets.reserve(_graph.numExchanges());
	for (unsigned int i = 0; i < _graph.numExchanges(); ++i)
	{
		const Exchange& ex = _graph.exchange(i);
		if (ex.type == ExchangeType::Biosphere)
			bioTriplets.emplace_back(_graph.exchangeSource(i), _graph.exchangeTarget(i), ex.amount);
	}

	_B.resize(_graph.numFlows(), nAct);
	_B.setFromTriplets(bioTriplets.begin(), bioTriplets.end());

	if (useTriangular)
		assembleTriangular(topoOrder);
	else
	{
		_solver.reset(tlca::linalg::createLinearSolver((solverName == "Auto") ? std::string("SparseLU") : solverName));
		assembleGeneral();
	}

	_flowColumns.resize(nAct);
	_flowColumnReady.resize(nAct, false);

	LOG(Debug) << "Technosphere system with " << nAct << " activities and " << _graph.numFlows() << " flows, solver " << this->solverName();
}

TechnosphereSystem::~TechnosphereSystem() TLCA_NOEXCEPT { }

void TechnosphereSystem::assembleTriangular(const std::vector<int>& topoOrder)
{
	const int nAct = static_cast<int>(topoOrder.size());

	// Suppliers come after their consumers, so A becomes lower triangular
	_position.resize(nAct);
	for (int k = 0; k < nAct; ++k)
		_position[topoOrder[nAct - 1 - k]] = k;

	std::vector<Eigen::Triplet<double>> triplets;
	triplets.reserve(_graph.numExchanges() + nAct);
	for (int j = 0; j < nAct; ++j)
		triplets.emplace_back(_position[j], _position[j], _graph.production(j));

	for (unsigned int i = 0; i < _graph.numExchanges(); ++i)
	{
		const Exchange& ex = _graph.exchange(i);
		if (ex.type == ExchangeType::Technosphere)
			triplets.emplace_back(_position[_graph.exchangeSource(i)], _position[_graph.exchangeTarget(i)], -ex.amount);
	}

	_A.resize(nAct, nAct);
	_A.setFromTriplets(triplets.begin(), triplets.end());

	// Self-consumption may cancel the self-production
	for (int j = 0; j < nAct; ++j)
	{
		const double diag = _A.coeff(_position[j], _position[j]);
		if (!std::isfinite(diag) || (diag == 0.0))
		{
			LOG(Error) << "Vanishing diagonal entry of activity " << _graph.activityIds()[j];
			throw SingularSystemException("Technosphere matrix is singular at activity '" + _graph.activityIds()[j] + "' (|A[j,j]| = " + std::to_string(std::abs(diag)) + ")", _graph.activityIds()[j]);
		}
	}

	_triangular = true;
}

void TechnosphereSystem::assembleGeneral()
{
	const int nAct = static_cast<int>(_graph.numActivities());

	_position.resize(nAct);
	for (int j = 0; j < nAct; ++j)
		_position[j] = j;

	std::vector<Eigen::Triplet<double>> triplets;
	triplets.reserve(_graph.numExchanges() + nAct);
	for (int j = 0; j < nAct; ++j)
		triplets.emplace_back(j, j, _graph.production(j));

	for (unsigned int i = 0; i < _graph.numExchanges(); ++i)
	{
		const Exchange& ex = _graph.exchange(i);
		if (ex.type == ExchangeType::Technosphere)
			triplets.emplace_back(_graph.exchangeSource(i), _graph.exchangeTarget(i), -ex.amount);
	}

	_A.resize(nAct, nAct);
	_A.setFromTriplets(triplets.begin(), triplets.end());
	_A.makeCompressed();

	_solver->analyzePattern(_A);
	_solver->factorize(_A);
	if (_solver->info() != Eigen::Success)
	{
		LOG(Error) << "Factorization of technosphere matrix failed using " << _solver->name();
		throw SingularSystemException(std::string("Technosphere matrix is singular (") + _solver->name() + " factorization failed)");
	}

	_triangular = false;
}

Eigen::VectorXd TechnosphereSystem::assembleDemand(const ProcessGraph& graph, const FunctionalUnit& fu)
{
	Eigen::VectorXd demand = Eigen::VectorXd::Zero(graph.numActivities());
	for (const std::pair<const std::string, double>& d : fu)
	{
		const int idx = graph.activityIndex(d.first);
		if (idx < 0)
			throw UnknownNodeException(d.first, "in functional unit");

		if (!std::isfinite(d.second))
			throw InvalidParameterException("Demand of activity '" + d.first + "' is not finite");

		demand[idx] += d.second;
	}
	return demand;
}

Eigen::VectorXd TechnosphereSystem::solve(const Eigen::VectorXd& demand)
{
	Eigen::VectorXd s;
	if (_triangular)
	{
		Eigen::VectorXd permDemand(demand.size());
		for (int j = 0; j < demand.size(); ++j)
			permDemand[_position[j]] = demand[j];

		const Eigen::VectorXd permScaling = _A.triangularView<Eigen::Lower>().solve(permDemand);

		s.resize(demand.size());
		for (int j = 0; j < demand.size(); ++j)
			s[j] = permScaling[_position[j]];
	}
	else
	{
		s = _solver->solve(demand);
		if (_solver->info() != Eigen::Success)
		{
			LOG(Error) << "Linear solver " << _solver->name() << " did not converge";
			throw SingularSystemException(std::string("Technosphere system cannot be solved (") + _solver->name() + " did not converge)");
		}
	}

	checkFinite(s);
	return s;
}

void TechnosphereSystem::checkFinite(const Eigen::VectorXd& s) const
{
	for (int j = 0; j < s.size(); ++j)
	{
		if (!std::isfinite(s[j]))
		{
			LOG(Error) << "Non-finite scaling of activity " << _graph.activityIds()[j];
			throw SingularSystemException("Scaling of activity '" + _graph.activityIds()[j] + "' is not finite", _graph.activityIds()[j]);
		}
	}
}

Eigen::VectorXd TechnosphereSystem::inventory(const Eigen::VectorXd& scaling) const
{
	return _B * scaling;
}

const Eigen::VectorXd& TechnosphereSystem::flowColumn(int activity)
{
	if (!_flowColumnReady[activity])
	{
		Eigen::VectorXd unit = Eigen::VectorXd::Zero(_graph.numActivities());
		unit[activity] = 1.0;
		_flowColumns[activity] = inventory(solve(unit));
		_flowColumnReady[activity] = true;
	}
	return _flowColumns[activity];
}

} // namespace tlca

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

#include "linalg/EigenSolverWrapper.hpp"
#include "tlca/Exceptions.hpp"

namespace
{
	inline bool startsWith(const std::string& str, const char* prefix)
	{
		return str.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
	}

	inline bool contains(const std::string& str, const char* part)
	{
		return str.find(part) != std::string::npos;
	}
}

namespace tlca
{

namespace linalg
{

	tlca::linalg::EigenSolverBase* createLinearSolver(const std::string& solverName)
	{
		if (startsWith(solverName, "SparseLU"))
		{
			if (contains(solverName, "NaturalOrdering"))
				return new SparseLU<Eigen::NaturalOrdering<int>>("SparseLU_NaturalOrdering");
			if (contains(solverName, "AMDOrdering") && !contains(solverName, "COLAMD"))
				return new SparseLU<Eigen::AMDOrdering<int>>("SparseLU_AMDOrdering");

			return new SparseLU<Eigen::COLAMDOrdering<int>>("SparseLU");
		}

		if (startsWith(solverName, "SparseQR"))
		{
			if (contains(solverName, "NaturalOrdering"))
				return new SparseQR<Eigen::NaturalOrdering<int>>("SparseQR_NaturalOrdering");

			return new SparseQR<Eigen::COLAMDOrdering<int>>("SparseQR");
		}

		if (startsWith(solverName, "BiCGSTAB"))
		{
			if (contains(solverName, "IdentityPreconditioner"))
				return new BiCGSTAB<Eigen::IdentityPreconditioner>("BiCGSTAB_IdentityPreconditioner");
			if (contains(solverName, "IncompleteLUT"))
				return new BiCGSTAB<Eigen::IncompleteLUT<double>>("BiCGSTAB_IncompleteLUT");

			return new BiCGSTAB<Eigen::DiagonalPreconditioner<double>>("BiCGSTAB");
		}

		throw InvalidParameterException("Unknown linear solver name: " + solverName);
	}

	bool isKnownLinearSolver(const std::string& solverName)
	{
		return (solverName == "Auto") || startsWith(solverName, "SparseLU") || startsWith(solverName, "SparseQR") || startsWith(solverName, "BiCGSTAB");
	}

} // namespace linalg

} // namespace tlca

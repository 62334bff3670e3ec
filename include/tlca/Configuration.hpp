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
 * Reads process graphs, demands, and run options from parameter providers.
 *
 * All readers start in the current scope of the provider and leave it unchanged.
 */

#ifndef LIBTLCA_CONFIGURATION_HPP_
#define LIBTLCA_CONFIGURATION_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/StaticLca.hpp"
#include "tlca/TemporalLca.hpp"
#include "tlca/Characterization.hpp"
#include "tlca/MonteCarlo.hpp"

#include <string>

namespace tlca
{

class IParameterProvider;

/**
 * @brief Reads the process graph from group @c model
 * @details Nodes are read from groups @c node_000 to @c node_XXX (@c NNODES groups) with
 *          fields @c ID, @c KIND, @c UNIT, @c NAME. Exchanges are read from groups
 *          @c exchange_000 to @c exchange_XXX (@c NEXCHANGES groups) with fields @c INPUT,
 *          @c OUTPUT, @c TYPE, @c AMOUNT, the optional uncertainty fields @c UNCERTAINTY_TYPE,
 *          @c UNCERTAINTY_LOC, @c UNCERTAINTY_SCALE, @c UNCERTAINTY_SHAPE, @c UNCERTAINTY_MINIMUM,
 *          @c UNCERTAINTY_MAXIMUM and an optional temporal distribution given either by
 *          @c TEMPORAL_OFFSETS and @c TEMPORAL_FRACTIONS or by @c TEMPORAL_PROFILE.
 */
TLCA_API ProcessGraph readProcessGraph(IParameterProvider& paramProvider);

/**
 * @brief Reads the linear solver name (@c model / @c LINEAR_SOLVER, defaults to @c Auto)
 */
TLCA_API std::string readLinearSolver(IParameterProvider& paramProvider);

/**
 * @brief Reads the functional unit from group @c demand (fields @c ACTIVITIES and @c AMOUNTS)
 */
TLCA_API FunctionalUnit readFunctionalUnit(IParameterProvider& paramProvider);

/**
 * @brief Reads the traversal options from the optional group @c temporal
 */
TLCA_API TraversalOptions readTraversalOptions(IParameterProvider& paramProvider);

/**
 * @brief Reads the characterization method from the optional group @c characterization
 * @details Without @c flow_XXX groups the climate change method is used.
 */
TLCA_API CharacterizationMethod readCharacterizationMethod(IParameterProvider& paramProvider);

/**
 * @brief Reads the Monte Carlo configuration from the optional group @c montecarlo
 */
TLCA_API MonteCarloConfig readMonteCarloConfig(IParameterProvider& paramProvider);

} // namespace tlca

#endif  // LIBTLCA_CONFIGURATION_HPP_

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
 * Defines process graphs and configurations shared by the tests.
 */

#ifndef TLCATEST_TESTMODELS_HPP_
#define TLCATEST_TESTMODELS_HPP_

#include "tlca/ProcessGraph.hpp"
#include "common/JsonParameterProvider.hpp"

#include <nlohmann/json.hpp>

/**
 * @brief X consumes 0.5 Y, Y emits 10 kg Z split evenly at 0 and 10 years
 */
tlca::ProcessGraph createExampleGraph();

/**
 * @brief X consumes 0.1 Y per unit X, Y consumes 0.2 X per unit Y, both emit fossil CO2
 */
tlca::ProcessGraph createCyclicGraph();

/**
 * @brief Chain A <- B <- C, every activity emits fossil CO2 and methane with temporal profiles
 */
tlca::ProcessGraph createChainGraph();

/**
 * @brief Single activity emitting fossil CO2 with a normally distributed amount
 * @param [in] mean Mean of the emission
 * @param [in] stdDev Standard deviation of the emission
 */
tlca::ProcessGraph createNormalEmissionGraph(double mean, double stdDev);

/**
 * @brief Example graph with lognormal, uniform and triangular uncertainties
 */
tlca::ProcessGraph createUncertainGraph();

/**
 * @brief X consumes an uncertain amount of Y, which has zero self-production
 */
tlca::ProcessGraph createSingularGraph();

/**
 * @brief X emits 2 kg fossil CO2 and consumes an amount of Y uniform in [0, 4e307], Y consumes 10 Z
 * @details Scaling of Z overflows for roughly half of the draws.
 */
tlca::ProcessGraph createOverflowingGraph();

nlohmann::json createExampleJson();
tlca::JsonParameterProvider createExampleConfig();

#endif  // TLCATEST_TESTMODELS_HPP_

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
 * @mainpage TLCA
 * The library computes static inventories, time-resolved emission timelines, dynamic
 * climate impacts, and Monte Carlo uncertainty estimates of process networks
 * 
 * @authors    Please refer to AUTHORS.md
 * @version    1.0.0
 * @date       2024-present
 * @copyright  GNU General Public License v3.0 (or, at your option, any later version).
 */

/**
 * @file
 * Main include file for the public interface to TLCA.
 */

#include "tlca/tlcaCompilerInfo.hpp"
#include "tlca/LibExportImport.hpp"
#include "tlca/LibVersionInfo.hpp"
#include "tlca/Exceptions.hpp"
#include "tlca/HashUtil.hpp"
#include "tlca/Logging.hpp"
#include "tlca/ParameterProvider.hpp"
#include "tlca/Notification.hpp"
#include "tlca/Uncertainty.hpp"
#include "tlca/TemporalDistribution.hpp"
#include "tlca/ProcessGraph.hpp"
#include "tlca/StaticLca.hpp"
#include "tlca/Timeline.hpp"
#include "tlca/TemporalLca.hpp"
#include "tlca/Characterization.hpp"
#include "tlca/Statistics.hpp"
#include "tlca/MonteCarlo.hpp"
#include "tlca/Configuration.hpp"

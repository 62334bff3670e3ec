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
 * Provides algorithms for graphs
 */

#ifndef LIBTLCA_GRAPHALGOS_HPP_
#define LIBTLCA_GRAPHALGOS_HPP_

#include <vector>
#include "SlicedVector.hpp"

namespace tlca
{

class ProcessGraph;

namespace graph
{

/**
 * @brief      Builds the supplier adjacency list of the technosphere
 * @details    Slice @c j lists the activities whose products are consumed by
 *             activity @c j, each at most once. Self-consumption is omitted
 *             since it only changes the diagonal of the technosphere matrix.
 *
 * @param[in]  graph  Process graph
 *
 * @return     Adjacency list for each activity
 */
tlca::util::SlicedVector<int> adjacencyListFromProcessGraph(const tlca::ProcessGraph& graph);

/**
 * @brief      Performs a topological sort of the given directed graph
 * @details    Topological sorting finds an ordering of the nodes (activities)
 *             such that all dependencies (suppliers) of a node are listed before
 *             the node itself is listed.
 *
 *             The depth-first search uses an explicit stack and stops at the first
 *             back edge, in which case @p topoOrder is incomplete.
 *
 * @param[in]  adjList    List of adjacent nodes for each node, see adjacencyListFromProcessGraph()
 * @param[out] topoOrder  Suppliers first, consumers last
 *
 * @return     @c true if the graph contains cycles, @c false otherwise
 */
bool topologicalSort(const tlca::util::SlicedVector<int>& adjList, std::vector<int>& topoOrder);

} // namespace graph

} // namespace tlca

#endif // LIBTLCA_GRAPHALGOS_HPP_

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

#include "graph/GraphAlgos.hpp"
#include "tlca/ProcessGraph.hpp"

#include <utility>

namespace tlca
{

namespace graph
{

	tlca::util::SlicedVector<int> adjacencyListFromProcessGraph(const tlca::ProcessGraph& graph)
	{
		const unsigned int nActivities = graph.numActivities();

		tlca::util::SlicedVector<int> adj;
		adj.reserve(graph.numExchanges(), nActivities);

		for (unsigned int j = 0; j < nActivities; ++j)
		{
			adj.openSlice();

			int const* const in = graph.inputs(j);
			const unsigned int nIn = graph.numInputs(j);
			for (unsigned int k = 0; k < nIn; ++k)
			{
				const int supplier = graph.exchangeSource(in[k]);
				if (supplier != static_cast<int>(j))
					adj.appendUnique(supplier);
			}
		}

		return adj;
	}

	bool topologicalSort(const tlca::util::SlicedVector<int>& adjList, std::vector<int>& topoOrder)
	{
		const int nNodes = static_cast<int>(adjList.numSlices());
		topoOrder.clear();
		topoOrder.reserve(nNodes);

		// 0 = unvisited, 1 = on current path, 2 = finished
		std::vector<char> state(nNodes, 0);

		// Explicit DFS stack of (node, next supplier to visit), supply chains can be very deep
		std::vector<std::pair<int, int>> path;
		path.reserve(nNodes);

		for (int root = 0; root < nNodes; ++root)
		{
			if (state[root] != 0)
				continue;

			state[root] = 1;
			path.emplace_back(root, 0);

			while (!path.empty())
			{
				const int u = path.back().first;
				const int next = path.back().second;

				if (next < static_cast<int>(adjList.sliceSize(u)))
				{
					const int v = adjList[u][next];
					++path.back().second;

					// Back edge closes a cycle
					if (state[v] == 1)
						return true;

					if (state[v] == 0)
					{
						state[v] = 1;
						path.emplace_back(v, 0);
					}
				}
				else
				{
					// All suppliers of u are already listed
					state[u] = 2;
					topoOrder.push_back(u);
					path.pop_back();
				}
			}
		}

		return false;
	}

} // namespace graph

} // namespace tlca

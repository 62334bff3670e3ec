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
 * Hash mixing used to derive independent random seeds.
 */

#ifndef LIBTLCA_HASHUTIL_HPP_
#define LIBTLCA_HASHUTIL_HPP_

#include "tlca/tlcaCompilerInfo.hpp"

#include <cstdint>

namespace tlca
{

	/**
	 * @brief Mixes a value into a running hash
	 * @details Uses the 128 to 64 bit reduction of CityHash (Copyright by Google Inc., MIT license).
	 *          Nearby inputs, such as consecutive sample indices, end up far apart.
	 * @param [in,out] seed Running hash that receives @p value
	 * @param [in] value Value mixed into the hash
	 */
	inline void hash_combine(uint64_t& seed, uint64_t value) TLCA_NOEXCEPT
	{
		const uint64_t mul = 0x9ddfea08eb382d69ULL;

		uint64_t lo = (value ^ seed) * mul;
		lo ^= (lo >> 47);

		uint64_t hi = (seed ^ lo) * mul;
		hi ^= (hi >> 47);

		seed = hi * mul;
	}

} // namespace tlca

#endif  // LIBTLCA_HASHUTIL_HPP_

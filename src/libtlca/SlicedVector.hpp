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
 * Defines a SlicedVector which stores ragged per-node lists in one array
 */

#ifndef LIBTLCA_SLICEDVECTOR_HPP_
#define LIBTLCA_SLICEDVECTOR_HPP_

#include "tlca/tlcaCompilerInfo.hpp"
#include "common/CompilerSpecific.hpp"

#include <vector>
#include <algorithm>

namespace tlca
{

namespace util
{

/**
 * @brief Append-only list of variable-length slices
 * @details Slice @c i occupies the half-open range [_offsets[i], _offsets[i+1]) of a
 *          single contiguous array. Only the last slice can grow.
 * @tparam T Type of the stored elements
 */
template <typename T>
class SlicedVector
{
public:
	typedef typename std::vector<T>::size_type size_type;

	SlicedVector() : _offsets(1, 0) { }

	inline size_type numSlices() const TLCA_NOEXCEPT { return _offsets.size() - 1; }
	inline size_type sliceSize(size_type idxSlice) const { return _offsets[idxSlice + 1] - _offsets[idxSlice]; }

	inline T const* operator[](size_type idxSlice) const { return _data.data() + _offsets[idxSlice]; }

	inline void reserve(size_type numElems, size_type numSlices)
	{
		_data.reserve(numElems);
		_offsets.reserve(numSlices + 1);
	}

	/**
	 * @brief Appends a copy of @p slice as new last slice
	 * @param [in] slice Elements of the new slice
	 */
	inline void appendSlice(const std::vector<T>& slice)
	{
		_data.insert(_data.end(), slice.begin(), slice.end());
		_offsets.push_back(_data.size());
	}

	/**
	 * @brief Starts an empty slice that is filled by append() or appendUnique()
	 */
	inline void openSlice()
	{
		_offsets.push_back(_data.size());
	}

	inline void append(const T& value)
	{
		tlca_assert(numSlices() > 0);
		_data.push_back(value);
		++_offsets.back();
	}

	/**
	 * @brief Appends @p value to the last slice unless it is already contained
	 * @param [in] value Element to append
	 * @return @c true if the element has been appended, otherwise @c false
	 */
	inline bool appendUnique(const T& value)
	{
		tlca_assert(numSlices() > 0);

		const typename std::vector<T>::const_iterator first = _data.begin() + _offsets[_offsets.size() - 2];
		if (std::find(first, _data.cend(), value) != _data.cend())
			return false;

		append(value);
		return true;
	}

private:
	std::vector<T> _data;
	std::vector<size_type> _offsets;
};

} // namespace util

} // namespace tlca

#endif  // LIBTLCA_SLICEDVECTOR_HPP_

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
 * Stream adapters for logging per-node results.
 */

#ifndef LIBTLCA_LOGGING_UTILS_HPP_
#define LIBTLCA_LOGGING_UTILS_HPP_

#include <string>
#include <vector>

#ifndef TLCA_LOGGING_DISABLE
	#include <ostream>
#endif

namespace tlca
{
namespace log
{
	/**
	 * @brief Values of a linear array labelled with node ids
	 * @details The array has to hold one value per label.
	 * @tparam T Type of the values
	 */
	template <class T>
	struct LabeledValues
	{
		const std::vector<std::string>& labels;
		const T* values;

		LabeledValues(const std::vector<std::string>& l, const T* v) : labels(l), values(v) { }
	};

	template <class T>
	inline LabeledValues<T> labeled(const std::vector<std::string>& labels, const T* values)
	{
		return LabeledValues<T>(labels, values);
	}

#ifndef TLCA_LOGGING_DISABLE

	template <class T>
	inline std::ostream& operator<<(std::ostream& os, const LabeledValues<T>& lv)
	{
		os << "{";
		for (std::size_t i = 0; i < lv.labels.size(); ++i)
		{
			if (i > 0)
				os << ", ";
			os << lv.labels[i] << ": " << lv.values[i];
		}
		os << "}";
		return os;
	}

#endif

} // namespace log
} // namespace tlca

#endif  // LIBTLCA_LOGGING_UTILS_HPP_

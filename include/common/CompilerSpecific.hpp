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
 * Compiler specific macros for branch hints and debug assertions.
 */

#ifndef TLCA_COMPILERSPECIFIC_HPP_
#define TLCA_COMPILERSPECIFIC_HPP_

#if defined(NDEBUG) || !defined(DEBUG)
	#ifndef TLCA_NO_DEBUG
		#define TLCA_NO_DEBUG
	#endif
	#ifdef TLCA_DEBUG
		#undef TLCA_DEBUG
	#endif
#endif
#if defined(DEBUG) || defined(TLCA_DEBUG)
	#define TLCA_DEBUG
	#undef TLCA_NO_DEBUG
	#include <cassert>
#endif

#ifdef TLCA_NO_DEBUG
	#define tlca_assert(x)
#else
	#define tlca_assert(x) assert(x)
#endif

#ifdef __GNUC__
	#define tlca_likely(x) __builtin_expect(!!(x), 1)
	#define tlca_unlikely(x) __builtin_expect(!!(x), 0)
#else
	#define tlca_likely(x) (x)
	#define tlca_unlikely(x) (x)
#endif

#endif  // TLCA_COMPILERSPECIFIC_HPP_

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
 * Defines preprocessor macros for importing and exporting symbols from and to dynamic libraries.
 */

#ifndef LIBTLCA_LIBEXPORT_HPP_
#define LIBTLCA_LIBEXPORT_HPP_

#ifndef TLCA_API
	#ifdef _MSC_VER
		#if defined(libtlca_EXPORTS)
			#define TLCA_API _declspec(dllexport)
		#else
			#define TLCA_API _declspec(dllimport)
		#endif
	#else
		#define TLCA_API __attribute__((visibility("default")))
	#endif
#endif

#endif  // LIBTLCA_LIBEXPORT_HPP_

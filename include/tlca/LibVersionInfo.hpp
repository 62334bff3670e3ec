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
 * Provides information on the libtlca build.
 */

#ifndef LIBTLCA_LIBVERSIONINFO_HPP_
#define LIBTLCA_LIBVERSIONINFO_HPP_

#include "tlca/LibExportImport.hpp"
#include "tlca/tlcaCompilerInfo.hpp"

namespace tlca
{

	/**
	 * @brief Version and configuration of the libtlca build
	 * @details All strings are filled in by CMake when the library is configured.
	 */
	struct BuildInfo
	{
		const char* version; //!< Library version (MAJOR.MINOR.PATCH)
		const char* dependencies; //!< Linked library versions as NAME=VERSION; list, e.g., @c EIGEN=3.4.0;TBB=2021.5.0;
		const char* buildType; //!< CMake build type
		const char* compiler;
	};

	TLCA_API const BuildInfo& getBuildInfo() TLCA_NOEXCEPT;

	inline const char* getLibraryVersion() TLCA_NOEXCEPT { return getBuildInfo().version; }
	inline const char* getLibraryDependencyVersions() TLCA_NOEXCEPT { return getBuildInfo().dependencies; }

} // namespace tlca

extern "C"
{
	TLCA_API const char* tlcaGetLibraryVersion();
}

#endif  // LIBTLCA_LIBVERSIONINFO_HPP_

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
 * Customizations of TCLAP for the TLCA command line tools.
 */

#ifndef TLCA_TCLAPUTILS_HPP_
#define TLCA_TCLAPUTILS_HPP_

#include <tclap/StdOutput.h>
#include <string>
#include <iostream>

#include "tlca/LibVersionInfo.hpp"

namespace TCLAP 
{

	/**
	 * @brief Modifies the standard behavior of TCLAP to output a better version notice
	 * @details The version notice includes the version of TLCA, the build variant,
	 *          and the versions of the libraries it was built against.
	 */
	class CustomOutput : public StdOutput
	{
	public:

		CustomOutput(const std::string& progName) : _progName(progName) { }

		virtual void version(CmdLineInterface& c)
		{
			const tlca::BuildInfo& info = tlca::getBuildInfo();
			std::cout << "This is " << _progName << " version " << info.version << "\n";
			std::cout << "Build variant " << info.buildType << " (" << info.compiler << ")\n";
			std::cout << "Dependencies: " << info.dependencies << "\n";
			std::cout << "See the accompanying LICENSE.txt and AUTHORS.md files" << std::endl;
		}

	protected:
		std::string _progName;
	};

}

#endif  // TLCA_TCLAPUTILS_HPP_

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

#include "tlca/tlca.hpp"
#include "common/JsonParameterProvider.hpp"
#include "common/Driver.hpp"

#include <tclap/CmdLine.h>
#include "common/TclapUtils.hpp"
#include "SignalHandler.hpp"

#include "Logging.hpp"

#include <iostream>
#include <iomanip>
#include <memory>
#include <algorithm>
#include <stdexcept>

#ifndef TLCA_LOGGING_DISABLE
	template <>
	tlca::LogLevel tlca::log::RuntimeFilteringLogger<tlca::log::GlobalLogger>::_minLvl = tlca::LogLevel::Warning;
#endif

namespace
{
	enum ExitCode : int
	{
		Success = 0,
		UsageError = 1,
		ConfigurationError = 2,
		ComputationError = 3,
		Interrupted = 4
	};

	/**
	 * @brief Forwards library log messages to the console
	 */
	class ConsoleLogReceiver : public tlca::ILogReceiver
	{
	public:
		virtual void message(const char* file, const char* func, unsigned int line, tlca::LogLevel lvl, const char* message)
		{
			std::ostream& os = (lvl <= tlca::LogLevel::Warning) ? std::cerr : std::cout;
			os << "libtlca " << tlca::to_string(lvl) << " [" << func << ':' << line << "]: " << message << std::flush;
		}
	};

	/**
	 * @brief Stops a Monte Carlo run on user interrupt and optionally reports progress
	 */
	class CliNotifier : public tlca::INotificationCallback
	{
	public:
		CliNotifier(bool showProgress) : _showProgress(showProgress), _lastPercent(-1) { }
		virtual ~CliNotifier() TLCA_NOEXCEPT { }

		virtual void monteCarloStart(uint64_t nSamples)
		{
			_lastPercent = -1;
			if (_showProgress)
				std::cerr << "Drawing " << nSamples << " samples" << std::endl;
		}

		virtual void monteCarloEnd(bool cancelled)
		{
			if (_showProgress)
				std::cerr << std::endl;
			if (cancelled)
				LOG(Warning) << "Sampling interrupted, statistics cover the collected samples only";
		}

		virtual bool sampleCompleted(uint64_t sampleIndex, bool success, uint64_t nCollected, uint64_t nSamples)
		{
			if (_showProgress)
			{
				const int percent = static_cast<int>((100 * nCollected) / std::max<uint64_t>(nSamples, 1));
				if (percent != _lastPercent)
				{
					std::cerr << "\r" << std::setw(3) << percent << "% (" << nCollected << " of " << nSamples << ")" << std::flush;
					_lastPercent = percent;
				}
			}
			return !tlca::interruptRequested();
		}

	private:
		bool _showProgress;
		int _lastPercent;
	};

	void runFile(const std::string& inFileName, const std::string& outFileName, tlca::RunMode mode, bool showProgress)
	{
		tlca::JsonParameterProvider pp = tlca::JsonParameterProvider::fromFile(inFileName);

		// Configurations may be nested in an input group next to earlier output
		tlca::Driver drv;
		if (pp.exists("input"))
		{
			pp.pushScope("input");
			drv.configure(pp);
			pp.popScope();
		}
		else
			drv.configure(pp);

		CliNotifier notifier(showProgress);
		drv.setNotificationCallback(&notifier);

		LOG(Info) << "Running " << tlca::to_string(mode) << " computation of " << inFileName;
		drv.run(mode);

		if (inFileName == outFileName)
		{
			drv.write(pp);
			pp.toFile(outFileName);
		}
		else
		{
			tlca::JsonParameterProvider writer("{}");
			drv.write(writer);
			writer.toFile(outFileName);
		}

		LOG(Info) << "Results written to " << outFileName;
	}
}

int main(int argc, char** argv)
{
	if (!tlca::installInterruptHandler())
		LOG(Warning) << "Could not install interrupt handler, Monte Carlo runs cannot be stopped gracefully";

	std::string inFileName;
	std::string outFileName;
	std::string modeName;
	std::string logLevelName;
	bool showProgress = false;

	try
	{
		TCLAP::CustomOutput customOut("tlca-cli");
		TCLAP::CmdLine cmd("Computes static, dynamic, and stochastic life cycle inventories", ' ', tlca::getLibraryVersion());
		cmd.setOutput(&customOut);

		std::vector<std::string> modes = {"static", "dynamic", "montecarlo"};
		TCLAP::ValuesConstraint<std::string> modeConstraint(modes);

		std::vector<std::string> levels = {"None", "Fatal", "Error", "Warning", "Normal", "Info", "Debug", "Trace"};
		TCLAP::ValuesConstraint<std::string> levelConstraint(levels);

		cmd >> (new TCLAP::SwitchArg("", "progress", "Show Monte Carlo progress"))->storeIn(&showProgress);
		cmd >> (new TCLAP::ValueArg<std::string>("L", "loglevel", "Set the log level", false, "Warning", &levelConstraint))->storeIn(&logLevelName);
		cmd >> (new TCLAP::ValueArg<std::string>("m", "mode", "Computation to perform", false, "static", &modeConstraint))->storeIn(&modeName);
		cmd >> (new TCLAP::UnlabeledValueArg<std::string>("input", "Configuration file (JSON)", true, "", "File"))->storeIn(&inFileName);
		cmd >> (new TCLAP::UnlabeledValueArg<std::string>("output", "Result file, results are added to the input file if omitted", false, "", "File"))->storeIn(&outFileName);

		cmd.parse(argc, argv);
	}
	catch (const TCLAP::ArgException& e)
	{
		std::cerr << "ERROR: " << e.error() << " for argument " << e.argId() << std::endl;
		return ExitCode::UsageError;
	}

	if (outFileName.empty())
		outFileName = inFileName;

	const tlca::LogLevel logLevel = tlca::to_loglevel(logLevelName);
	ConsoleLogReceiver receiver;
	tlca::setLogReceiver(&receiver);
	tlca::setLogLevel(logLevel);
#ifndef TLCA_LOGGING_DISABLE
	tlca::log::RuntimeFilteringLogger<tlca::log::GlobalLogger>::level(logLevel);
#endif

	int exitCode = ExitCode::Success;
	try
	{
		runFile(inFileName, outFileName, tlca::toRunMode(modeName), showProgress);
		if (tlca::interruptRequested())
			exitCode = ExitCode::Interrupted;
	}
	catch (const tlca::InvalidParameterException& e)
	{
		// Also covers malformed temporal distributions and unknown node ids
		std::cerr << "CONFIGURATION ERROR: " << e.what() << std::endl;
		exitCode = ExitCode::ConfigurationError;
	}
	catch (const std::runtime_error& e)
	{
		std::cerr << "COMPUTATION ERROR: " << e.what() << std::endl;
		exitCode = ExitCode::ComputationError;
	}
	catch (const std::exception& e)
	{
		std::cerr << "ERROR: " << e.what() << std::endl;
		exitCode = ExitCode::UsageError;
	}

	tlca::setLogReceiver(nullptr);
	return exitCode;
}

/////////////////////////////////////////////////////////////////////////////
// Copyright (C) 2024 William C Bonner
//
//	MIT License
//
//	Permission is hereby granted, free of charge, to any person obtaining a copy
//	of this software and associated documentation files(the "Software"), to deal
//	in the Software without restriction, including without limitation the rights
//	to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
//	copies of the Software, and to permit persons to whom the Software is
//	furnished to do so, subject to the following conditions :
//
//	The above copyright notice and this permission notice shall be included in all
//	copies or substantial portions of the Software.
//
//	THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
//	IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
//	FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.IN NO EVENT SHALL THE
//	AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
//	LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
//	OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
//	SOFTWARE.
//
/////////////////////////////////////////////////////////////////////////////

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include "btmonitor.h"
#include "btmonitor-log.h"
#include "btmonitor-system.h"

/////////////////////////////////////////////////////////////////////////////
volatile bool bRun = true; // This is declared volatile so that the compiler won't optimized it out of loops later in the code
void SignalHandlerSIGINT(int signal)
{
	bRun = false;
	std::cerr << "***************** SIGINT: Caught Ctrl-C, finishing loop and quitting. *****************" << std::endl;
}
void SignalHandlerSIGHUP(int signal)
{
	bRun = false;
	std::cerr << "***************** SIGHUP: Caught HangUp, finishing loop and quitting. *****************" << std::endl;
}
/////////////////////////////////////////////////////////////////////////////
bool AskForLimitedRecovery(MonitorLog& Log, std::istream& Input, const bool Interactive)
{
	Log.Warning("Some recovery actions require root privileges.");
	Log.Info("You can either:");
	Log.Info("  1. Run this program with sudo for full recovery capabilities");
	Log.Info("  2. Continue with limited recovery options");
	if (!Interactive)
	{
		Log.Info("No terminal to ask, continuing with limited recovery options");
		return(true);
	}
	std::cout << "Try limited recovery actions? (y/n): " << std::flush;
	std::string Choice;
	if (!std::getline(Input, Choice))
		return(false);
	Choice = TrimWhitespace(Choice);
	return((Choice == "y") || (Choice == "Y"));
}
/////////////////////////////////////////////////////////////////////////////
int RunMonitorLoop(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, std::istream& Input, const bool Interactive)
{
	int ExitValue = EXIT_SUCCESS;
	unsigned long RunCount = 0;
	while (bRun)
	{
		RunCount++;
		if (RunCount > 1)
			Log.Info("=== Starting check #" + std::to_string(RunCount) + " ===");
		HealthReport Report(EvaluateHealth(System, Config, Log));
		bool bHealthy = Report.IsHealthy();
		if (!bHealthy)
		{
			Log.Warning("Bluetooth issues detected in check #" + std::to_string(RunCount));
			if (Config.AutoRecovery)
			{
				Log.Info("Starting automatic recovery...");
				if (!CanElevate(System) && !AskForLimitedRecovery(Log, Input, Interactive))
				{
					Log.Info("Recovery aborted by user");
					return(EXIT_FAILURE);
				}
				if (RunRecoveryLadder(System, Config, Log, Report).Success())
				{
					Log.Info("Automatic recovery completed successfully");
					System.Sleep(3);
					if (EvaluateHealth(System, Config, Log).IsHealthy())
					{
						Log.Info("Recovery successfully resolved the issues");
						bHealthy = true;
					}
					else
						Log.Warning("Recovery completed but issues persist");
				}
				else
					Log.Error("Automatic recovery failed");
			}
			else
				Log.Info("Automatic recovery is disabled");
		}
		if (Config.RunOnce)
		{
			Log.Info("Single check completed, exiting");
			ExitValue = bHealthy ? EXIT_SUCCESS : EXIT_FAILURE;
			break;
		}
		Log.Verbose("Check #" + std::to_string(RunCount) + " completed, sleeping for " + std::to_string(Config.CheckInterval) + " seconds...");
		for (auto Slept = 0; bRun && (Slept < Config.CheckInterval); Slept++)
			System.Sleep(1);
	}
	if (!bRun)
		Log.Info("Bluetooth monitoring service terminated");
	return(ExitValue);
}
/////////////////////////////////////////////////////////////////////////////
int RunOperation(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, std::istream& Input, const bool Interactive)
{
	switch (Config.Mode)
	{
	case OperationMode::DetectOnly:
	{
		CheckResult Hardware(CheckHardware(System, Config, Log));
		std::cout << Hardware.Detail << std::endl;
		return(Hardware.IsOK() ? EXIT_SUCCESS : EXIT_FAILURE);
	}
	case OperationMode::CheckService:
		return(CheckService(System, Config, Log).IsOK() ? EXIT_SUCCESS : EXIT_FAILURE);
	case OperationMode::RestartService:
		return(RecoveryRestartService(System, Config, Log) ? EXIT_SUCCESS : EXIT_FAILURE);
	case OperationMode::PowerManagement:
		std::cout << "Configuring power management settings..." << std::endl;
		Log.Info("Power control: configuring settings");
		return(RecoveryFixPowerManagement(System, Config, Log) ? EXIT_SUCCESS : EXIT_FAILURE);
	case OperationMode::CheckState:
	{
		HealthReport Report(EvaluateHealth(System, Config, Log));
		std::cout << Report.StatusLine() << std::endl;
		return(Report.IsHealthy() ? EXIT_SUCCESS : EXIT_FAILURE);
	}
	case OperationMode::Recovery:
		std::cout << "Starting USB and service recovery..." << std::endl;
		return(RunRecoverySubset(System, Config, Log).Success() ? EXIT_SUCCESS : EXIT_FAILURE);
	case OperationMode::FullRecovery:
	{
		HealthReport Report;
		Report.BCMResetDetected = DetectBCMResetFailure(System, Config, Log);
		return(RunRecoveryLadder(System, Config, Log, Report).Success() ? EXIT_SUCCESS : EXIT_FAILURE);
	}
	case OperationMode::Monitor:
		break;
	}
	return(RunMonitorLoop(System, Config, Log, Input, Interactive));
}

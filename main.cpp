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

/////////////////////////////////////////////////////////////////////////////
// btmonitor watches the local Bluetooth adapter (the Apple/Broadcom 05ac:8294
// controller in older MacBooks was the reason it exists), detects missing
// kernel modules, absent hardware, a dead bluetooth service or a controller
// that stopped answering, and works through a fixed list of recovery steps.
/////////////////////////////////////////////////////////////////////////////

#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <unistd.h>
#include "btmonitor.h"
#include "btmonitor-log.h"
#include "btmonitor-options.h"
#include "btmonitor-system.h"

int main(int argc, char **argv)
{
	MonitorConfig Config;
	switch (ParseCommandLine(argc, argv, Config, std::cout, std::cerr))
	{
	case ParseOutcome::ExitSuccess:
		exit(EXIT_SUCCESS);
	case ParseOutcome::ExitFailure:
		exit(EXIT_FAILURE);
	case ParseOutcome::Run:
		break;
	}
	///////////////////////////////////////////////////////////////////////////////////////////////
	if (!PrepareLogDirectory(Config.LogDirectory))
	{
		std::cerr << "ERROR: Failed to create log directory at " << Config.LogDirectory << std::endl;
		exit(EXIT_FAILURE);
	}
	tzset();
	MonitorLog Log(Config);
	if (Config.ConsoleVerbosity > 0)
	{
		std::cout << "[" << getTimeISO8601(true) << "] " << ProgramVersionString << std::endl;
		if (Config.ConsoleVerbosity > 1)
		{
			std::cout << "[                   ]      log: " << Config.LogDirectory << std::endl;
			std::cout << "[                   ] interval: " << Config.CheckInterval << std::endl;
			std::cout << "[                   ] recovery: " << std::boolalpha << Config.AutoRecovery << std::endl;
			std::cout << "[                   ]     once: " << std::boolalpha << Config.RunOnce << std::endl;
			std::cout << "[                   ]     mode: " << OperationMode2String(Config.Mode) << std::endl;
		}
	}
	else
		std::cerr << ProgramVersionString << " (starting)" << std::endl;
	if (Config.Mode == OperationMode::Monitor)
	{
		Log.Info("===== Bluetooth Monitor =====");
		Log.Info("Starting Bluetooth monitoring with interval: " + std::to_string(Config.CheckInterval) + "s");
		Log.Info(std::string("Auto-recovery: ") + (Config.AutoRecovery ? "true" : "false"));
		Log.Info("Log directory: " + Config.LogDirectory.string());
	}
	///////////////////////////////////////////////////////////////////////////////////////////////
	auto previousHandlerSIGINT = std::signal(SIGINT, SignalHandlerSIGINT);	// Install CTR-C signal handler
	auto previousHandlerSIGHUP = std::signal(SIGHUP, SignalHandlerSIGHUP);	// Install Hangup signal handler
	auto previousHandlerSIGPIPE = std::signal(SIGPIPE, SIG_IGN);	// a child that exits early must not kill us while we feed its stdin
	LinuxSystem System;
	int ExitValue = RunOperation(System, Config, Log, std::cin, isatty(STDIN_FILENO) == 1);
	std::signal(SIGPIPE, previousHandlerSIGPIPE);
	std::signal(SIGHUP, previousHandlerSIGHUP);	// Restore original Hangup signal handler
	std::signal(SIGINT, previousHandlerSIGINT);	// Restore original Ctrl-C signal handler
	///////////////////////////////////////////////////////////////////////////////////////////////
	if (Config.ConsoleVerbosity < 1)
		std::cerr << ProgramVersionString << " (exiting)" << std::endl;
	return(ExitValue);
}

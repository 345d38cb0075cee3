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

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "btmonitor.h"
#include "btmonitor-options.h"
#include "btmonitor-system.h"

/////////////////////////////////////////////////////////////////////////////
#if __has_include("btmonitor-version.h")
#include "btmonitor-version.h"
#endif
#ifndef BTMonitor_VERSION
#define BTMonitor_VERSION "(non-CMake)"
#endif // !BTMonitor_VERSION
/////////////////////////////////////////////////////////////////////////////
const std::string ProgramVersionString("BTMonitor Version " BTMonitor_VERSION " Built on: " __DATE__ " at " __TIME__);
/////////////////////////////////////////////////////////////////////////////
std::string OperationMode2String(const OperationMode Mode)
{
	switch (Mode)
	{
	case OperationMode::Monitor:
		return(std::string("monitor"));
	case OperationMode::DetectOnly:
		return(std::string("detect-only"));
	case OperationMode::CheckService:
		return(std::string("check-service"));
	case OperationMode::RestartService:
		return(std::string("restart-service"));
	case OperationMode::PowerManagement:
		return(std::string("power-management"));
	case OperationMode::CheckState:
		return(std::string("check-state"));
	case OperationMode::Recovery:
		return(std::string("recovery"));
	case OperationMode::FullRecovery:
		return(std::string("full-recovery"));
	}
	return(std::string("unknown"));
}
std::filesystem::path DefaultLogDirectory(void)
{
	const char* Home = getenv("HOME");
	if ((Home == nullptr) || (*Home == 0))
		return(std::filesystem::path("/var/log/bluetooth-monitor"));
	return(std::filesystem::path(Home) / "system-management" / "monitoring" / "logs");
}
MonitorConfig::MonitorConfig() :
	LogDirectory(DefaultLogDirectory()),
	CheckInterval(60),
	AutoRecovery(true),
	RunOnce(false),
	ConsoleVerbosity(1),
	Mode(OperationMode::Monitor),
	SysClassBluetooth("/sys/class/bluetooth"),
	SysBusUSBDevices("/sys/bus/usb/devices"),
	FirmwareRoot("/lib/firmware"),
	BroadcomFirmwareDirectory("/lib/firmware/brcm"),
	UdevRulesFile("/etc/udev/rules.d/10-bluetooth-power.rules"),
	ServiceUnit("bluetooth"),
	ServiceDaemon("bluetoothd"),
	StackModule("bluetooth"),
	TransportModule("btusb"),
	BroadcomUSBID("05ac:8294"),
	KnownUSBIDs({
		"05ac:8294", // Apple Bluetooth USB Host Controller
		"05ac:8290", // Apple Bluetooth Host Controller
		"0a5c:21e8", // Broadcom Bluetooth Controller
		"0a5c:21e6", // Broadcom Bluetooth USB device
		"0a12:",     // Cambridge Silicon Radio
		"8087:",     // Intel
		"0489:",     // Foxconn / Hon Hai
		"0b05:",     // ASUSTek
		"413c:",     // Dell
		}),
	FunctionalityTimeout(5)
{
}
/////////////////////////////////////////////////////////////////////////////
static bool ParseInterval(const std::string& Text, int& Interval, std::ostream& Errors)
{
	if (Text.empty() || !std::all_of(Text.begin(), Text.end(), [](unsigned char c) { return(std::isdigit(c)); }))
	{
		Errors << "Interval must be a positive number" << std::endl;
		return(false);
	}
	try { Interval = std::stoi(Text); }
	catch (const std::invalid_argument& ia) { Errors << "Invalid argument: " << ia.what() << std::endl; return(false); }
	catch (const std::out_of_range& oor) { Errors << "Out of Range error: " << oor.what() << std::endl; return(false); }
	if (Interval < 1)
	{
		Errors << "Interval must be a positive number" << std::endl;
		return(false);
	}
	return(true);
}
static bool ParseBoolean(const std::string& Text, bool& Value)
{
	const std::string Lower(ToLower(Text));
	if ((Lower == "true") || (Lower == "1") || (Lower == "yes"))
		Value = true;
	else if ((Lower == "false") || (Lower == "0") || (Lower == "no"))
		Value = false;
	else
		return(false);
	return(true);
}
static std::filesystem::path CleanDirectoryName(const std::string& Text)
{
	std::filesystem::path TempPath(Text);
	while (TempPath.filename().empty() && (TempPath != TempPath.root_directory())) // This gets rid of the "/" on the end of the path
		TempPath = TempPath.parent_path();
	return(TempPath);
}
/////////////////////////////////////////////////////////////////////////////
bool ReadConfigFile(const std::filesystem::path& FileName, MonitorConfig& Config, std::ostream& Errors)
{
	std::ifstream TheFile(FileName);
	if (!TheFile.is_open())
	{
		Errors << "Cannot open configuration file " << FileName << std::endl;
		return(false);
	}
	bool rval = true;
	int LineNumber = 0;
	std::string TheLine;
	while (std::getline(TheFile, TheLine))
	{
		LineNumber++;
		TheLine = TrimWhitespace(TheLine);
		if (TheLine.empty() || (TheLine[0] == '#'))
			continue;
		const auto Equals(TheLine.find('='));
		if (Equals == std::string::npos)
		{
			Errors << FileName.string() << ":" << LineNumber << ": expected KEY=VALUE" << std::endl;
			rval = false;
			continue;
		}
		const std::string Key(TrimWhitespace(TheLine.substr(0, Equals)));
		std::string Value(TrimWhitespace(TheLine.substr(Equals + 1)));
		if ((Value.length() > 1) && ((Value.front() == '"') || (Value.front() == '\'')) && (Value.back() == Value.front()))
			Value = Value.substr(1, Value.length() - 2);
		if (Key == "VERBOSE")
		{
			bool bVerbose = false;
			if (ParseBoolean(Value, bVerbose))
				Config.ConsoleVerbosity = bVerbose ? 2 : 1;
			else
			{
				Errors << FileName.string() << ":" << LineNumber << ": VERBOSE must be 'true' or 'false'" << std::endl;
				rval = false;
			}
		}
		else if (Key == "CHECK_INTERVAL")
		{
			if (!ParseInterval(Value, Config.CheckInterval, Errors))
				rval = false;
		}
		else if (Key == "AUTO_RECOVERY")
		{
			if (!ParseBoolean(Value, Config.AutoRecovery))
			{
				Errors << FileName.string() << ":" << LineNumber << ": AUTO_RECOVERY must be 'true' or 'false'" << std::endl;
				rval = false;
			}
		}
		else if (Key == "LOG_DIR")
		{
			const char* Home = getenv("HOME");
			if ((Value.compare(0, 5, "$HOME") == 0) && (Home != nullptr))
				Value.replace(0, 5, Home);
			else if ((Value.compare(0, 1, "~") == 0) && (Home != nullptr))
				Value.replace(0, 1, Home);
			Config.LogDirectory = CleanDirectoryName(Value);
		}
		else
			Errors << "Warning: unknown configuration key " << Key << " in " << FileName.string() << ":" << LineNumber << std::endl;
	}
	TheFile.close();
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
void PrintUsage(const std::string& ProgramName, const MonitorConfig& Config, std::ostream& Output)
{
	Output << "Usage: " << ProgramName << " [options]" << std::endl;
	Output << "  " << ProgramVersionString << std::endl;
	Output << "  Monitors the local Bluetooth adapter and recovers it when it fails." << std::endl;
	Output << "  Options:" << std::endl;
	Output << "    -h | --help                Print this message" << std::endl;
	Output << "    -V | --version             Print version information" << std::endl;
	Output << "    -v | --verbose             Verbose console output" << std::endl;
	Output << "    -o | --once                Run a single check and exit" << std::endl;
	Output << "    -i | --interval seconds    Time between checks [" << Config.CheckInterval << "]" << std::endl;
	Output << "    -r | --auto-recovery true|false Attempt recovery when issues are found [" << std::boolalpha << Config.AutoRecovery << "]" << std::endl;
	Output << "    -l | --log-dir name        Logging Directory [" << Config.LogDirectory.string() << "]" << std::endl;
	Output << "    -c | --config name         Read KEY=VALUE settings from this file" << std::endl;
	Output << "  Operation modes:" << std::endl;
	Output << "    --detect-only              Only detect Bluetooth hardware and exit" << std::endl;
	Output << "    --check-service            Check Bluetooth service status and exit" << std::endl;
	Output << "    --restart-service          Restart the Bluetooth service and exit" << std::endl;
	Output << "    --power-management         Fix USB power management and exit" << std::endl;
	Output << "    --check-state              Run all checks once and exit" << std::endl;
	Output << "    --recovery                 Power management, USB reset and service restart, then exit" << std::endl;
	Output << "    --full-recovery            Perform all recovery actions and exit" << std::endl;
	Output << std::endl;
}
void PrintVersion(std::ostream& Output)
{
	Output << "Bluetooth Monitor version " << BTMonitor_VERSION << std::endl;
	Output << ProgramVersionString << std::endl;
	Output << "License: MIT" << std::endl;
}
/////////////////////////////////////////////////////////////////////////////
enum LongOnlyOptions
{
	OPTION_DETECT_ONLY = 256,
	OPTION_CHECK_SERVICE,
	OPTION_RESTART_SERVICE,
	OPTION_POWER_MANAGEMENT,
	OPTION_CHECK_STATE,
	OPTION_RECOVERY,
	OPTION_FULL_RECOVERY,
};
static const char short_options[] = ":hVvoi:r:l:c:";
static const struct option long_options[] = {
		{ "help",   no_argument,       NULL, 'h' },
		{ "version",no_argument,       NULL, 'V' },
		{ "verbose",no_argument,       NULL, 'v' },
		{ "once",   no_argument,       NULL, 'o' },
		{ "interval",required_argument,NULL, 'i' },
		{ "auto-recovery",required_argument, NULL, 'r' },
		{ "log-dir",required_argument, NULL, 'l' },
		{ "config", required_argument, NULL, 'c' },
		{ "detect-only",     no_argument, NULL, OPTION_DETECT_ONLY },
		{ "check-service",   no_argument, NULL, OPTION_CHECK_SERVICE },
		{ "restart-service", no_argument, NULL, OPTION_RESTART_SERVICE },
		{ "power-management",no_argument, NULL, OPTION_POWER_MANAGEMENT },
		{ "check-state",     no_argument, NULL, OPTION_CHECK_STATE },
		{ "recovery",        no_argument, NULL, OPTION_RECOVERY },
		{ "full-recovery",   no_argument, NULL, OPTION_FULL_RECOVERY },
		{ 0, 0, 0, 0 }
};
static bool SelectMode(MonitorConfig& Config, const OperationMode Mode, std::ostream& Errors)
{
	if ((Config.Mode != OperationMode::Monitor) && (Config.Mode != Mode))
	{
		Errors << "Only one operation mode may be given (--" << OperationMode2String(Config.Mode) << " and --" << OperationMode2String(Mode) << ")" << std::endl;
		return(false);
	}
	Config.Mode = Mode;
	Config.RunOnce = true;
	return(true);
}
ParseOutcome ParseCommandLine(int argc, char** argv, MonitorConfig& Config, std::ostream& Output, std::ostream& Errors)
{
	const std::string ProgramName((argc > 0) ? argv[0] : "btmonitor");
	optind = 0;	// glibc: full reinitialization, so the parser can run more than once per process
	opterr = 0;	// we print our own message for unknown options
	for (;;)
	{
		int idx;
		int c = getopt_long(argc, argv, short_options, long_options, &idx);
		if (-1 == c)
			break;
		switch (c)
		{
		case 0: /* getopt_long() flag */
			break;
		case 'h':	// --help
			PrintUsage(ProgramName, Config, Output);
			return(ParseOutcome::ExitSuccess);
		case 'V':	// --version
			PrintVersion(Output);
			return(ParseOutcome::ExitSuccess);
		case 'v':	// --verbose
			Config.ConsoleVerbosity = 2;
			break;
		case 'o':	// --once
			Config.RunOnce = true;
			break;
		case 'i':	// --interval
			if (!ParseInterval(optarg, Config.CheckInterval, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case 'r':	// --auto-recovery
			if (std::string(optarg) == "true")
				Config.AutoRecovery = true;
			else if (std::string(optarg) == "false")
				Config.AutoRecovery = false;
			else
			{
				Errors << "Recovery option must be 'true' or 'false'" << std::endl;
				return(ParseOutcome::ExitFailure);
			}
			break;
		case 'l':	// --log-dir
			Config.LogDirectory = CleanDirectoryName(optarg);
			break;
		case 'c':	// --config
			if (!ReadConfigFile(optarg, Config, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_DETECT_ONLY:
			if (!SelectMode(Config, OperationMode::DetectOnly, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_CHECK_SERVICE:
			if (!SelectMode(Config, OperationMode::CheckService, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_RESTART_SERVICE:
			if (!SelectMode(Config, OperationMode::RestartService, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_POWER_MANAGEMENT:
			if (!SelectMode(Config, OperationMode::PowerManagement, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_CHECK_STATE:
			if (!SelectMode(Config, OperationMode::CheckState, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_RECOVERY:
			if (!SelectMode(Config, OperationMode::Recovery, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case OPTION_FULL_RECOVERY:
			if (!SelectMode(Config, OperationMode::FullRecovery, Errors))
				return(ParseOutcome::ExitFailure);
			break;
		case ':':
			Errors << "Option " << ((optopt != 0) ? std::string("-") + char(optopt) : std::string(argv[optind - 1])) << " requires an argument" << std::endl;
			PrintUsage(ProgramName, Config, Errors);
			return(ParseOutcome::ExitFailure);
		case '?':
		default:
			Errors << "Unknown option: " << ((optopt != 0) ? std::string("-") + char(optopt) : std::string(argv[optind - 1])) << std::endl;
			PrintUsage(ProgramName, Config, Errors);
			return(ParseOutcome::ExitFailure);
		}
	}
	if (optind < argc)
	{
		Errors << "Unknown option: " << argv[optind] << std::endl;
		PrintUsage(ProgramName, Config, Errors);
		return(ParseOutcome::ExitFailure);
	}
	return(ParseOutcome::Run);
}

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
#include <filesystem>
#include <iostream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>
#include "btmonitor.h"
#include "btmonitor-log.h"
#include "btmonitor-system.h"

/////////////////////////////////////////////////////////////////////////////
std::string CheckName2String(const CheckName Name)
{
	switch (Name)
	{
	case CheckName::Modules:
		return(std::string("MODULES"));
	case CheckName::Hardware:
		return(std::string("HARDWARE"));
	case CheckName::Service:
		return(std::string("SERVICE"));
	case CheckName::Functionality:
		return(std::string("FUNCTIONALITY"));
	}
	return(std::string("UNKNOWN"));
}
std::string CheckStatus2String(const CheckStatus Status)
{
	switch (Status)
	{
	case CheckStatus::OK:
		return(std::string("OK"));
	case CheckStatus::Fail:
		return(std::string("FAIL"));
	case CheckStatus::Unknown:
		return(std::string("UNKNOWN"));
	}
	return(std::string("UNKNOWN"));
}
std::string CheckResult::WriteTXT(void) const
{
	return(CheckName2String(Name) + ":" + CheckStatus2String(Status));
}
/////////////////////////////////////////////////////////////////////////////
void HealthReport::Add(const CheckResult& Result)
{
	Checks.push_back(Result);
	if (Result.IsFail())
		RecoveryNeeded = true;
}
const CheckResult* HealthReport::Find(const CheckName Name) const
{
	for (auto& Check : Checks)
		if (Check.Name == Name)
			return(&Check);
	return(nullptr);
}
std::string HealthReport::StatusLine(void) const
{
	std::ostringstream ssValue;
	for (auto it = Checks.begin(); it != Checks.end(); ++it)
	{
		if (it != Checks.begin())
			ssValue << " ";
		ssValue << it->WriteTXT();
	}
	return(ssValue.str());
}
bool HealthReport::operator ==(const HealthReport& b) const
{
	if ((RecoveryNeeded != b.RecoveryNeeded) || (BCMResetDetected != b.BCMResetDetected) || (FirmwarePresent != b.FirmwarePresent))
		return(false);
	if (Checks.size() != b.Checks.size())
		return(false);
	for (size_t index = 0; index < Checks.size(); index++)
		if ((Checks[index].Name != b.Checks[index].Name) || (Checks[index].Status != b.Checks[index].Status))
			return(false);
	return(true);
}
/////////////////////////////////////////////////////////////////////////////
std::string RecoveryActionType2String(const RecoveryActionType Type)
{
	switch (Type)
	{
	case RecoveryActionType::BCMFix:
		return(std::string("BCM reset fix"));
	case RecoveryActionType::PowerManagement:
		return(std::string("Power management fix"));
	case RecoveryActionType::USBReset:
		return(std::string("USB reset"));
	case RecoveryActionType::ServiceRestart:
		return(std::string("Service restart"));
	case RecoveryActionType::ModuleReload:
		return(std::string("Module reload"));
	}
	return(std::string("Unknown action"));
}
void RecoverySummary::Record(const RecoveryActionType Type, const bool Success)
{
	Outcomes.push_back(RecoveryAction(Type, Success));
	Attempted++;
	if (Success)
		Succeeded++;
}
bool RecoverySummary::Contains(const RecoveryActionType Type) const
{
	return(std::any_of(Outcomes.begin(), Outcomes.end(), [Type](const RecoveryAction& Action) { return(Action.Type == Type); }));
}
std::string RecoverySummary::WriteTXT(void) const
{
	std::ostringstream ssValue;
	ssValue << "Recovery Sequence Summary:" << std::endl;
	for (auto& Action : Outcomes)
		ssValue << "  - " << RecoveryActionType2String(Action.Type) << ": " << (Action.Success ? "SUCCESS" : "FAILED") << std::endl;
	ssValue << "Summary: " << Succeeded << " out of " << Attempted << " actions succeeded";
	return(ssValue.str());
}
/////////////////////////////////////////////////////////////////////////////
CheckResult CheckModules(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Verbose("Checking Bluetooth kernel modules...");
	const bool StackLoaded = System.IsModuleLoaded(Config.StackModule);
	if (StackLoaded)
		Log.Verbose("Bluetooth kernel module (" + Config.StackModule + ") is loaded");
	bool TransportLoaded = System.IsModuleLoaded(Config.TransportModule);
	if (TransportLoaded)
		Log.Verbose("Bluetooth USB driver (" + Config.TransportModule + ") is loaded");

	// A driver compiled into the kernel never shows up as a module, but is still bound to the controller
	for (auto& Controller : System.ListDirectory(Config.SysClassBluetooth))
	{
		std::string UEvent;
		if (System.ReadFile(Controller / "device" / "uevent", UEvent))
			if (UEvent.find("DRIVER=" + Config.TransportModule) != std::string::npos)
			{
				Log.Verbose("Bluetooth USB driver (" + Config.TransportModule + ") is in use by " + Controller.filename().string());
				TransportLoaded = true;
			}
	}

	CheckResult rval(CheckName::Modules, CheckStatus::Fail);
	if (StackLoaded && TransportLoaded)
	{
		rval.Status = CheckStatus::OK;
		rval.Detail = "Both Bluetooth modules are properly loaded";
		Log.Info("Bluetooth kernel modules are properly loaded");
	}
	else
	{
		if (!StackLoaded && !TransportLoaded)
			rval.Detail = "Neither " + Config.StackModule + " nor " + Config.TransportModule + " modules are loaded";
		else if (StackLoaded)
			rval.Detail = Config.StackModule + " module is loaded but " + Config.TransportModule + " driver is not";
		else
			rval.Detail = Config.TransportModule + " driver is loaded but " + Config.StackModule + " module is not";
		Log.Warning(rval.Detail);
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
bool ScanUSBForBluetooth(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, std::vector<std::string>& Devices)
{
	Log.Verbose("Scanning for Bluetooth devices using lsusb...");
	Devices.clear();
	if (!System.CommandExists("lsusb"))
	{
		Log.Verbose("lsusb command not found, cannot scan USB devices");
		return(false);
	}
	CommandResult USBList(System.Run({ "lsusb" }));
	std::istringstream TheLines(USBList.Output);
	std::string TheLine;
	while (std::getline(TheLines, TheLine))
	{
		if (TrimWhitespace(TheLine).empty())
			continue;
		bool bKnown = false;
		for (auto& ID : Config.KnownUSBIDs)
			if (ContainsNoCase(TheLine, ID))
			{
				bKnown = true;
				break;
			}
		if (bKnown)
		{
			Devices.push_back(TheLine);
			Log.Verbose("Found potential Bluetooth device: " + TheLine);
		}
		else if (ContainsNoCase(TheLine, "bluetooth"))
		{
			Devices.push_back(TheLine);
			Log.Verbose("Found Bluetooth device by name: " + TheLine);
		}
	}
	if (Devices.empty())
	{
		Log.Verbose("No Bluetooth USB devices found with lsusb");
		return(false);
	}
	Log.Verbose("Found " + std::to_string(Devices.size()) + " Bluetooth USB devices");
	return(true);
}
/////////////////////////////////////////////////////////////////////////////
CheckResult CheckHardware(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Verbose("Checking Bluetooth hardware presence...");
	bool bFound = false;

	// First: controllers the kernel registered in sysfs
	auto Controllers(System.ListDirectory(Config.SysClassBluetooth));
	if (!Controllers.empty())
	{
		Log.Verbose("Found Bluetooth controllers in sysfs:");
		for (auto& Controller : Controllers)
		{
			bFound = true;
			const std::string ControllerName(Controller.filename().string());
			std::string UEvent;
			if (System.ReadFile(Controller / "device" / "uevent", UEvent))
			{
				std::replace(UEvent.begin(), UEvent.end(), '\n', ' ');
				Log.Verbose("  - " + ControllerName + ": USB device information: " + UEvent);
			}
			else
				Log.Verbose("  - " + ControllerName + ": No USB device information available");
			// the interface's parent is the USB device that carries the power attributes
			std::filesystem::path Interface(System.Canonical(Controller / "device"));
			if (!Interface.empty() && System.IsDirectory(Interface.parent_path() / "power"))
			{
				std::string PowerControl;
				std::string PowerStatus;
				if (!System.ReadFile(Interface.parent_path() / "power" / "control", PowerControl))
					PowerControl = "Unknown";
				if (!System.ReadFile(Interface.parent_path() / "power" / "runtime_status", PowerStatus))
					PowerStatus = "Unknown";
				Log.Verbose("  - " + ControllerName + ": Power management control=" + PowerControl + ", status=" + PowerStatus);
			}
		}
	}
	else
		Log.Verbose("No Bluetooth controllers found in sysfs, checking USB devices...");

	// Second: the USB bus
	if (!bFound)
	{
		std::vector<std::string> Devices;
		if (ScanUSBForBluetooth(System, Config, Log, Devices))
		{
			bFound = true;
			for (auto& Device : Devices)
				if (ContainsNoCase(Device, Config.BroadcomUSBID))
				{
					Log.Verbose("Detected Apple Bluetooth USB Host Controller");
					std::smatch BusDevice;
					if (std::regex_search(Device, BusDevice, std::regex("Bus ([0-9]+) Device ([0-9]+)")))
						Log.Verbose("Apple Bluetooth controller on bus " + BusDevice[1].str() + ", device " + BusDevice[2].str());
					break;
				}
		}
	}

	// Third: the HCI layer, what hciconfig would list
	if (!bFound)
	{
		auto Adapters(System.HciDevices());
		if (!Adapters.empty())
		{
			bFound = true;
			Log.Verbose("Found Bluetooth controllers through the HCI interface:");
			for (auto& Adapter : Adapters)
				Log.Verbose("  - " + Adapter.Name + " " + Adapter.Address + (Adapter.Up ? " UP" : " DOWN") + (Adapter.Running ? " RUNNING" : ""));
		}
		else
			Log.Verbose("No Bluetooth controllers found through the HCI interface");
	}

	CheckResult rval(CheckName::Hardware);
	if (bFound)
	{
		rval.Status = CheckStatus::OK;
		rval.Detail = "present and detected";
		Log.Info("Bluetooth hardware is present and detected");
	}
	else
	{
		rval.Status = CheckStatus::Fail;
		rval.Detail = "No Bluetooth hardware detected";
		Log.Warning("No Bluetooth hardware detected through any method");
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
CheckResult CheckService(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Verbose("Checking Bluetooth service status...");
	CheckResult rval(CheckName::Service);
	const ServiceState State(System.QueryService(Config.ServiceUnit));
	if (State == ServiceState::Active)
	{
		rval.Status = CheckStatus::OK;
		rval.Detail = Config.ServiceUnit + " is active";
		Log.Info("Bluetooth service is active");
		return(rval);
	}
	if (State == ServiceState::Inactive)
		Log.Warning("Bluetooth service is not active");
	else
		Log.Verbose("No init system answered for " + Config.ServiceUnit);

	if (System.CommandExists("service"))
	{
		CommandResult Status(System.Run({ "service", Config.ServiceUnit, "status" }));
		if (Status.Succeeded())
		{
			rval.Status = CheckStatus::OK;
			rval.Detail = Config.ServiceUnit + " is active via service command";
			Log.Verbose("Bluetooth service is active via service command");
		}
		else
		{
			rval.Status = CheckStatus::Fail;
			rval.Detail = Config.ServiceUnit + " is not running";
		}
	}
	else if (State == ServiceState::Unavailable)
	{
		rval.Status = CheckStatus::Unknown;
		rval.Detail = "No init system or service command available";
		Log.Warning("Cannot determine Bluetooth service state: " + rval.Detail);
	}
	else
	{
		rval.Status = CheckStatus::Fail;
		rval.Detail = Config.ServiceUnit + " is not active";
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
CheckResult CheckFunctionality(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Verbose("Checking Bluetooth functionality...");
	CheckResult rval(CheckName::Functionality);
	if (!System.CommandExists("bluetoothctl"))
	{
		rval.Detail = "bluetoothctl not found";
		Log.Warning("bluetoothctl not found, cannot check Bluetooth functionality");
		return(rval);
	}
	CommandResult Show(System.Run({ "bluetoothctl", "show" }, Config.FunctionalityTimeout));
	if (Show.TimedOut || (Show.ExitCode == 124))
	{
		rval.Detail = "bluetoothctl timed out";
		Log.Warning("Bluetooth control command timed out");
		return(rval);
	}
	if (Show.Output.find("No default controller available") != std::string::npos)
	{
		rval.Status = CheckStatus::Fail;
		rval.Detail = "No default controller available";
		Log.Warning("No Bluetooth controller available through bluetoothctl");
		return(rval);
	}
	std::istringstream TheLines(Show.Output);
	std::string TheLine;
	while (std::getline(TheLines, TheLine))
		if (TheLine.find("Controller") != std::string::npos)
		{
			rval.Status = CheckStatus::OK;
			rval.Detail = TrimWhitespace(TheLine);
			Log.Verbose("Bluetooth controller is functional: " + rval.Detail);
			return(rval);
		}
	rval.Status = CheckStatus::Fail;
	rval.Detail = "Unexpected output from bluetoothctl";
	Log.Warning("Unexpected output from bluetoothctl: " + Show.Output);
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
static void FindFirmware(SystemInterface& System, const std::filesystem::path& Directory, const int Depth, int& Count, std::vector<std::string>& AppleFirmware)
{
	for (auto& Entry : System.ListDirectory(Directory))
	{
		if (System.IsDirectory(Entry))
		{
			if (Depth < 4)
				FindFirmware(System, Entry, Depth + 1, Count, AppleFirmware);
			continue;
		}
		const std::string FileName(ToLower(Entry.filename().string()));
		if ((Entry.extension() == ".hcd") ||
			(FileName.find("bluetooth") != std::string::npos) ||
			(FileName.find("brcm") != std::string::npos) ||
			(FileName.find("bt") != std::string::npos))
		{
			Count++;
			if ((FileName.find("apple") != std::string::npos) ||
				(FileName.find("05ac") != std::string::npos) ||
				(FileName.find("8294") != std::string::npos) ||
				(FileName.find("bcm") != std::string::npos))
				AppleFirmware.push_back(Entry.string());
		}
	}
}
bool CheckFirmware(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Verbose("Checking Bluetooth firmware...");
	if (!System.IsDirectory(Config.FirmwareRoot))
	{
		Log.Verbose("Firmware directory " + Config.FirmwareRoot.string() + " does not exist");
		return(false);
	}
	int Count = 0;
	std::vector<std::string> AppleFirmware;
	FindFirmware(System, Config.FirmwareRoot, 0, Count, AppleFirmware);
	if (Count == 0)
	{
		Log.Warning("No Bluetooth firmware files found in " + Config.FirmwareRoot.string());
		return(false);
	}
	Log.Verbose("Found " + std::to_string(Count) + " Bluetooth firmware files");
	if (!AppleFirmware.empty())
	{
		Log.Verbose("Found Apple/Broadcom Bluetooth firmware:");
		for (auto& FileName : AppleFirmware)
			Log.Verbose("  " + FileName);
	}
	return(true);
}
/////////////////////////////////////////////////////////////////////////////
bool DetectBCMResetFailure(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Verbose("Checking for Broadcom BCM reset failures...");
	bool rval = false;

	// kernel ring buffer needs privilege on most distributions
	if (System.CommandExists("dmesg"))
	{
		if (CanElevate(System))
		{
			CommandResult KernelLog(RunPrivileged(System, Log, { "dmesg" }));
			if (KernelLog.Output.find("BCM: Reset failed") != std::string::npos)
			{
				Log.Warning("Detected Broadcom BCM Reset failure in dmesg");
				Log.Status("BCM detection: failed state detected");
				rval = true;
			}
		}
		else
			Log.Verbose("Cannot check dmesg without sudo privileges");
	}

	// An Apple controller on the bus that never comes up is the same chipset bug
	if (System.CommandExists("lsusb"))
	{
		CommandResult USBList(System.Run({ "lsusb" }));
		if (ContainsNoCase(USBList.Output, Config.BroadcomUSBID))
		{
			Log.Verbose("Found Apple Bluetooth controller (possibly Broadcom BCM chip)");
			auto Adapters(System.HciDevices());
			if (std::none_of(Adapters.begin(), Adapters.end(), [](const HciDevice& Adapter) { return(Adapter.IsUpRunning()); }))
			{
				Log.Verbose("Apple/Broadcom controller detected but not working properly");
				rval = true;
			}
		}
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
HealthReport EvaluateHealth(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Info("Checking Bluetooth status at " + getTimeExcelLocal());
	HealthReport rval;
	rval.Add(CheckModules(System, Config, Log));
	rval.Add(CheckHardware(System, Config, Log));
	rval.Add(CheckService(System, Config, Log));
	rval.Add(CheckFunctionality(System, Config, Log));
	const CheckResult* Functionality(rval.Find(CheckName::Functionality));
	if ((Functionality != nullptr) && Functionality->IsFail())
		Log.Warning("Bluetooth functionality: failed state detected");

	rval.FirmwarePresent = CheckFirmware(System, Config, Log);
	rval.BCMResetDetected = DetectBCMResetFailure(System, Config, Log);

	for (auto& Check : rval.Checks)
		Log.Status(Check.WriteTXT() + " " + Check.Detail);
	Log.Status(rval.StatusLine());

	if (rval.RecoveryNeeded)
		Log.Info("Issues detected - recovery actions may be needed");
	else
		Log.Info("Bluetooth is working properly");
	return(rval);
}

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
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "btmonitor.h"
#include "btmonitor-log.h"
#include "btmonitor-system.h"

/////////////////////////////////////////////////////////////////////////////
PollResult PollUntil(SystemInterface& System, MonitorLog& Log, const std::function<bool(void)>& Condition, const int IntervalSeconds, const int MaxWaitSeconds, const std::string& ProgressMessage)
{
	const int Interval = (IntervalSeconds > 0) ? IntervalSeconds : 1;
	int Elapsed = 0;
	for (;;)
	{
		if (Condition())
			return(PollResult::Satisfied);
		if (Elapsed >= MaxWaitSeconds)
			break;
		System.Sleep(Interval);
		Elapsed += Interval;
		if (!ProgressMessage.empty() && (Elapsed % 5 == 0) && (Elapsed < MaxWaitSeconds))
			Log.Recovery(ProgressMessage + " " + std::to_string(Elapsed) + "s elapsed");
	}
	return(PollResult::TimedOut);
}
bool WaitForEnumeration(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const int MaxWaitSeconds)
{
	Log.Recovery("Waiting up to " + std::to_string(MaxWaitSeconds) + "s for device re-enumeration...");
	auto ControllerPresent = [&System, &Config]() { return(!System.ListDirectory(Config.SysClassBluetooth).empty()); };
	if (PollResult::Satisfied == PollUntil(System, Log, ControllerPresent, 1, MaxWaitSeconds, "Still waiting for device..."))
	{
		Log.Recovery("Device re-enumerated");
		System.Sleep(1);	// let the controller finish initializing
		return(true);
	}
	Log.Recovery("Device did not re-enumerate within " + std::to_string(MaxWaitSeconds) + "s");
	return(false);
}
/////////////////////////////////////////////////////////////////////////////
// USB ids are hex without a prefix in sysfs ("05ac") and without leading zeros in uevent ("5ac")
static bool ParseHexID(const std::string& Text, unsigned long& Value)
{
	try
	{
		size_t Used = 0;
		Value = std::stoul(TrimWhitespace(Text), &Used, 16);
		return(Used > 0);
	}
	catch (const std::invalid_argument& ia)
	{
	}
	catch (const std::out_of_range& oor)
	{
	}
	return(false);
}
static void ReadUSBDevice(SystemInterface& System, const std::filesystem::path& Path, UsbDevice& Device)
{
	Device.Path = Path;
	Device.Vendor.clear();
	Device.Product.clear();
	Device.BusNumber.clear();
	Device.DeviceNumber.clear();
	if (System.ReadFile(Path / "idVendor", Device.Vendor))
		Device.Vendor = TrimWhitespace(Device.Vendor);
	if (System.ReadFile(Path / "idProduct", Device.Product))
		Device.Product = TrimWhitespace(Device.Product);
	if (System.ReadFile(Path / "busnum", Device.BusNumber))
		Device.BusNumber = TrimWhitespace(Device.BusNumber);
	if (System.ReadFile(Path / "devnum", Device.DeviceNumber))
		Device.DeviceNumber = TrimWhitespace(Device.DeviceNumber);
}
bool LocateUSBDeviceByID(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const std::string& Vendor, const std::string& Product, UsbDevice& Device)
{
	unsigned long WantedVendor = 0;
	unsigned long WantedProduct = 0;
	if (!ParseHexID(Vendor, WantedVendor) || !ParseHexID(Product, WantedProduct))
		return(false);
	for (auto& Entry : System.ListDirectory(Config.SysBusUSBDevices))
	{
		std::string EntryVendor;
		std::string EntryProduct;
		unsigned long EntryVendorValue = 0;
		unsigned long EntryProductValue = 0;
		if (System.ReadFile(Entry / "idVendor", EntryVendor) &&
			System.ReadFile(Entry / "idProduct", EntryProduct) &&
			ParseHexID(EntryVendor, EntryVendorValue) &&
			ParseHexID(EntryProduct, EntryProductValue) &&
			(EntryVendorValue == WantedVendor) &&
			(EntryProductValue == WantedProduct))
		{
			ReadUSBDevice(System, Entry, Device);
			Log.Recovery("Found Bluetooth USB device at: " + Entry.string() + " (via vendor/product ID)");
			return(true);
		}
	}
	return(false);
}
bool LocateUSBDevice(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, UsbDevice& Device)
{
	auto Controllers(System.ListDirectory(Config.SysClassBluetooth));

	// Walk up from the controller's interface until something has USB ids
	for (auto& Controller : Controllers)
	{
		std::filesystem::path Current(System.Canonical(Controller / "device"));
		if (Current.empty())
			continue;
		Log.Verbose("Searching for USB path starting from: " + Current.string());
		while (!Current.empty() && (Current != Current.root_path()))
		{
			if (System.Exists(Current / "idVendor") && System.Exists(Current / "idProduct"))
			{
				ReadUSBDevice(System, Current, Device);
				Log.Recovery("Found Bluetooth USB device at: " + Current.string());
				if (!Device.BusNumber.empty() && !Device.DeviceNumber.empty())
					Log.Recovery("USB bus:device = " + Device.BusNumber + ":" + Device.DeviceNumber);
				return(true);
			}
			Current = Current.parent_path();
		}
	}

	Log.Verbose("Trying alternative USB device search method...");
	for (auto& Controller : Controllers)
	{
		std::string UEvent;
		if (!System.ReadFile(Controller / "device" / "uevent", UEvent))
			continue;
		std::istringstream TheLines(UEvent);
		std::string TheLine;
		while (std::getline(TheLines, TheLine))
			if (TheLine.compare(0, 8, "PRODUCT=") == 0)
			{
				// PRODUCT=5ac/8294/125
				std::istringstream Fields(TheLine.substr(8));
				std::string Vendor;
				std::string Product;
				if (std::getline(Fields, Vendor, '/') && std::getline(Fields, Product, '/'))
				{
					Log.Verbose("Found Bluetooth device with vendor:" + Vendor + " product:" + Product);
					if (LocateUSBDeviceByID(System, Config, Log, Vendor, Product, Device))
						return(true);
				}
				break;
			}
	}
	Log.Error("Could not find Bluetooth USB device path");
	return(false);
}
/////////////////////////////////////////////////////////////////////////////
static bool ResetByAuthorized(SystemInterface& System, MonitorLog& Log, const UsbDevice& Device)
{
	const std::filesystem::path Authorized(Device.Path / "authorized");
	if (!System.Exists(Authorized))
		return(false);
	Log.Recovery("Attempting USB reset via authorized flag method...");
	Log.Recovery("Disabling USB device...");
	if (!WritePrivileged(System, Log, Authorized, "0"))
	{
		Log.Warning("Failed to disable USB device via authorized flag");
		return(false);
	}
	System.Sleep(2);
	Log.Recovery("Re-enabling USB device...");
	if (!WritePrivileged(System, Log, Authorized, "1"))
	{
		Log.Error("Failed to re-enable USB device via authorized flag");
		return(false);
	}
	Log.Recovery("USB reset via authorized flag completed");
	return(true);
}
static bool ResetByRebind(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const std::filesystem::path& DriverPath, const std::string& DeviceID)
{
	Log.Recovery("Attempting USB reset via driver bind/unbind method...");
	Log.Recovery("Found driver path: " + DriverPath.string());
	Log.Recovery("Unbinding device " + DeviceID + " from driver...");
	if (!WritePrivileged(System, Log, DriverPath / "unbind", DeviceID))
	{
		Log.Warning("Failed to unbind device from driver");
		return(false);
	}
	System.Sleep(3);
	Log.Recovery("Rebinding device " + DeviceID + " to driver...");
	if (!WritePrivileged(System, Log, DriverPath / "bind", DeviceID))
	{
		Log.Error("Failed to rebind device to driver");
		return(false);
	}
	if (!WaitForEnumeration(System, Config, Log, 15))
	{
		Log.Warning("Device did not re-enumerate after bind/unbind reset");
		return(false);
	}
	Log.Recovery("Device successfully reset using bind/unbind method");
	return(true);
}
static bool ResetByUtility(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const UsbDevice& Device)
{
	if (Device.BusNumber.empty() || Device.DeviceNumber.empty())
	{
		Log.Verbose("Bus/Device numbers not available, cannot use a USB reset utility");
		return(false);
	}
	std::vector<std::string> Arguments;
	if (System.CommandExists("usb_modeswitch") && !Device.Vendor.empty() && !Device.Product.empty())
		Arguments = { "usb_modeswitch", "-v", "0x" + Device.Vendor, "-p", "0x" + Device.Product, "-R", "-b", Device.BusNumber, "-g", Device.DeviceNumber };
	else if (System.CommandExists("usbreset"))
	{
		int Bus = 0;
		int Dev = 0;
		try
		{
			Bus = std::stoi(Device.BusNumber);
			Dev = std::stoi(Device.DeviceNumber);
		}
		catch (const std::invalid_argument& ia)
		{
			Log.Warning("Invalid bus/device numbers " + Device.BusNumber + ":" + Device.DeviceNumber);
			return(false);
		}
		catch (const std::out_of_range& oor)
		{
			Log.Warning("Invalid bus/device numbers " + Device.BusNumber + ":" + Device.DeviceNumber);
			return(false);
		}
		std::ostringstream DeviceNode;
		DeviceNode << "/dev/bus/usb/" << std::setfill('0') << std::setw(3) << Bus << "/" << std::setw(3) << Dev;
		Arguments = { "usbreset", DeviceNode.str() };
	}
	else
	{
		Log.Verbose("Neither usb_modeswitch nor usbreset available, skipping this USB reset method");
		return(false);
	}
	Log.Recovery("Attempting USB reset of " + Device.WriteTXT() + " using " + Arguments.front() + "...");
	CommandResult Reset(RunPrivileged(System, Log, Arguments));
	if (!Reset.Succeeded())
	{
		Log.Error(Arguments.front() + " command failed: " + TrimWhitespace(Reset.Output));
		return(false);
	}
	if (!WaitForEnumeration(System, Config, Log, 20))
	{
		Log.Warning("Device did not re-enumerate after " + Arguments.front() + " reset");
		return(false);
	}
	Log.Recovery("Device successfully reset using " + Arguments.front());
	return(true);
}
static bool ResetBySuspend(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const UsbDevice& Device)
{
	const std::filesystem::path PowerDirectory(Device.Path / "power");
	if (!System.Exists(PowerDirectory / "autosuspend"))
	{
		Log.Verbose("Power management files not available, cannot use power cycle method");
		return(false);
	}
	Log.Recovery("Attempting USB reset through suspend/resume power cycle...");
	Log.Recovery("Forcing USB device to suspend...");
	if (!WritePrivileged(System, Log, PowerDirectory / "autosuspend", "1"))
	{
		Log.Error("Failed to set autosuspend value");
		return(false);
	}
	if (!WritePrivileged(System, Log, PowerDirectory / "control", "auto"))
	{
		Log.Error("Failed to set power control to auto");
		return(false);
	}
	System.Sleep(5);
	Log.Recovery("Resuming USB device...");
	if (!WritePrivileged(System, Log, PowerDirectory / "control", "on"))
	{
		Log.Error("Failed to resume USB device");
		return(false);
	}
	if (!WaitForEnumeration(System, Config, Log, 15))
	{
		Log.Warning("Device did not respond after power cycle");
		return(false);
	}
	Log.Recovery("Device successfully reset using power cycle method");
	return(true);
}
/////////////////////////////////////////////////////////////////////////////
bool RecoveryFixBCMReset(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Recovery("Attempting to fix Broadcom BCM reset failure...");
	if (!RequirePrivileges(System, Log, "fix Broadcom issues"))
		return(false);
	bool rval = false;

	Log.Recovery("Searching for Broadcom firmware files...");
	if (System.IsDirectory(Config.BroadcomFirmwareDirectory))
	{
		std::vector<std::filesystem::path> FirmwareFiles;
		for (auto& Entry : System.ListDirectory(Config.BroadcomFirmwareDirectory))
			if (Entry.extension() == ".hcd")
				FirmwareFiles.push_back(Entry);
		if (!FirmwareFiles.empty())
		{
			Log.Recovery("Found Broadcom firmware files:");
			for (auto& FileName : FirmwareFiles)
				Log.Recovery("  " + FileName.string());
			for (auto& FileName : FirmwareFiles)
			{
				const std::string Name(ToLower(FileName.filename().string()));
				if ((Name.find("apple") != std::string::npos) ||
					(Name.find("05ac") != std::string::npos) ||
					(Name.find("8294") != std::string::npos) ||
					(Name.find("bcm") != std::string::npos))
				{
					Log.Recovery("Found potential Apple Bluetooth firmware: " + FileName.string());
					break;
				}
			}
		}
		else
			Log.Warning("No Broadcom firmware files found");
	}
	else
		Log.Warning("Broadcom firmware directory not found");

	Log.Recovery("Executing specialized Broadcom reset sequence...");
	if (System.IsModuleLoaded(Config.TransportModule))
	{
		Log.Recovery("Unloading " + Config.TransportModule + " module...");
		if (RunPrivileged(System, Log, { "modprobe", "-r", Config.TransportModule }).Succeeded())
		{
			System.Sleep(2);
			Log.Recovery("Reloading " + Config.TransportModule + " module with reset_delay parameter...");
			if (RunPrivileged(System, Log, { "modprobe", Config.TransportModule, "reset_delay=1" }).Succeeded())
			{
				Log.Recovery("Successfully reloaded " + Config.TransportModule + " with reset_delay parameter");
				rval = true;
			}
			else if (RunPrivileged(System, Log, { "modprobe", Config.TransportModule }).Succeeded())
			{
				Log.Recovery("Reloaded " + Config.TransportModule + " module (without parameters)");
				rval = true;
			}
			else
				Log.Warning("Failed to reload " + Config.TransportModule + " module");
		}
		else
			Log.Warning("Could not unload " + Config.TransportModule + " module (may be in use)");
	}

	// Power cycle the Apple controller itself
	if (!rval)
	{
		const auto Colon(Config.BroadcomUSBID.find(':'));
		UsbDevice Device;
		if ((Colon != std::string::npos) && LocateUSBDeviceByID(System, Config, Log, Config.BroadcomUSBID.substr(0, Colon), Config.BroadcomUSBID.substr(Colon + 1), Device))
		{
			Log.Recovery("Attempting USB power cycle for device " + Device.WriteTXT());
			rval = ResetByAuthorized(System, Log, Device);
			if (!rval)
			{
				std::filesystem::path Driver(System.Canonical(Device.Path / "driver"));
				if (!Driver.empty() && System.IsDirectory(Driver))
					rval = ResetByRebind(System, Config, Log, Driver, Device.Path.filename().string());
			}
			if (!rval)
				rval = ResetByUtility(System, Config, Log, Device);
		}
		else
			Log.Verbose("Apple Bluetooth controller " + Config.BroadcomUSBID + " not found on the USB bus");
	}

	if (rval)
	{
		if (System.CommandExists("systemctl"))
		{
			Log.Recovery("Restarting Bluetooth service to apply Broadcom fixes...");
			if (RunPrivileged(System, Log, { "systemctl", "restart", Config.ServiceUnit }).Succeeded())
				Log.Recovery("Bluetooth service restarted successfully");
			else
				Log.Warning("Failed to restart Bluetooth service");
		}
		System.Sleep(5);
		auto Adapters(System.HciDevices());
		if (std::any_of(Adapters.begin(), Adapters.end(), [](const HciDevice& Adapter) { return(Adapter.IsUpRunning()); }))
			Log.Recovery("Broadcom controller is now working properly!");
		else
			Log.Warning("Broadcom controller is still not functioning properly");
		Log.Recovery("Broadcom BCM reset fix succeeded at least partially");
	}
	else
	{
		Log.Recovery("Broadcom BCM reset fix failed");
		Log.Recovery("For persistent Broadcom BCM reset issues, consider:");
		Log.Recovery("1. Checking for updated firmware packages for your distribution");
		Log.Recovery("2. Temporarily using an external Bluetooth adapter as a workaround");
		Log.Recovery("3. Adding 'btusb.reset_delay=1' to kernel boot parameters");
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
static void WritePersistentPowerRule(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const std::filesystem::path& Node)
{
	if (!System.CommandExists("udevadm") || !CanElevate(System))
		return;
	std::string Vendor;
	std::string Product;
	if (!System.ReadFile(Node / "idVendor", Vendor) || !System.ReadFile(Node / "idProduct", Product))
		return;
	Vendor = TrimWhitespace(Vendor);
	Product = TrimWhitespace(Product);
	if (Vendor.empty() || Product.empty())
		return;
	Log.Recovery("Creating persistent udev rule for power management...");
	const std::filesystem::path RulesDirectory(Config.UdevRulesFile.parent_path());
	if (!RulesDirectory.empty() && !System.IsDirectory(RulesDirectory) && !CreateDirectoryPrivileged(System, Log, RulesDirectory))
	{
		Log.Warning("Failed to create udev rules directory " + RulesDirectory.string());
		return;
	}
	std::ostringstream Rule;
	Rule << "# Disable power management for Bluetooth device" << std::endl;
	Rule << "ACTION==\"add\", SUBSYSTEM==\"usb\", ATTR{idVendor}==\"" << Vendor << "\", ATTR{idProduct}==\"" << Product << "\", ATTR{power/control}=\"on\"";
	if (!WritePrivileged(System, Log, Config.UdevRulesFile, Rule.str()))
	{
		Log.Warning("Failed to create udev rule");
		return;
	}
	Log.Recovery("Created udev rule: " + Config.UdevRulesFile.string());
	if (RunPrivileged(System, Log, { "udevadm", "control", "--reload-rules" }).Succeeded())
		Log.Recovery("Reloaded udev rules successfully");
	else
		Log.Warning("Failed to reload udev rules");
}
bool RecoveryFixPowerManagement(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Recovery("Attempting to fix power management for Bluetooth USB device...");
	std::vector<std::filesystem::path> Nodes;
	for (auto& Controller : System.ListDirectory(Config.SysClassBluetooth))
	{
		std::filesystem::path Current(System.Canonical(Controller / "device"));
		std::filesystem::path FirstPowerNode;
		std::filesystem::path USBNode;
		while (!Current.empty() && (Current != Current.root_path()))
		{
			if (FirstPowerNode.empty() && System.IsDirectory(Current / "power"))
				FirstPowerNode = Current;
			if (System.Exists(Current / "idVendor"))
			{
				USBNode = Current;
				break;
			}
			Current = Current.parent_path();
		}
		const std::filesystem::path Node(USBNode.empty() ? FirstPowerNode : USBNode);
		if (!Node.empty() && (std::find(Nodes.begin(), Nodes.end(), Node) == Nodes.end()))
			Nodes.push_back(Node);
	}
	if (Nodes.empty())
	{
		Log.Error("Could not find any Bluetooth USB devices with power management");
		return(false);
	}
	if (!RequirePrivileges(System, Log, "modify power management settings"))
		return(false);

	bool rval = false;
	for (auto& Node : Nodes)
	{
		const std::filesystem::path PowerDirectory(Node / "power");
		const std::string NodeName(Node.filename().string());
		std::string Control;
		if (!System.ReadFile(PowerDirectory / "control", Control))
		{
			Log.Warning("Power management control not found for " + NodeName);
			continue;
		}
		Control = TrimWhitespace(Control);
		Log.Recovery("Current power management control for " + NodeName + ": " + Control);
		if (Control == "auto")
		{
			Log.Recovery("Disabling auto power management for " + NodeName + "...");
			std::string Verify;
			if (WritePrivileged(System, Log, PowerDirectory / "control", "on") &&
				System.ReadFile(PowerDirectory / "control", Verify) &&
				(TrimWhitespace(Verify) == "on"))
			{
				Log.Recovery("Successfully disabled auto power management for " + NodeName);
				Log.Recovery("Power control is now set to 'on'");
				rval = true;
				WritePersistentPowerRule(System, Config, Log, Node);
			}
			else
				Log.Error("Failed to disable auto power management for " + NodeName);
		}
		else if (Control == "on")
		{
			Log.Recovery("Power management already disabled for " + NodeName);
			rval = true;
		}
		else
			Log.Warning("Unknown power management state: " + Control);

		std::string RuntimeStatus;
		if (System.ReadFile(PowerDirectory / "runtime_status", RuntimeStatus))
		{
			RuntimeStatus = TrimWhitespace(RuntimeStatus);
			Log.Recovery("Power runtime status for " + NodeName + ": " + RuntimeStatus);
			if (RuntimeStatus == "suspended")
			{
				Log.Recovery("Attempting to resume suspended device...");
				if (WritePrivileged(System, Log, PowerDirectory / "runtime_suspended", "0"))
					Log.Recovery("Successfully resumed device from suspension");
				else
					Log.Warning("Failed to resume device from suspension");
			}
		}
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
bool RecoveryResetUSB(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Recovery("Attempting USB reset of the Bluetooth device...");
	UsbDevice Device;
	if (!LocateUSBDevice(System, Config, Log, Device))
		return(false);
	if (!RequirePrivileges(System, Log, "reset USB device"))
		return(false);

	bool rval = ResetByAuthorized(System, Log, Device);
	if (!rval)
	{
		// unbind the controller's interface from its driver
		std::filesystem::path Driver;
		std::string DeviceID;
		for (auto& Controller : System.ListDirectory(Config.SysClassBluetooth))
		{
			Driver = System.Canonical(Controller / "device" / "driver");
			DeviceID = System.Canonical(Controller / "device").filename().string();
			if (!Driver.empty() && !DeviceID.empty() && System.IsDirectory(Driver))
				break;
			Driver.clear();
		}
		if (!Driver.empty())
			rval = ResetByRebind(System, Config, Log, Driver, DeviceID);
		else
			Log.Warning("Could not find driver path and device ID for bind/unbind method");
	}
	if (!rval)
		rval = ResetByUtility(System, Config, Log, Device);
	if (!rval)
		rval = ResetBySuspend(System, Config, Log, Device);

	if (rval)
		Log.Recovery("USB reset was successful");
	else
	{
		Log.Error("All USB reset methods failed");
		Log.Recovery("Consider manually removing and reinserting the device if possible,");
		Log.Recovery("or rebooting the system to fully reset the Bluetooth hardware.");
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
bool RecoveryRestartService(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	if (System.CommandExists("systemctl"))
	{
		if (!RequirePrivileges(System, Log, "restart service"))
			return(false);
		Log.Recovery("Stopping " + Config.ServiceUnit + " service...");
		if (!RunPrivileged(System, Log, { "systemctl", "stop", Config.ServiceUnit }).Succeeded())
			Log.Warning("systemctl stop " + Config.ServiceUnit + " failed");
		System.Sleep(2);
		Log.Recovery("Starting " + Config.ServiceUnit + " service...");
		if (!RunPrivileged(System, Log, { "systemctl", "start", Config.ServiceUnit }).Succeeded())
			Log.Warning("systemctl start " + Config.ServiceUnit + " failed");
		if (System.QueryService(Config.ServiceUnit) == ServiceState::Active)
		{
			Log.Recovery("Bluetooth service is now running");
			return(true);
		}
		Log.Error("Bluetooth service did not start");
		return(false);
	}
	if (System.CommandExists("service"))
	{
		if (!RequirePrivileges(System, Log, "restart service"))
			return(false);
		Log.Recovery("Using service command to restart " + Config.ServiceUnit + "...");
		if (!RunPrivileged(System, Log, { "service", Config.ServiceUnit, "restart" }).Succeeded())
			Log.Warning("service " + Config.ServiceUnit + " restart failed");
		if (System.ProcessRunning(Config.ServiceDaemon))
		{
			Log.Recovery("Bluetooth service appears to be running");
			return(true);
		}
		Log.Error("Failed to restart Bluetooth service");
		return(false);
	}
	Log.Error("Cannot restart Bluetooth service (systemctl/service not found)");
	return(false);
}
/////////////////////////////////////////////////////////////////////////////
bool RecoveryReloadModules(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	if (!RequirePrivileges(System, Log, "reload kernel modules"))
		return(false);
	// dependents first
	for (auto& Module : { Config.TransportModule, Config.StackModule })
		if (System.IsModuleLoaded(Module))
		{
			Log.Recovery("Unloading " + Module + " module...");
			if (!RunPrivileged(System, Log, { "modprobe", "-r", Module }).Succeeded())
				Log.Warning("Failed to unload " + Module + " module");
		}
	System.Sleep(2);
	for (auto& Module : { Config.StackModule, Config.TransportModule })
	{
		Log.Recovery("Reloading " + Module + " module...");
		if (!RunPrivileged(System, Log, { "modprobe", Module }).Succeeded())
		{
			Log.Error("Failed to reload " + Module + " module");
			return(false);
		}
	}
	Log.Recovery("Bluetooth kernel modules reloaded");
	return(true);
}
/////////////////////////////////////////////////////////////////////////////
static void RunStep(RecoverySummary& Summary, MonitorLog& Log, const RecoveryActionType Type, const std::function<bool(void)>& Action)
{
	const bool Success = Action();
	Summary.Record(Type, Success);
	if (Success)
		Log.Recovery(RecoveryActionType2String(Type) + " successful");
	else
		Log.Warning(RecoveryActionType2String(Type) + " unsuccessful, continuing with other recovery methods");
}
static void FinishSequence(const RecoverySummary& Summary, MonitorLog& Log)
{
	Log.Recovery("Recovery sequence complete");
	Log.RecoveryBlock(Summary.WriteTXT());
	if (Summary.Success())
		Log.Recovery("Recovery sequence completed with at least one successful action (" + std::to_string(Summary.Succeeded) + "/" + std::to_string(Summary.Attempted) + ")");
	else
		Log.Error("All recovery actions failed (0/" + std::to_string(Summary.Attempted) + ")");
}
RecoverySummary RunRecoveryLadder(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const HealthReport& Report)
{
	Log.Recovery("Starting recovery sequence...");
	RecoverySummary rval;
	if (Report.BCMResetDetected)
	{
		Log.Recovery("Detected BCM reset failure, attempting specialized fix...");
		RunStep(rval, Log, RecoveryActionType::BCMFix, [&]() { return(RecoveryFixBCMReset(System, Config, Log)); });
	}
	Log.Recovery("Step 1: Addressing power management issues");
	RunStep(rval, Log, RecoveryActionType::PowerManagement, [&]() { return(RecoveryFixPowerManagement(System, Config, Log)); });
	Log.Recovery("Step 2: Resetting Bluetooth USB device");
	RunStep(rval, Log, RecoveryActionType::USBReset, [&]() { return(RecoveryResetUSB(System, Config, Log)); });
	Log.Recovery("Step 3: Restarting Bluetooth service");
	RunStep(rval, Log, RecoveryActionType::ServiceRestart, [&]() { return(RecoveryRestartService(System, Config, Log)); });
	Log.Recovery("Step 4: Reloading Bluetooth kernel modules");
	RunStep(rval, Log, RecoveryActionType::ModuleReload, [&]() { return(RecoveryReloadModules(System, Config, Log)); });
	FinishSequence(rval, Log);
	return(rval);
}
RecoverySummary RunRecoverySubset(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log)
{
	Log.Recovery("Starting USB and service recovery...");
	RecoverySummary rval;
	RunStep(rval, Log, RecoveryActionType::PowerManagement, [&]() { return(RecoveryFixPowerManagement(System, Config, Log)); });
	RunStep(rval, Log, RecoveryActionType::USBReset, [&]() { return(RecoveryResetUSB(System, Config, Log)); });
	RunStep(rval, Log, RecoveryActionType::ServiceRestart, [&]() { return(RecoveryRestartService(System, Config, Log)); });
	FinishSequence(rval, Log);
	return(rval);
}

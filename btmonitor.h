#pragma once

#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

enum class OperationMode
{
	Monitor = 0,
	DetectOnly,
	CheckService,
	RestartService,
	PowerManagement,
	CheckState,
	Recovery,
	FullRecovery,
};
std::string OperationMode2String(const OperationMode Mode);

// Everything a run needs to know about the host. Tests point the paths at a fake tree.
class MonitorConfig {
public:
	std::filesystem::path LogDirectory;
	int CheckInterval;
	bool AutoRecovery;
	bool RunOnce;
	int ConsoleVerbosity;
	OperationMode Mode;
	std::filesystem::path SysClassBluetooth;
	std::filesystem::path SysBusUSBDevices;
	std::filesystem::path FirmwareRoot;
	std::filesystem::path BroadcomFirmwareDirectory;
	std::filesystem::path UdevRulesFile;
	std::string ServiceUnit;
	std::string ServiceDaemon;
	std::string StackModule;
	std::string TransportModule;
	std::string BroadcomUSBID;
	std::vector<std::string> KnownUSBIDs;
	int FunctionalityTimeout;
	MonitorConfig();
	std::filesystem::path EventLogFileName(void) const { return(LogDirectory / "bluetooth_monitor.log"); };
	std::filesystem::path StatusLogFileName(void) const { return(LogDirectory / "bluetooth_status.log"); };
	std::filesystem::path RecoveryLogFileName(void) const { return(LogDirectory / "bluetooth_recovery_actions.log"); };
};
std::filesystem::path DefaultLogDirectory(void);

enum class CheckName
{
	Modules = 0,
	Hardware,
	Service,
	Functionality,
};
enum class CheckStatus
{
	OK = 0,
	Fail,
	Unknown,
};
std::string CheckName2String(const CheckName Name);
std::string CheckStatus2String(const CheckStatus Status);

class CheckResult {
public:
	CheckName Name;
	CheckStatus Status;
	std::string Detail;
	CheckResult(const CheckName n, const CheckStatus s = CheckStatus::Unknown, const std::string& d = "") : Name(n), Status(s), Detail(d) { };
	bool IsOK(void) const { return(Status == CheckStatus::OK); };
	bool IsFail(void) const { return(Status == CheckStatus::Fail); };
	std::string WriteTXT(void) const;
};

class HealthReport {
public:
	std::vector<CheckResult> Checks;
	bool RecoveryNeeded;
	bool BCMResetDetected;
	bool FirmwarePresent;
	HealthReport() : RecoveryNeeded(false), BCMResetDetected(false), FirmwarePresent(false) { };
	void Add(const CheckResult& Result);
	const CheckResult* Find(const CheckName Name) const;
	bool IsHealthy(void) const { return(!RecoveryNeeded); };
	std::string StatusLine(void) const;
	bool operator ==(const HealthReport& b) const;
};

enum class RecoveryActionType
{
	BCMFix = 0,
	PowerManagement,
	USBReset,
	ServiceRestart,
	ModuleReload,
};
std::string RecoveryActionType2String(const RecoveryActionType Type);

class RecoveryAction {
public:
	RecoveryActionType Type;
	bool Success;
	RecoveryAction(const RecoveryActionType t, const bool s) : Type(t), Success(s) { };
};

class RecoverySummary {
public:
	int Attempted;
	int Succeeded;
	std::vector<RecoveryAction> Outcomes;
	RecoverySummary() : Attempted(0), Succeeded(0) { };
	void Record(const RecoveryActionType Type, const bool Success);
	bool Success(void) const { return(Succeeded > 0); };
	bool Contains(const RecoveryActionType Type) const;
	std::string WriteTXT(void) const;
};

// The physical USB device node backing the controller
class UsbDevice {
public:
	std::filesystem::path Path;
	std::string Vendor;
	std::string Product;
	std::string BusNumber;
	std::string DeviceNumber;
	std::string WriteTXT(void) const { return(Vendor + ":" + Product + " at " + BusNumber + ":" + DeviceNumber); };
};

enum class PollResult
{
	Satisfied = 0,
	TimedOut,
};

class SystemInterface;
class MonitorLog;

// btmonitor-checks.cpp
CheckResult CheckModules(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
CheckResult CheckHardware(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
CheckResult CheckService(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
CheckResult CheckFunctionality(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
bool CheckFirmware(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
bool ScanUSBForBluetooth(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, std::vector<std::string>& Devices);
bool DetectBCMResetFailure(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
HealthReport EvaluateHealth(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);

// btmonitor-recovery.cpp
PollResult PollUntil(SystemInterface& System, MonitorLog& Log, const std::function<bool(void)>& Condition, const int IntervalSeconds, const int MaxWaitSeconds, const std::string& ProgressMessage = "");
bool WaitForEnumeration(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const int MaxWaitSeconds);
bool LocateUSBDeviceByID(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const std::string& Vendor, const std::string& Product, UsbDevice& Device);
bool LocateUSBDevice(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, UsbDevice& Device);
bool RecoveryFixBCMReset(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
bool RecoveryFixPowerManagement(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
bool RecoveryResetUSB(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
bool RecoveryRestartService(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
bool RecoveryReloadModules(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);
RecoverySummary RunRecoveryLadder(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, const HealthReport& Report);
RecoverySummary RunRecoverySubset(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log);

// btmonitor.cpp
extern volatile bool bRun;
void SignalHandlerSIGINT(int signal);
void SignalHandlerSIGHUP(int signal);
bool AskForLimitedRecovery(MonitorLog& Log, std::istream& Input, const bool Interactive);
int RunMonitorLoop(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, std::istream& Input, const bool Interactive);
int RunOperation(SystemInterface& System, const MonitorConfig& Config, MonitorLog& Log, std::istream& Input, const bool Interactive);

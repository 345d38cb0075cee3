#pragma once

#include <filesystem>
#include <string>
#include <vector>

class MonitorLog;

class CommandResult {
public:
	int ExitCode;
	bool TimedOut;
	std::string Output;	// stdout and stderr, interleaved
	CommandResult(const int e = -1, const std::string& o = "", const bool t = false) : ExitCode(e), TimedOut(t), Output(o) { };
	bool Succeeded(void) const { return((ExitCode == 0) && !TimedOut); };
};

// One entry per controller the kernel knows about, the same data hciconfig prints.
class HciDevice {
public:
	std::string Name;
	std::string Address;
	bool Up;
	bool Running;
	HciDevice(const std::string& n = "", const std::string& a = "", const bool u = false, const bool r = false) : Name(n), Address(a), Up(u), Running(r) { };
	bool IsUpRunning(void) const { return(Up && Running); };
};

enum class ServiceState
{
	Active = 0,
	Inactive,
	Unavailable,	// no init system we can talk to
};

/////////////////////////////////////////////////////////////////////////////
// Every fact about the host the monitor needs goes through this class.
// LinuxSystem talks to the real machine, the tests substitute a scripted fake.
class SystemInterface {
public:
	virtual ~SystemInterface() { };
	virtual bool IsRoot(void) = 0;
	virtual bool HasPasswordlessSudo(void) = 0;
	virtual bool CommandExists(const std::string& Name) = 0;
	// TimeoutSeconds of zero waits forever. A timeout kills the child and reports ExitCode 124.
	virtual CommandResult Run(const std::vector<std::string>& Arguments, const int TimeoutSeconds = 0, const std::string& Input = "") = 0;
	virtual bool Exists(const std::filesystem::path& Path) = 0;
	virtual bool IsDirectory(const std::filesystem::path& Path) = 0;
	virtual std::vector<std::filesystem::path> ListDirectory(const std::filesystem::path& Path) = 0;
	// Symlinks resolved, empty path if Path does not exist.
	virtual std::filesystem::path Canonical(const std::filesystem::path& Path) = 0;
	virtual bool ReadFile(const std::filesystem::path& Path, std::string& Contents) = 0;
	virtual bool WriteFile(const std::filesystem::path& Path, const std::string& Contents) = 0;
	virtual bool CreateDirectory(const std::filesystem::path& Path) = 0;	// parents included, like mkdir -p
	virtual bool IsModuleLoaded(const std::string& Module) = 0;
	virtual std::vector<HciDevice> HciDevices(void) = 0;
	virtual ServiceState QueryService(const std::string& Unit) = 0;
	virtual bool ProcessRunning(const std::string& Name) = 0;
	virtual void Sleep(const int Seconds) = 0;
};

class LinuxSystem : public SystemInterface {
public:
	bool IsRoot(void) override;
	bool HasPasswordlessSudo(void) override;
	bool CommandExists(const std::string& Name) override;
	CommandResult Run(const std::vector<std::string>& Arguments, const int TimeoutSeconds = 0, const std::string& Input = "") override;
	bool Exists(const std::filesystem::path& Path) override;
	bool IsDirectory(const std::filesystem::path& Path) override;
	std::vector<std::filesystem::path> ListDirectory(const std::filesystem::path& Path) override;
	std::filesystem::path Canonical(const std::filesystem::path& Path) override;
	bool ReadFile(const std::filesystem::path& Path, std::string& Contents) override;
	bool WriteFile(const std::filesystem::path& Path, const std::string& Contents) override;
	bool CreateDirectory(const std::filesystem::path& Path) override;
	bool IsModuleLoaded(const std::string& Module) override;
	std::vector<HciDevice> HciDevices(void) override;
	ServiceState QueryService(const std::string& Unit) override;
	bool ProcessRunning(const std::string& Name) override;
	void Sleep(const int Seconds) override;
protected:
	std::filesystem::path FindProgram(const std::string& Name) const;
	ServiceState QuerySystemdOverDBus(const std::string& Unit);
};

/////////////////////////////////////////////////////////////////////////////
// Privilege gate. Root runs directly, passwordless sudo re-invokes, anything else fails fast.
bool CanElevate(SystemInterface& System);
bool RequirePrivileges(SystemInterface& System, MonitorLog& Log, const std::string& Action);
CommandResult RunPrivileged(SystemInterface& System, MonitorLog& Log, const std::vector<std::string>& Arguments, const int TimeoutSeconds = 0, const std::string& Input = "");
bool WritePrivileged(SystemInterface& System, MonitorLog& Log, const std::filesystem::path& Path, const std::string& Contents);
bool CreateDirectoryPrivileged(SystemInterface& System, MonitorLog& Log, const std::filesystem::path& Path);

std::string ToLower(std::string Text);
bool ContainsNoCase(const std::string& Haystack, const std::string& Needle);
std::string TrimWhitespace(const std::string& Text);
std::string JoinArguments(const std::vector<std::string>& Arguments);

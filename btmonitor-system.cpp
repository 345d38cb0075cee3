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
#include <bluetooth/bluetooth.h> // apt install libbluetooth-dev
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <dbus/dbus.h> //  sudo apt install libdbus-1-dev
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>
#include "btmonitor-log.h"
#include "btmonitor-system.h"

/////////////////////////////////////////////////////////////////////////////
std::string ToLower(std::string Text)
{
	std::transform(Text.begin(), Text.end(), Text.begin(), [](unsigned char c) { return(std::tolower(c)); });
	return(Text);
}
bool ContainsNoCase(const std::string& Haystack, const std::string& Needle)
{
	return(ToLower(Haystack).find(ToLower(Needle)) != std::string::npos);
}
std::string TrimWhitespace(const std::string& Text)
{
	const std::string delimiters(" \t\r\n");
	auto first = Text.find_first_not_of(delimiters);
	if (first == std::string::npos)
		return(std::string());
	auto last = Text.find_last_not_of(delimiters);
	return(Text.substr(first, last - first + 1));
}
std::string JoinArguments(const std::vector<std::string>& Arguments)
{
	std::ostringstream ssValue;
	for (auto it = Arguments.begin(); it != Arguments.end(); ++it)
	{
		if (it != Arguments.begin())
			ssValue << " ";
		ssValue << *it;
	}
	return(ssValue.str());
}
/////////////////////////////////////////////////////////////////////////////
bool LinuxSystem::IsRoot(void)
{
	return(geteuid() == 0);
}
bool LinuxSystem::HasPasswordlessSudo(void)
{
	if (!CommandExists("sudo"))
		return(false);
	return(Run({ "sudo", "-n", "true" }).Succeeded());
}
// modprobe, udevadm and friends live in sbin, which is often missing from a user's PATH
std::filesystem::path LinuxSystem::FindProgram(const std::string& Name) const
{
	if (Name.empty())
		return(std::filesystem::path());
	if (Name.find('/') != std::string::npos)
		return((0 == access(Name.c_str(), X_OK)) ? std::filesystem::path(Name) : std::filesystem::path());
	std::string SearchPath;
	const char* Environment = getenv("PATH");
	if (Environment != nullptr)
		SearchPath = Environment;
	SearchPath.append(":/usr/local/sbin:/usr/sbin:/sbin:/usr/bin:/bin");
	std::stringstream ss(SearchPath);
	std::string Directory;
	while (std::getline(ss, Directory, ':'))
	{
		if (Directory.empty())
			continue;
		std::filesystem::path Candidate(std::filesystem::path(Directory) / Name);
		if (0 == access(Candidate.c_str(), X_OK))
			return(Candidate);
	}
	return(std::filesystem::path());
}
bool LinuxSystem::CommandExists(const std::string& Name)
{
	return(!FindProgram(Name).empty());
}
CommandResult LinuxSystem::Run(const std::vector<std::string>& Arguments, const int TimeoutSeconds, const std::string& Input)
{
	CommandResult rval;
	if (Arguments.empty())
		return(rval);
	const std::filesystem::path Program(FindProgram(Arguments.front()));
	if (Program.empty())
	{
		rval.ExitCode = 127;
		rval.Output = Arguments.front() + ": command not found";
		return(rval);
	}
	int OutputPipe[2];
	int InputPipe[2];
	if (pipe2(OutputPipe, O_CLOEXEC) < 0)
	{
		std::cerr << "Error: pipe2 failed for " << Arguments.front() << ": " << strerror(errno) << std::endl;
		return(rval);
	}
	if (pipe2(InputPipe, O_CLOEXEC) < 0)
	{
		std::cerr << "Error: pipe2 failed for " << Arguments.front() << ": " << strerror(errno) << std::endl;
		close(OutputPipe[0]);
		close(OutputPipe[1]);
		return(rval);
	}
	std::vector<char*> argv;
	for (auto& Argument : Arguments)
		argv.push_back(const_cast<char*>(Argument.c_str()));
	argv.push_back(nullptr);

	pid_t pid = fork();
	if (pid < 0)
	{
		std::cerr << "Error: fork failed for " << Arguments.front() << ": " << strerror(errno) << std::endl;
		close(OutputPipe[0]);
		close(OutputPipe[1]);
		close(InputPipe[0]);
		close(InputPipe[1]);
		return(rval);
	}
	if (pid == 0)
	{
		// child: stdin from our pipe, stdout and stderr both into the output pipe (2>&1)
		dup2(InputPipe[0], STDIN_FILENO);
		dup2(OutputPipe[1], STDOUT_FILENO);
		dup2(OutputPipe[1], STDERR_FILENO);
		std::signal(SIGPIPE, SIG_DFL);
		execv(Program.c_str(), argv.data());
		_exit(127);
	}
	close(InputPipe[0]);
	close(OutputPipe[1]);

	size_t Written = 0;
	while (Written < Input.length())
	{
		ssize_t n = write(InputPipe[1], Input.data() + Written, Input.length() - Written);
		if (n < 0)
		{
			if (errno == EINTR)
				continue;
			break;	// EPIPE: the child is not reading stdin
		}
		Written += n;
	}
	close(InputPipe[1]);

	const auto Deadline = std::chrono::steady_clock::now() + std::chrono::seconds(TimeoutSeconds);
	bool bReading = true;
	while (bReading)
	{
		int WaitMilliseconds = -1;
		if (TimeoutSeconds > 0)
		{
			auto Remaining = std::chrono::duration_cast<std::chrono::milliseconds>(Deadline - std::chrono::steady_clock::now()).count();
			if (Remaining <= 0)
			{
				kill(pid, SIGKILL);
				rval.TimedOut = true;
				break;
			}
			WaitMilliseconds = int(Remaining);
		}
		struct pollfd OutputPoll = { OutputPipe[0], POLLIN, 0 };
		int PollReturn = poll(&OutputPoll, 1, WaitMilliseconds);
		if (PollReturn < 0)
		{
			if (errno == EINTR)
				continue;
			std::cerr << "Error: poll failed for " << Arguments.front() << ": " << strerror(errno) << std::endl;
			break;
		}
		if (PollReturn == 0)
			continue;
		char buffer[4096];
		ssize_t n = read(OutputPipe[0], buffer, sizeof(buffer));
		if (n > 0)
			rval.Output.append(buffer, n);
		else if (n == 0)
			bReading = false;
		else if (errno != EINTR)
			bReading = false;
	}
	close(OutputPipe[0]);

	int status = 0;
	// a child that closed its output can still outlive the deadline
	if ((TimeoutSeconds > 0) && !rval.TimedOut)
	{
		for (;;)
		{
			pid_t Reaped = waitpid(pid, &status, WNOHANG);
			if (Reaped == pid)
				break;
			if ((Reaped < 0) && (errno != EINTR))
				break;
			if (std::chrono::steady_clock::now() >= Deadline)
			{
				kill(pid, SIGKILL);
				rval.TimedOut = true;
				break;
			}
			usleep(10000);
		}
		if (!rval.TimedOut)
		{
			if (WIFEXITED(status))
				rval.ExitCode = WEXITSTATUS(status);
			else if (WIFSIGNALED(status))
				rval.ExitCode = 128 + WTERMSIG(status);
			return(rval);
		}
	}
	while (waitpid(pid, &status, 0) < 0)
		if (errno != EINTR)
			break;
	if (rval.TimedOut)
		rval.ExitCode = 124;
	else if (WIFEXITED(status))
		rval.ExitCode = WEXITSTATUS(status);
	else if (WIFSIGNALED(status))
		rval.ExitCode = 128 + WTERMSIG(status);
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
bool LinuxSystem::Exists(const std::filesystem::path& Path)
{
	std::error_code ec;
	return(std::filesystem::exists(Path, ec));
}
bool LinuxSystem::IsDirectory(const std::filesystem::path& Path)
{
	std::error_code ec;
	return(std::filesystem::is_directory(Path, ec));
}
std::vector<std::filesystem::path> LinuxSystem::ListDirectory(const std::filesystem::path& Path)
{
	std::vector<std::filesystem::path> rval;
	std::error_code ec;
	for (auto it = std::filesystem::directory_iterator(Path, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec))
		rval.push_back(it->path());
	std::sort(rval.begin(), rval.end());
	return(rval);
}
std::filesystem::path LinuxSystem::Canonical(const std::filesystem::path& Path)
{
	std::error_code ec;
	std::filesystem::path rval(std::filesystem::canonical(Path, ec));
	if (ec)
		rval.clear();
	return(rval);
}
bool LinuxSystem::ReadFile(const std::filesystem::path& Path, std::string& Contents)
{
	bool rval = false;
	std::ifstream TheFile(Path);
	if (TheFile.is_open())
	{
		std::ostringstream ssValue;
		ssValue << TheFile.rdbuf();
		Contents = ssValue.str();
		// sysfs attributes end with a newline
		while (!Contents.empty() && (Contents.back() == '\n'))
			Contents.pop_back();
		TheFile.close();
		rval = true;
	}
	return(rval);
}
bool LinuxSystem::WriteFile(const std::filesystem::path& Path, const std::string& Contents)
{
	std::ofstream TheFile(Path, std::ios_base::out | std::ios_base::trunc);
	if (!TheFile.is_open())
		return(false);
	TheFile << Contents << std::endl;	// sysfs reports write errors on flush
	TheFile.close();
	return(!TheFile.fail());
}
bool LinuxSystem::CreateDirectory(const std::filesystem::path& Path)
{
	std::error_code ec;
	std::filesystem::create_directories(Path, ec);
	if (ec)
	{
		std::cerr << "Error: could not create " << Path << ": " << ec.message() << std::endl;
		return(false);
	}
	return(true);
}
bool LinuxSystem::IsModuleLoaded(const std::string& Module)
{
	bool rval = false;
	std::ifstream TheFile("/proc/modules");
	if (TheFile.is_open())
	{
		std::string TheLine;
		while (!rval && std::getline(TheFile, TheLine))
			if (TheLine.compare(0, Module.length() + 1, Module + " ") == 0)
				rval = true;
		TheFile.close();
	}
	// built in drivers never show up in /proc/modules, but do have a /sys/module entry
	if (!rval)
		rval = IsDirectory(std::filesystem::path("/sys/module") / Module);
	return(rval);
}
std::vector<HciDevice> LinuxSystem::HciDevices(void)
{
	// https://www.linumiz.com/bluetooth-list-available-controllers/
	// Same ioctl hciconfig uses to print "UP RUNNING"
	std::vector<HciDevice> rval;
	for (auto i = 0; i < HCI_MAX_DEV; i++)
	{
		struct hci_dev_info hci_device_info;
		if (hci_devinfo(i, &hci_device_info) == 0)
		{
			char addr[19] = { 0 };
			ba2str(&hci_device_info.bdaddr, addr);
			rval.push_back(HciDevice(
				std::string(hci_device_info.name),
				std::string(addr),
				hci_test_bit(HCI_UP, &hci_device_info.flags) != 0,
				hci_test_bit(HCI_RUNNING, &hci_device_info.flags) != 0));
		}
	}
	return(rval);
}
/////////////////////////////////////////////////////////////////////////////
// https://www.freedesktop.org/software/systemd/man/latest/org.freedesktop.systemd1.html
ServiceState LinuxSystem::QuerySystemdOverDBus(const std::string& Unit)
{
	ServiceState rval(ServiceState::Unavailable);
	std::string UnitName(Unit);
	if (UnitName.find('.') == std::string::npos)
		UnitName.append(".service");

	DBusError dbus_error;
	dbus_error_init(&dbus_error); // https://dbus.freedesktop.org/doc/api/html/group__DBusErrors.html#ga8937f0b7cdf8554fa6305158ce453fbe
	DBusConnection* dbus_conn = dbus_bus_get(DBUS_BUS_SYSTEM, &dbus_error); // https://dbus.freedesktop.org/doc/api/html/group__DBusBus.html#ga77ba5250adb84620f16007e1b023cf26
	if (dbus_error_is_set(&dbus_error))
	{
		dbus_error_free(&dbus_error);
		return(rval);
	}
	if (dbus_conn == nullptr)
		return(rval);
	dbus_connection_set_exit_on_disconnect(dbus_conn, FALSE);	// the shared system bus connection would otherwise _exit() the monitor

	std::string UnitPath;
	DBusMessage* dbus_msg = dbus_message_new_method_call("org.freedesktop.systemd1", "/org/freedesktop/systemd1", "org.freedesktop.systemd1.Manager", "GetUnit");
	if (!dbus_msg)
		std::cerr << "Can't allocate dbus_message_new_method_call: " << __FILE__ << "(" << __LINE__ << ")" << std::endl;
	else
	{
		const char* unit_name = UnitName.c_str();
		dbus_message_append_args(dbus_msg, DBUS_TYPE_STRING, &unit_name, DBUS_TYPE_INVALID);
		DBusMessage* dbus_reply = dbus_connection_send_with_reply_and_block(dbus_conn, dbus_msg, DBUS_TIMEOUT_USE_DEFAULT, &dbus_error);
		dbus_message_unref(dbus_msg);
		if (!dbus_reply)
		{
			if (dbus_error_is_set(&dbus_error))
			{
				// systemd answers, but has not loaded the unit. A unit that is not loaded is not running.
				if (dbus_error_has_name(&dbus_error, "org.freedesktop.systemd1.NoSuchUnit"))
					rval = ServiceState::Inactive;
				dbus_error_free(&dbus_error);
			}
		}
		else
		{
			const char* unit_path = nullptr;
			if (dbus_message_get_args(dbus_reply, &dbus_error, DBUS_TYPE_OBJECT_PATH, &unit_path, DBUS_TYPE_INVALID))
				UnitPath = unit_path;
			else if (dbus_error_is_set(&dbus_error))
				dbus_error_free(&dbus_error);
			dbus_message_unref(dbus_reply);
		}
	}
	if (!UnitPath.empty())
	{
		dbus_msg = dbus_message_new_method_call("org.freedesktop.systemd1", UnitPath.c_str(), "org.freedesktop.DBus.Properties", "Get");
		if (!dbus_msg)
			std::cerr << "Can't allocate dbus_message_new_method_call: " << __FILE__ << "(" << __LINE__ << ")" << std::endl;
		else
		{
			const char* unit_interface = "org.freedesktop.systemd1.Unit";
			const char* active_state = "ActiveState";
			dbus_message_append_args(dbus_msg, DBUS_TYPE_STRING, &unit_interface, DBUS_TYPE_STRING, &active_state, DBUS_TYPE_INVALID);
			DBusMessage* dbus_reply = dbus_connection_send_with_reply_and_block(dbus_conn, dbus_msg, DBUS_TIMEOUT_USE_DEFAULT, &dbus_error);
			dbus_message_unref(dbus_msg);
			if (!dbus_reply)
			{
				if (dbus_error_is_set(&dbus_error))
					dbus_error_free(&dbus_error);
			}
			else
			{
				DBusMessageIter root_iter;
				if (dbus_message_iter_init(dbus_reply, &root_iter))
				{
					if (DBUS_TYPE_VARIANT == dbus_message_iter_get_arg_type(&root_iter))
					{
						// recurse into variant to get string
						DBusMessageIter variant_iter;
						dbus_message_iter_recurse(&root_iter, &variant_iter);
						if (DBUS_TYPE_STRING == dbus_message_iter_get_arg_type(&variant_iter))
						{
							DBusBasicValue value;
							dbus_message_iter_get_basic(&variant_iter, &value);
							std::string State(value.str);
							rval = ((State == "active") || (State == "reloading")) ? ServiceState::Active : ServiceState::Inactive;
						}
					}
				}
				dbus_message_unref(dbus_reply);
			}
		}
	}
	// When using the System Bus, unreference the connection instead of closing it
	dbus_connection_unref(dbus_conn);
	return(rval);
}
ServiceState LinuxSystem::QueryService(const std::string& Unit)
{
	ServiceState rval(QuerySystemdOverDBus(Unit));
	if ((rval == ServiceState::Unavailable) && CommandExists("systemctl"))
		rval = Run({ "systemctl", "is-active", "--quiet", Unit }).Succeeded() ? ServiceState::Active : ServiceState::Inactive;
	return(rval);
}
bool LinuxSystem::ProcessRunning(const std::string& Name)
{
	bool rval = false;
	for (auto& Entry : ListDirectory("/proc"))
	{
		const std::string Pid(Entry.filename().string());
		if (Pid.empty() || !std::all_of(Pid.begin(), Pid.end(), [](unsigned char c) { return(std::isdigit(c)); }))
			continue;
		std::string Command;
		if (ReadFile(Entry / "comm", Command) && (Command == Name))
		{
			rval = true;
			break;
		}
	}
	return(rval);
}
void LinuxSystem::Sleep(const int Seconds)
{
	if (Seconds > 0)
		sleep(Seconds);
}
/////////////////////////////////////////////////////////////////////////////
bool CanElevate(SystemInterface& System)
{
	return(System.IsRoot() || System.HasPasswordlessSudo());
}
bool RequirePrivileges(SystemInterface& System, MonitorLog& Log, const std::string& Action)
{
	if (CanElevate(System))
		return(true);
	Log.Error("Cannot " + Action + " without root privileges");
	return(false);
}
CommandResult RunPrivileged(SystemInterface& System, MonitorLog& Log, const std::vector<std::string>& Arguments, const int TimeoutSeconds, const std::string& Input)
{
	if (System.IsRoot())
		return(System.Run(Arguments, TimeoutSeconds, Input));
	if (System.HasPasswordlessSudo())
	{
		std::vector<std::string> SudoArguments({ "sudo", "-n" });
		SudoArguments.insert(SudoArguments.end(), Arguments.begin(), Arguments.end());
		return(System.Run(SudoArguments, TimeoutSeconds, Input));
	}
	Log.Error("This recovery action requires root privileges. Please run as root or with sudo.");
	return(CommandResult(126, "permission denied"));
}
bool WritePrivileged(SystemInterface& System, MonitorLog& Log, const std::filesystem::path& Path, const std::string& Contents)
{
	bool rval = false;
	if (System.IsRoot())
		rval = System.WriteFile(Path, Contents);
	else if (System.HasPasswordlessSudo())
		rval = System.Run({ "sudo", "-n", "tee", Path.string() }, 0, Contents + "\n").Succeeded();
	else
		Log.Error("This recovery action requires root privileges. Please run as root or with sudo.");
	if (!rval)
		Log.Verbose("Could not write \"" + Contents + "\" to " + Path.string());
	return(rval);
}
bool CreateDirectoryPrivileged(SystemInterface& System, MonitorLog& Log, const std::filesystem::path& Path)
{
	bool rval = false;
	if (System.IsRoot())
		rval = System.CreateDirectory(Path);
	else if (System.HasPasswordlessSudo())
		rval = System.Run({ "sudo", "-n", "mkdir", "-p", Path.string() }).Succeeded();
	else
		Log.Error("This recovery action requires root privileges. Please run as root or with sudo.");
	if (!rval)
		Log.Verbose("Could not create directory " + Path.string());
	return(rval);
}

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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include "btmonitor.h"
#include "btmonitor-log.h"

/////////////////////////////////////////////////////////////////////////////
std::string timeToISO8601(const time_t& TheTime, const bool LocalTime)
{
	std::ostringstream ISOTime;
	struct tm UTC;
	struct tm* timecallresult(nullptr);
	if (LocalTime)
		timecallresult = localtime_r(&TheTime, &UTC);
	else
		timecallresult = gmtime_r(&TheTime, &UTC);
	if (nullptr != timecallresult)
	{
		ISOTime.fill('0');
		if (!((UTC.tm_year == 70) && (UTC.tm_mon == 0) && (UTC.tm_mday == 1)))
		{
			ISOTime << UTC.tm_year + 1900 << "-";
			ISOTime.width(2);
			ISOTime << UTC.tm_mon + 1 << "-";
			ISOTime.width(2);
			ISOTime << UTC.tm_mday << "T";
		}
		ISOTime.width(2);
		ISOTime << UTC.tm_hour << ":";
		ISOTime.width(2);
		ISOTime << UTC.tm_min << ":";
		ISOTime.width(2);
		ISOTime << UTC.tm_sec;
	}
	return(ISOTime.str());
}
// The log files use a space where ISO8601 puts the T, the same layout `date "+%Y-%m-%d %H:%M:%S"` produces
std::string timeToExcelDate(const time_t& TheTime, const bool LocalTime)
{
	std::string ExcelDate(timeToISO8601(TheTime, LocalTime));
	if (ExcelDate.length() > 10)
		ExcelDate.replace(10, 1, " ");
	return(ExcelDate);
}
std::string timeToExcelLocal(const time_t& TheTime)
{
	return(timeToExcelDate(TheTime, true));
}
std::string getTimeISO8601(const bool LocalTime)
{
	time_t timer;
	time(&timer);
	return(timeToISO8601(timer, LocalTime));
}
std::string getTimeExcelLocal(void)
{
	time_t timer;
	time(&timer);
	return(timeToExcelLocal(timer));
}
/////////////////////////////////////////////////////////////////////////////
std::string LogSeverity2String(const LogSeverity Severity)
{
	switch (Severity)
	{
	case LogSeverity::Info:
		return(std::string("INFO"));
	case LogSeverity::Warning:
		return(std::string("WARNING"));
	case LogSeverity::Error:
		return(std::string("ERROR"));
	case LogSeverity::Recovery:
		return(std::string("RECOVERY"));
	case LogSeverity::Verbose:
		return(std::string("VERBOSE"));
	}
	return(std::string("UNKNOWN"));
}
/////////////////////////////////////////////////////////////////////////////
// ANSI color codes, only used when the stream is a terminal
const char* const ColorRed("\033[0;31m");
const char* const ColorGreen("\033[0;32m");
const char* const ColorYellow("\033[0;33m");
const char* const ColorBlue("\033[0;34m");
const char* const ColorPurple("\033[0;35m");
const char* const ColorNone("\033[0m");
/////////////////////////////////////////////////////////////////////////////
MonitorLog::MonitorLog(const MonitorConfig& Config) :
	ConsoleVerbosity(Config.ConsoleVerbosity),
	ColorStdout(isatty(STDOUT_FILENO) == 1),
	ColorStderr(isatty(STDERR_FILENO) == 1)
{
	if (!Config.LogDirectory.empty())
	{
		EventLogFileName = Config.EventLogFileName();
		StatusLogFileName = Config.StatusLogFileName();
		RecoveryLogFileName = Config.RecoveryLogFileName();
	}
}
bool MonitorLog::AppendLine(const std::filesystem::path& FileName, const std::string& Line)
{
	bool rval = false;
	if (!FileName.empty())
	{
		std::ofstream LogFile(FileName, std::ios_base::out | std::ios_base::app | std::ios_base::ate);
		if (LogFile.is_open())
		{
			LogFile << Line << std::endl;
			LogFile.close();
			rval = true;
		}
		else
			std::cerr << "Error: could not append to " << FileName << ": " << strerror(errno) << std::endl;
	}
	return(rval);
}
void MonitorLog::Console(const LogSeverity Severity, const std::string& Timestamp, const std::string& Message)
{
	const bool ToError = (Severity == LogSeverity::Warning) || (Severity == LogSeverity::Error);
	std::ostream& TheStream(ToError ? std::cerr : std::cout);
	const bool Color(ToError ? ColorStderr : ColorStdout);
	const char* TheColor(ColorNone);
	switch (Severity)
	{
	case LogSeverity::Info:
		TheColor = ColorGreen;
		break;
	case LogSeverity::Warning:
		TheColor = ColorYellow;
		break;
	case LogSeverity::Error:
		TheColor = ColorRed;
		break;
	case LogSeverity::Recovery:
		TheColor = ColorPurple;
		break;
	case LogSeverity::Verbose:
		TheColor = ColorBlue;
		break;
	}
	if (Color)
		TheStream << TheColor << LogSeverity2String(Severity) << " [" << Timestamp << "]:" << ColorNone << " " << Message << std::endl;
	else
		TheStream << LogSeverity2String(Severity) << " [" << Timestamp << "]: " << Message << std::endl;
}
void MonitorLog::Log(const LogSeverity Severity, const std::string& Message)
{
	if ((Severity == LogSeverity::Verbose) && (ConsoleVerbosity < 2))
		return;
	const std::string Timestamp(getTimeExcelLocal());
	const bool ToError = (Severity == LogSeverity::Warning) || (Severity == LogSeverity::Error);
	if (ToError || (ConsoleVerbosity > 0))
		Console(Severity, Timestamp, Message);
	AppendLine(EventLogFileName, "[" + LogSeverity2String(Severity) + "] [" + Timestamp + "] " + Message);
}
void MonitorLog::Recovery(const std::string& Message)
{
	Log(LogSeverity::Recovery, Message);
	AppendLine(RecoveryLogFileName, "[" + getTimeExcelLocal() + "] " + Message);
}
void MonitorLog::Status(const std::string& Message)
{
	AppendLine(StatusLogFileName, "[" + getTimeExcelLocal() + "] " + Message);
}
void MonitorLog::RecoveryBlock(const std::string& Block)
{
	AppendLine(RecoveryLogFileName, "[" + getTimeExcelLocal() + "] " + Block);
}
/////////////////////////////////////////////////////////////////////////////
bool ValidateDirectory(const std::filesystem::path& DirectoryName)
{
	bool rval = false;
	// https://linux.die.net/man/2/stat
	struct stat64 StatBuffer;
	if (0 == stat64(DirectoryName.c_str(), &StatBuffer))
		if (S_ISDIR(StatBuffer.st_mode))
		{
			// https://linux.die.net/man/2/access
			if (0 == access(DirectoryName.c_str(), R_OK | W_OK))
				rval = true;
			else
			{
				switch (errno)
				{
				case EACCES:
					std::cerr << DirectoryName << " (" << errno << ") The requested access would be denied to the file, or search permission is denied for one of the directories in the path prefix of pathname." << std::endl;
					break;
				case ELOOP:
					std::cerr << DirectoryName << " (" << errno << ") Too many symbolic links were encountered in resolving pathname." << std::endl;
					break;
				case ENAMETOOLONG:
					std::cerr << DirectoryName << " (" << errno << ") pathname is too long." << std::endl;
					break;
				case ENOENT:
					std::cerr << DirectoryName << " (" << errno << ") A component of pathname does not exist or is a dangling symbolic link." << std::endl;
					break;
				case ENOTDIR:
					std::cerr << DirectoryName << " (" << errno << ") A component used as a directory in pathname is not, in fact, a directory." << std::endl;
					break;
				case EROFS:
					std::cerr << DirectoryName << " (" << errno << ") Write permission was requested for a file on a read-only file system." << std::endl;
					break;
				default:
					std::cerr << DirectoryName << " (" << errno << ") " << strerror(errno) << std::endl;
				}
			}
		}
		else
			std::cerr << DirectoryName << " is not a directory." << std::endl;
	return(rval);
}
// Creates the log directory if it is missing. An unusable log directory is the one fatal startup error.
bool PrepareLogDirectory(const std::filesystem::path& DirectoryName)
{
	if (DirectoryName.empty())
		return(false);
	std::error_code ec;
	if (!std::filesystem::exists(DirectoryName, ec))
	{
		std::filesystem::create_directories(DirectoryName, ec);
		if (ec)
		{
			std::cerr << "ERROR: Failed to create log directory at " << DirectoryName << ": " << ec.message() << std::endl;
			return(false);
		}
	}
	return(ValidateDirectory(DirectoryName));
}

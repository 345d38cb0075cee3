#pragma once

#include <ctime>
#include <filesystem>
#include <string>

class MonitorConfig;

std::string timeToISO8601(const time_t& TheTime, const bool LocalTime = false);
std::string timeToExcelDate(const time_t& TheTime, const bool LocalTime = false);
std::string timeToExcelLocal(const time_t& TheTime);
std::string getTimeISO8601(const bool LocalTime = false);
std::string getTimeExcelLocal(void);

enum class LogSeverity
{
	Info = 0,
	Warning,
	Error,
	Recovery,
	Verbose,
};
std::string LogSeverity2String(const LogSeverity Severity);

/////////////////////////////////////////////////////////////////////////////
// Three append-only files in the log directory plus the console.
//   event log:    [SEVERITY] [YYYY-MM-DD HH:MM:SS] message
//   status log:   [YYYY-MM-DD HH:MM:SS] message
//   recovery log: [YYYY-MM-DD HH:MM:SS] message
// With an empty log directory nothing is written to disk.
class MonitorLog {
public:
	MonitorLog(const MonitorConfig& Config);
	void Info(const std::string& Message) { Log(LogSeverity::Info, Message); };
	void Warning(const std::string& Message) { Log(LogSeverity::Warning, Message); };
	void Error(const std::string& Message) { Log(LogSeverity::Error, Message); };
	void Verbose(const std::string& Message) { Log(LogSeverity::Verbose, Message); };
	void Recovery(const std::string& Message);
	void Status(const std::string& Message);
	void RecoveryBlock(const std::string& Block);
	void Log(const LogSeverity Severity, const std::string& Message);
protected:
	bool AppendLine(const std::filesystem::path& FileName, const std::string& Line);
	void Console(const LogSeverity Severity, const std::string& Timestamp, const std::string& Message);
	std::filesystem::path EventLogFileName;
	std::filesystem::path StatusLogFileName;
	std::filesystem::path RecoveryLogFileName;
	int ConsoleVerbosity;
	bool ColorStdout;
	bool ColorStderr;
};

bool ValidateDirectory(const std::filesystem::path& DirectoryName);
bool PrepareLogDirectory(const std::filesystem::path& DirectoryName);

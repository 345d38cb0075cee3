#pragma once

#include <filesystem>
#include <iostream>
#include <string>

class MonitorConfig;

extern const std::string ProgramVersionString;

enum class ParseOutcome
{
	Run = 0,
	ExitSuccess,	// --help, --version
	ExitFailure,
};

void PrintUsage(const std::string& ProgramName, const MonitorConfig& Config, std::ostream& Output);
void PrintVersion(std::ostream& Output);
bool ReadConfigFile(const std::filesystem::path& FileName, MonitorConfig& Config, std::ostream& Errors);
// Options given after -c override the values read from the file.
ParseOutcome ParseCommandLine(int argc, char** argv, MonitorConfig& Config, std::ostream& Output, std::ostream& Errors);

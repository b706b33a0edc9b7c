#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <wx/cmdline.h>
#include <wx/string.h>

#include <cstdio>
#include <string>
#include <vector>

#include "SanitizerLogic.h" // For SanitizeOptions

struct ReplacementValidation
{
	std::string replacement; // UTF-8 encoded, set only on success
	bool success = false;
	std::string errorMessage;
};

struct CommandLineResult
{
	SanitizeOptions options;
	std::vector<std::string> targets;
	bool verbose = false;
	bool success = false;
	std::string errorMessage;
};

class CommandLine
{
public:
	static void Describe(wxCmdLineParser &parser);
	static ReplacementValidation ValidateReplacement(const wxString &candidate);
	static CommandLineResult Interpret(const wxCmdLineParser &parser, const std::string &defaultReplacement);
	static void PrintUsage(const wxCmdLineParser &parser, FILE *stream);
};

#endif // COMMANDLINE_H

#include "CommandLine.h"

#include <wx/filename.h> // For wxFileName::GetPathSeparators

#include <cstdio>
#include <string>
#include <vector>

// Registers the switches, options and positional targets understood by sanitize_filenames
void CommandLine::Describe(wxCmdLineParser &parser)
{
	parser.SetLogo("Rename files and directories so their names only contain safe characters.\n");

	parser.AddSwitch("h", "help", "Show this help message and exit", wxCMD_LINE_OPTION_HELP);
	parser.AddSwitch("r", "recursive", "Recursively sanitize directories and their contents");
	parser.AddSwitch("n", "dry-run", "Show actions without renaming files");
	parser.AddSwitch("v", "verbose", "Print a summary for every target");
	parser.AddOption("c", "replacement", "Replacement character to use (default: _)");
	parser.AddParam("FILES", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL | wxCMD_LINE_PARAM_MULTIPLE);

	parser.AddUsageText("\nProvide one or more files or directories to sanitize their names in-place.");
	parser.AddUsageText("Use '--' to stop option parsing when filenames begin with '-'.");
	parser.AddUsageText("\nExamples:");
	parser.AddUsageText("  # sanitize a single file in the current directory");
	parser.AddUsageText("  sanitize_filenames \"My File.txt\"");
	parser.AddUsageText("\n  # preview changes without renaming");
	parser.AddUsageText("  sanitize_filenames --dry-run \"My File.txt\"");
	parser.AddUsageText("\n  # sanitize recursively and use '-' as the separator");
	parser.AddUsageText("  sanitize_filenames --recursive --replacement=- ~/Downloads");
	parser.AddUsageText("\n  # sanitize a file whose name starts with a dash");
	parser.AddUsageText("  sanitize_filenames -- \"--weird name.mp3\"");
}

// A replacement must be exactly one character and must not split the name into path components
ReplacementValidation CommandLine::ValidateReplacement(const wxString &candidate)
{
	ReplacementValidation result;
	if (candidate.empty())
	{
		result.errorMessage = "Replacement character cannot be empty";
		return result;
	}
	if (candidate.length() != 1)
	{
		result.errorMessage = "Replacement character must be a single character";
		return result;
	}
	if (wxFileName::GetPathSeparators().Find(candidate.GetChar(0)) != wxNOT_FOUND)
	{
		result.errorMessage = "Replacement character '" + std::string(candidate.utf8_str()) + "' is not allowed";
		return result;
	}

	result.replacement = std::string(candidate.utf8_str());
	result.success = true;
	return result;
}

// Turns a successfully parsed command line into the options and target list handed to SanitizerLogic
CommandLineResult CommandLine::Interpret(const wxCmdLineParser &parser, const std::string &defaultReplacement)
{
	CommandLineResult result;
	result.options.recursive = parser.Found("r");
	result.options.dryRun = parser.Found("n");
	result.options.replacement = defaultReplacement;
	result.verbose = parser.Found("v");

	wxString replacementValue;
	if (parser.Found("c", &replacementValue))
	{
		ReplacementValidation validation = ValidateReplacement(replacementValue);
		if (!validation.success)
		{
			result.errorMessage = validation.errorMessage;
			return result;
		}
		result.options.replacement = validation.replacement;
	}

	for (size_t i = 0; i < parser.GetParamCount(); ++i)
	{
		const wxString param = parser.GetParam(i);
		if (param == "." || param == "..")
		{
			continue; // Bare '.' and '..' are never renamed
		}
		// Targets go back to the encoding argv was decoded with, so they name the same entries
		const auto native = param.fn_str();
		const char *raw = native;
		result.targets.push_back(raw ? std::string(raw) : std::string(param.utf8_str()));
	}

	if (result.targets.empty())
	{
		result.errorMessage = "No files or directories specified";
		return result;
	}

	result.success = true;
	return result;
}

void CommandLine::PrintUsage(const wxCmdLineParser &parser, FILE *stream)
{
	std::fputs(parser.GetUsageString().utf8_str(), stream);
	std::fflush(stream);
}

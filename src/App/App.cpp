#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/app.h>
#include <wx/log.h>
#endif
#include "App.h"
#include "CommandLine.h"
#include "ConsoleLog.h"
#include <wx/config.h>

#include <cstdio>
#include <string>

wxIMPLEMENT_APP_CONSOLE(App);

bool App::OnInit()
{
	SetAppName("sanitize_filenames");

	// Action lines go to stdout, problems to stderr, without timestamps
	delete wxLog::SetActiveTarget(new ConsoleLog());
	wxLog::DisableTimestamp();

	// Read-only defaults; the tool never writes this file
	wxConfigBase::Set(new wxConfig(GetAppName()));
	m_settings = Settings::Load(wxConfigBase::Get());

	// Parses the command line through the OnCmdLine* hooks below
	return wxAppConsole::OnInit();
}

void App::OnInitCmdLine(wxCmdLineParser &parser)
{
	CommandLine::Describe(parser);
}

bool App::OnCmdLineParsed(wxCmdLineParser &parser)
{
	CommandLineResult result = CommandLine::Interpret(parser, m_settings.replacement);
	if (!result.success)
	{
		wxLogError("%s", result.errorMessage);
		CommandLine::PrintUsage(parser, stderr);
		m_earlyExitCode = 1;
		return true;
	}

	wxLog::SetVerbose(result.verbose);
	m_options = result.options;
	m_targets = result.targets;
	return true;
}

bool App::OnCmdLineHelp(wxCmdLineParser &parser)
{
	CommandLine::PrintUsage(parser, stdout);
	m_earlyExitCode = 0;
	return true;
}

// wxCmdLineParser has already reported the problem on stderr
bool App::OnCmdLineError(wxCmdLineParser &parser)
{
	CommandLine::PrintUsage(parser, stderr);
	m_earlyExitCode = 1;
	return true;
}

int App::OnRun()
{
	if (m_earlyExitCode)
	{
		return *m_earlyExitCode;
	}

	bool anyFailure = false;
	for (const auto &target : m_targets)
	{
		SanitizeResult results = SanitizerLogic::processTarget(fs::path(target), m_options);
		wxLogVerbose("%s: %s renamed, %s would be renamed, %s unchanged, %s skipped, %s failed",
					 SanitizerLogic::DisplayPath(results.finalPath),
					 std::to_string(results.renamedCount),
					 std::to_string(results.wouldRenameCount),
					 std::to_string(results.unchangedCount),
					 std::to_string(results.skippedCount),
					 std::to_string(results.failedRenames.size()));
		if (!results.overallSuccess)
		{
			anyFailure = true;
		}
	}
	return anyFailure ? 1 : 0;
}

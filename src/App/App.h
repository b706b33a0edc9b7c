#ifndef APP_H
#define APP_H

#include <wx/app.h>
#include <wx/cmdline.h>

#include <optional>
#include <string>
#include <vector>

#include "SanitizerLogic.h"
#include "Settings.h"

class App : public wxAppConsole
{
public:
	virtual bool OnInit() override;
	virtual int OnRun() override;

	virtual void OnInitCmdLine(wxCmdLineParser &parser) override;
	virtual bool OnCmdLineParsed(wxCmdLineParser &parser) override;
	virtual bool OnCmdLineHelp(wxCmdLineParser &parser) override;
	virtual bool OnCmdLineError(wxCmdLineParser &parser) override;

private:
	AppSettings m_settings;
	SanitizeOptions m_options;
	std::vector<std::string> m_targets;
	std::optional<int> m_earlyExitCode; // Set when the command line already decided the outcome
};

#endif // APP_H

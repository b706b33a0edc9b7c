#include "Settings.h"
#include "CommandLine.h" // For CommandLine::ValidateReplacement

#include <wx/log.h>

// Loads the user's defaults; anything missing or invalid falls back to the built-in value
AppSettings Settings::Load(const wxConfigBase *cfg)
{
	AppSettings settings;
	if (!cfg)
		return settings; // No config system, built-in defaults only

	wxString replacement;
	if (cfg->Read("/Defaults/Replacement", &replacement))
	{
		ReplacementValidation validation = CommandLine::ValidateReplacement(replacement);
		if (validation.success)
		{
			settings.replacement = validation.replacement;
		}
		else
		{
			wxLogWarning("Ignoring /Defaults/Replacement from the configuration: %s", validation.errorMessage);
		}
	}
	return settings;
}

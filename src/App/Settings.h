#ifndef SETTINGS_H
#define SETTINGS_H

#include <wx/confbase.h>

#include <string>

#include "SanitizerLogic.h" // For SanitizerLogic::DefaultReplacement

struct AppSettings
{
	std::string replacement = SanitizerLogic::DefaultReplacement;
};

class Settings
{
public:
	static AppSettings Load(const wxConfigBase *cfg);
};

#endif // SETTINGS_H

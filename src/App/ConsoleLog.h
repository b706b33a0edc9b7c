#ifndef CONSOLELOG_H
#define CONSOLELOG_H

#include <wx/log.h>

#include <cstdio>

// Log target for the command-line front end: regular output goes to 'out',
// warnings and errors to 'err'
class ConsoleLog : public wxLog
{
public:
	explicit ConsoleLog(FILE *out = stdout, FILE *err = stderr);

protected:
	virtual void DoLogTextAtLevel(wxLogLevel level, const wxString &msg) override;

private:
	FILE *m_out;
	FILE *m_err;
};

#endif // CONSOLELOG_H

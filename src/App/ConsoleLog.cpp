#include "ConsoleLog.h"

#include <cstdio>

ConsoleLog::ConsoleLog(FILE *out, FILE *err)
	: m_out(out), m_err(err)
{
}

void ConsoleLog::DoLogTextAtLevel(wxLogLevel level, const wxString &msg)
{
	// wxLOG_FatalError, wxLOG_Error and wxLOG_Warning sort below wxLOG_Message
	FILE *stream = (level <= wxLOG_Warning || level >= wxLOG_Debug) ? m_err : m_out;
	std::fputs(msg.utf8_str(), stream);
	std::fputc('\n', stream);
	std::fflush(stream);
}

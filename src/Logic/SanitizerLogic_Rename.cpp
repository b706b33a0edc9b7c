#include "SanitizerLogic.h"

#include <wx/log.h>

#include <filesystem>
#include <string>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

// Reports whether 'path' names an existing entry without following a trailing symbolic link,
// so dangling links still count as present
bool SanitizerLogic::EntryExists(const fs::path &path, std::error_code &ec)
{
	const fs::file_status status = fs::symlink_status(path, ec);
	if (status.type() == fs::file_type::not_found)
	{
		ec.clear(); // not_found is reported through the return value
		return false;
	}
	return !ec && fs::exists(status);
}

// Converts a native path to a wxString for log output; names that are not valid UTF-8
// are shown byte-for-byte as Latin-1 instead of disappearing from the log
wxString SanitizerLogic::DisplayPath(const fs::path &path)
{
	const std::string native = path.string();
	wxString display = wxString::FromUTF8(native.c_str(), native.size());
	if (display.empty() && !native.empty())
	{
		display = wxString(native.c_str(), wxConvISO8859_1, native.size());
	}
	return display;
}

// Applies (or, under dry-run, only announces) one rename, skipping anything that would be a no-op,
// has vanished, or would clobber an existing entry
RenameOperation SanitizerLogic::renamePath(const fs::path &oldPath, const fs::path &newPath, bool dryRun)
{
	RenameOperation op;
	op.OldFullPath = oldPath;
	op.NewFullPath = newPath;
	op.ResolvedPath = oldPath;

	if (oldPath == newPath)
	{
		wxLogMessage("Old name and new name are the same for '%s'.  Not changing", DisplayPath(oldPath));
		op.Action = RenameAction::SkippedNoOp;
		op.ResolvedPath = newPath;
		return op;
	}

	std::error_code sourceEc, targetEc, renameEc;

	bool sourceExists = EntryExists(oldPath, sourceEc);
	if (sourceEc)
	{
		op.Action = RenameAction::Failed;
		op.ErrorMessage = "Filesystem error checking source existence: " + sourceEc.message();
		wxLogError("Cannot check '%s': %s", DisplayPath(oldPath), sourceEc.message());
		return op;
	}
	if (!sourceExists)
	{
		wxLogMessage("Old file name '%s' does not exist.  Skipping", DisplayPath(oldPath));
		op.Action = RenameAction::SkippedMissingSource;
		return op;
	}

	// Never replace an entry that is already there; fs::rename would silently overwrite files on POSIX
	bool targetExists = EntryExists(newPath, targetEc);
	if (targetEc)
	{
		op.Action = RenameAction::Failed;
		op.ErrorMessage = "Filesystem error checking target path: " + targetEc.message();
		wxLogError("Cannot check '%s': %s", DisplayPath(newPath), targetEc.message());
		return op;
	}
	if (targetExists)
	{
		wxLogMessage("New file name '%s' already exists!  Skipping", DisplayPath(newPath));
		op.Action = RenameAction::SkippedTargetExists;
		return op;
	}

	if (dryRun)
	{
		wxLogMessage("Would change '%s' to '%s'", DisplayPath(oldPath), DisplayPath(newPath));
		op.Action = RenameAction::WouldApply;
		op.ResolvedPath = newPath;
		return op;
	}

	wxLogMessage("Changing '%s' to '%s'", DisplayPath(oldPath), DisplayPath(newPath));
	fs::rename(oldPath, newPath, renameEc);
	if (renameEc)
	{
		op.Action = RenameAction::Failed;
		op.ErrorMessage = "Rename failed: " + renameEc.message();
		wxLogError("Failed to rename '%s' to '%s': %s", DisplayPath(oldPath), DisplayPath(newPath), renameEc.message());
		return op;
	}

	op.Action = RenameAction::Applied;
	op.ResolvedPath = newPath;
	return op;
}

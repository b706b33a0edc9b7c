#include "SanitizerLogic.h"

#include <wx/log.h>

#include <filesystem>
#include <string>
#include <vector>
#include <algorithm>	// For std::sort
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

namespace
{
	// "dir one/" names the same entry as "dir one"; keep the root separator intact
	fs::path strip_trailing_separators(const fs::path &path)
	{
		std::string native = path.string();
		while (native.size() > 1 && native.back() == '/')
		{
			native.pop_back();
		}
		return fs::path(native);
	}
}

// Tallies one Rename Protocol outcome into the per-target result
void SanitizerLogic::RecordOperation(const RenameOperation &op, SanitizeResult &results)
{
	switch (op.Action)
	{
	case RenameAction::Applied:
		results.renamedCount++;
		break;
	case RenameAction::WouldApply:
		results.wouldRenameCount++;
		break;
	case RenameAction::SkippedNoOp:
		results.unchangedCount++;
		break;
	case RenameAction::SkippedMissingSource:
	case RenameAction::SkippedTargetExists:
		results.skippedCount++;
		break;
	case RenameAction::Failed:
		results.failedRenames.push_back({op.OldFullPath.string(), op.ErrorMessage});
		break;
	}
}

// Sanitizes the final component of 'path' and runs the Rename Protocol on it
fs::path SanitizerLogic::renameEntry(const fs::path &path, const SanitizeOptions &options, SanitizeResult &results)
{
	const fs::path newPath(SanitizedFilename(path.string(), options.replacement));
	RenameOperation op = renamePath(path, newPath, options.dryRun);
	RecordOperation(op, results);
	return op.ResolvedPath;
}

// Post-order walk: every child is handled (directories recursively) before the directory itself,
// so children are always addressed through their parent's original name
fs::path SanitizerLogic::walkDirectory(const fs::path &path, const SanitizeOptions &options, SanitizeResult &results)
{
	std::error_code statusEc;
	const fs::file_status status = fs::symlink_status(path, statusEc);
	if (status.type() == fs::file_type::not_found)
	{
		wxLogMessage("Old file name '%s' does not exist.  Skipping", DisplayPath(path));
		results.skippedCount++;
		return path;
	}
	if (statusEc)
	{
		wxLogError("Cannot inspect '%s': %s", DisplayPath(path), statusEc.message());
		results.failedRenames.push_back({path.string(), "Filesystem error checking entry type: " + statusEc.message()});
		return path;
	}

	// symlink_status never reports a link as a directory, so links are renamed but not followed
	if (!fs::is_directory(status))
	{
		return renameEntry(path, options, results);
	}

	// Collect the listing first: renaming entries while a directory_iterator is open is unspecified
	std::vector<fs::directory_entry> children;
	std::error_code listEc;
	for (fs::directory_iterator it(path, listEc); !listEc && it != fs::directory_iterator(); it.increment(listEc))
	{
		children.push_back(*it);
	}
	if (listEc)
	{
		// Whatever was listed is still processed, and the directory itself is still renamed
		wxLogError("Cannot list directory '%s': %s", DisplayPath(path), listEc.message());
		results.failedRenames.push_back({path.string(), "Failed to list directory: " + listEc.message()});
	}

	// Enumeration order is filesystem dependent; sort for a reproducible log
	std::sort(children.begin(), children.end());

	for (const auto &child : children)
	{
		std::error_code childEc;
		const fs::file_status childStatus = child.symlink_status(childEc);
		if (!childEc && fs::is_directory(childStatus))
		{
			walkDirectory(child.path(), options, results);
		}
		else
		{
			renameEntry(child.path(), options, results);
		}
	}

	return renameEntry(path, options, results);
}

// Single-entry mode: only 'path' itself is renamed, even when it is a directory
SanitizeResult SanitizerLogic::sanitizePath(const fs::path &path, const SanitizeOptions &options)
{
	SanitizeResult results;
	results.finalPath = renameEntry(strip_trailing_separators(path), options, results);
	results.overallSuccess = results.failedRenames.empty();
	return results;
}

// Recursive mode: renames everything below 'root' bottom-up, then 'root' itself
SanitizeResult SanitizerLogic::sanitizeDirectoryTree(const fs::path &root, const SanitizeOptions &options)
{
	SanitizeResult results;
	results.finalPath = walkDirectory(strip_trailing_separators(root), options, results);
	results.overallSuccess = results.failedRenames.empty();
	return results;
}

SanitizeResult SanitizerLogic::processTarget(const fs::path &target, const SanitizeOptions &options)
{
	return options.recursive ? sanitizeDirectoryTree(target, options) : sanitizePath(target, options);
}

#ifndef SANITIZERLOGIC_H
#define SANITIZERLOGIC_H

#include <vector>
#include <string>
#include <string_view>
#include <filesystem>
#include <system_error>
#include <utility>

#include <wx/string.h>

namespace fs = std::filesystem;

// Resolved once from the command line and never mutated while a target is processed
struct SanitizeOptions
{
	bool recursive = false;
	bool dryRun = false;
	std::string replacement = "_"; // Exactly one UTF-8 encoded character
};

enum class RenameAction
{
	SkippedNoOp,
	SkippedMissingSource,
	SkippedTargetExists,
	Applied,
	WouldApply,
	Failed
};

struct RenameOperation
{
	fs::path OldFullPath;
	fs::path NewFullPath;
	RenameAction Action = RenameAction::SkippedNoOp;
	fs::path ResolvedPath;	  // Name the entry carries after this operation
	std::string ErrorMessage; // Only set for RenameAction::Failed
};

struct SanitizeResult
{
	fs::path finalPath;
	std::size_t renamedCount = 0;
	std::size_t wouldRenameCount = 0;
	std::size_t unchangedCount = 0;
	std::size_t skippedCount = 0;
	std::vector<std::pair<std::string, std::string>> failedRenames;
	bool overallSuccess = false;
};

class SanitizerLogic
{
private:
	static fs::path walkDirectory(const fs::path &path, const SanitizeOptions &options, SanitizeResult &results);
	static fs::path renameEntry(const fs::path &path, const SanitizeOptions &options, SanitizeResult &results);
	static void RecordOperation(const RenameOperation &op, SanitizeResult &results);

public:
	// Name sanitizer
	static std::string EscapeRegexChars(const std::string &input);
	static bool IsHidden(std::string_view baseName);
	static bool HasExtension(std::string_view baseName, bool isDirectory);
	static std::string ExtractExtension(std::string_view baseName, bool isDirectory);
	static std::string CollapseReplacementRuns(const std::string &text, const std::string &replacement);
	static std::string SanitizeComponent(std::string_view name, const std::string &replacement, const std::string &extension);
	static std::string SanitizedFilename(const std::string &path, const std::string &replacement, bool isDirectory);
	static std::string SanitizedFilename(const std::string &path, const std::string &replacement);

	// Rename protocol and tree walker
	static bool EntryExists(const fs::path &path, std::error_code &ec);
	static wxString DisplayPath(const fs::path &path);
	static RenameOperation renamePath(const fs::path &oldPath, const fs::path &newPath, bool dryRun);
	static SanitizeResult sanitizePath(const fs::path &path, const SanitizeOptions &options);
	static SanitizeResult sanitizeDirectoryTree(const fs::path &root, const SanitizeOptions &options);
	static SanitizeResult processTarget(const fs::path &target, const SanitizeOptions &options);

	static const std::string DefaultReplacement;
};

#endif // SANITIZERLOGIC_H

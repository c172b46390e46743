#ifndef TOOLGUARD_PATH_VALIDATOR_HPP
#define TOOLGUARD_PATH_VALIDATOR_HPP

#include <filesystem>
#include <string>
#include <toolguard/path_sanitizer.hpp>
#include <toolguard/types.hpp>
#include <vector>

namespace toolguard
{

/// Default forbidden path entries (replaceable per validator)
const std::vector<std::string>& default_forbidden_paths();

/// Workspace containment + forbidden-path denylist + symlink-escape detection.
///
/// Validation order:
/// 1. Lexical canonicalization and containment (PathSanitizer); its error is returned as is.
/// 2. Forbidden-path check on the canonical path and its ancestors (ForbiddenPath).
/// 3. Symlink resolution of the existing part of the path; the resolved target is
///    checked again for containment and the denylist (SymlinkEscape). Resolution
///    failures and dangling links are denied.
///
/// Forbidden entries match case-insensitively on whole path components: "/etc/passwd"
/// forbids "/etc/passwd" and "/ETC/passwd" but not "/etc/passwd-backup". A leading "~/"
/// is expanded with $HOME; relative entries are taken relative to the workspace.
class PathValidator
{
  public:
    PathValidator(const std::string& work_dir, const std::vector<std::string>& forbidden_paths,
                  const std::vector<std::string>& allowed_dirs = {});

    PathValidator(PathSanitizer sanitizer, const std::vector<std::string>& forbidden_paths);

    const PathSanitizer& sanitizer() const
    {
        return sanitizer_;
    }

    /// Entries as configured (before expansion)
    const std::vector<std::string>& forbidden_paths() const
    {
        return forbidden_paths_;
    }

    /// On success, PathResult::path is the symlink-resolved target
    PathResult validate(const std::string& path) const;

    /// True if a normalized absolute path (or one of its ancestors) is on the denylist
    bool is_forbidden(const std::filesystem::path& path) const;

  private:
    PathSanitizer sanitizer_;
    std::vector<std::string> forbidden_paths_;
    std::vector<std::string> forbidden_prefixes_; // expanded, normalized, lower-cased
};

} // namespace toolguard

#endif // TOOLGUARD_PATH_VALIDATOR_HPP

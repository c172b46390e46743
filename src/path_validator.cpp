#include "internal/string_utils.hpp"

#include <iostream>
#include <toolguard/path_validator.hpp>
#include <utility>

namespace fs = std::filesystem;

namespace toolguard
{

const std::vector<std::string>& default_forbidden_paths()
{
    static const std::vector<std::string> paths = {
        "/etc/passwd", "/etc/shadow", "/etc/sudoers", "~/.ssh/", "~/.gnupg/",
        "/root/",      "/boot/",      "/sys/",        "/proc/",
    };
    return paths;
}

namespace
{

// weakly_canonical() resolves every link of the existing prefix, so a link that is
// still present in the result points nowhere.
bool has_dangling_link(const fs::path& resolved)
{
    for (fs::path p = resolved; p != p.root_path() && !p.empty(); p = p.parent_path())
    {
        std::error_code ec;
        auto status = fs::symlink_status(p, ec);
        if (!ec && fs::is_symlink(status))
            return true;
    }
    return false;
}

} // namespace

PathValidator::PathValidator(const std::string& work_dir,
                             const std::vector<std::string>& forbidden_paths,
                             const std::vector<std::string>& allowed_dirs)
    : PathValidator(PathSanitizer(work_dir, allowed_dirs), forbidden_paths)
{
}

PathValidator::PathValidator(PathSanitizer sanitizer,
                             const std::vector<std::string>& forbidden_paths)
    : sanitizer_(std::move(sanitizer)), forbidden_paths_(forbidden_paths)
{
    for (const auto& entry : forbidden_paths_)
    {
        std::string trimmed = internal::trim(entry);
        if (trimmed.empty())
            continue;

        auto expanded = PathSanitizer::expand_home(trimmed);
        if (!expanded)
        {
            std::cerr << "Warning: HOME is not set, ignoring forbidden path " << trimmed << "\n";
            continue;
        }

        fs::path candidate(*expanded);
        if (!candidate.is_absolute())
            candidate = sanitizer_.work_dir() / candidate;

        forbidden_prefixes_.push_back(
            internal::to_lower(PathSanitizer::normalize(candidate).string()));
    }
}

bool PathValidator::is_forbidden(const fs::path& path) const
{
    std::string lower = internal::to_lower(path.string());

    for (const auto& prefix : forbidden_prefixes_)
    {
        if (lower.compare(0, prefix.size(), prefix) != 0)
            continue;

        // Separator-bounded: "/etc/passwd" must not forbid "/etc/passwd-backup"
        if (lower.size() == prefix.size() || prefix.back() == '/' || lower[prefix.size()] == '/')
            return true;
    }
    return false;
}

PathResult PathValidator::validate(const std::string& path) const
{
    PathResult sanitized = sanitizer_.sanitize(path);
    if (!sanitized.ok())
        return sanitized;

    fs::path canonical(sanitized.path);
    if (is_forbidden(canonical))
        return PathResult::failure(ErrorCode::ForbiddenPath,
                                   "access to path " + internal::trim(path) + " is forbidden");

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(canonical, ec);
    if (ec)
        return PathResult::failure(ErrorCode::SymlinkEscape,
                                   "cannot resolve path " + canonical.string() + ": " +
                                       ec.message());
    resolved = PathSanitizer::normalize(resolved);

    if (has_dangling_link(resolved))
        return PathResult::failure(ErrorCode::SymlinkEscape,
                                   "path " + canonical.string() + " contains a dangling symlink");

    if (resolved != canonical)
    {
        if (!sanitizer_.is_contained(resolved))
            return PathResult::failure(ErrorCode::SymlinkEscape,
                                       "path " + canonical.string() + " resolves to " +
                                           resolved.string() + " outside the workspace");

        if (is_forbidden(resolved))
            return PathResult::failure(ErrorCode::SymlinkEscape,
                                       "path " + canonical.string() +
                                           " resolves to forbidden path " + resolved.string());
    }

    return PathResult::success(resolved.string());
}

} // namespace toolguard

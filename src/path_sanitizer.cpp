#include "internal/string_utils.hpp"

#include <cstdlib>
#include <iostream>
#include <toolguard/path_sanitizer.hpp>
#include <utility>

namespace fs = std::filesystem;

namespace toolguard
{

PathSanitizer::PathSanitizer(const std::string& work_dir,
                             const std::vector<std::string>& extra_roots)
    : PathSanitizer(canonical_root(work_dir), extra_roots, CanonicalRoot{})
{
}

PathSanitizer PathSanitizer::with_canonical_root(const fs::path& work_dir,
                                                 const std::vector<std::string>& extra_roots)
{
    return PathSanitizer(work_dir, extra_roots, CanonicalRoot{});
}

PathSanitizer::PathSanitizer(fs::path work_dir, const std::vector<std::string>& extra_roots,
                             CanonicalRoot)
    : work_dir_(std::move(work_dir))
{
    roots_.push_back(work_dir_);
    for (const auto& root : extra_roots)
    {
        std::string trimmed = internal::trim(root);
        if (trimmed.empty())
            continue;

        auto expanded = expand_home(trimmed);
        if (!expanded)
        {
            std::cerr << "Warning: HOME is not set, ignoring allowed directory " << trimmed
                      << "\n";
            continue;
        }
        roots_.push_back(canonical_root(*expanded));
    }
}

fs::path PathSanitizer::normalize(const fs::path& path)
{
    fs::path absolute = path;
    if (!absolute.is_absolute())
    {
        std::error_code ec;
        absolute = fs::absolute(path, ec);
        if (ec)
            absolute = fs::path("/") / path;
    }

    fs::path normal = absolute.lexically_normal();

    // "/a/b/" normalizes to "/a/b/" (empty filename); drop the trailing separator
    while (!normal.has_filename() && normal != normal.root_path())
        normal = normal.parent_path();

    return normal;
}

fs::path PathSanitizer::canonical_root(const std::string& dir)
{
    fs::path absolute = normalize(dir.empty() ? fs::path(".") : fs::path(dir));

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec)
        return absolute;

    return normalize(resolved);
}

bool PathSanitizer::is_within(const fs::path& path, const fs::path& root)
{
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it)
    {
        if (path_it == path.end() || *path_it != *root_it)
            return false;
    }
    return true;
}

bool PathSanitizer::is_contained(const fs::path& path) const
{
    for (const auto& root : roots_)
    {
        if (is_within(path, root))
            return true;
    }
    return false;
}

std::optional<std::string> PathSanitizer::expand_home(const std::string& path)
{
    if (path != "~" && path.rfind("~/", 0) != 0)
        return path;

    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0')
        return std::nullopt;

    return std::string(home) + path.substr(1);
}

PathResult PathSanitizer::sanitize(const std::string& path) const
{
    std::string trimmed = internal::trim(path);
    if (trimmed.empty())
        return PathResult::failure(ErrorCode::EmptyInput, "empty path");

    auto expanded = expand_home(trimmed);
    if (!expanded)
        return PathResult::failure(ErrorCode::PathOutsideWorkspace,
                                   "cannot expand home directory in " + trimmed);

    fs::path candidate(*expanded);
    if (!candidate.is_absolute())
        candidate = work_dir_ / candidate;

    fs::path canonical = normalize(candidate);
    if (is_contained(canonical))
        return PathResult::success(canonical.string());

    for (const auto& segment : fs::path(*expanded))
    {
        if (segment == "..")
            return PathResult::failure(ErrorCode::PathTraversal,
                                       "path traversal detected in " + trimmed);
    }

    return PathResult::failure(ErrorCode::PathOutsideWorkspace,
                               "path " + trimmed + " is outside the workspace");
}

} // namespace toolguard

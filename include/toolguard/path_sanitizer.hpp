#ifndef TOOLGUARD_PATH_SANITIZER_HPP
#define TOOLGUARD_PATH_SANITIZER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <toolguard/types.hpp>
#include <vector>

namespace toolguard
{

/// Lexical path canonicalizer bound to a workspace root.
///
/// sanitize() never touches the filesystem: relative paths are joined to the
/// workspace, "." and ".." are collapsed lexically, and the result must be the
/// workspace itself or lie below it (or below one of the extra roots).
class PathSanitizer
{
  public:
    /// @param work_dir Workspace root, made absolute and canonical (need not exist)
    /// @param extra_roots Additional roots accepted by sanitize()
    explicit PathSanitizer(const std::string& work_dir,
                           const std::vector<std::string>& extra_roots = {});

    /// Use work_dir as given; it must already be absolute and canonical
    static PathSanitizer with_canonical_root(const std::filesystem::path& work_dir,
                                             const std::vector<std::string>& extra_roots = {});

    const std::filesystem::path& work_dir() const
    {
        return work_dir_;
    }

    const std::vector<std::filesystem::path>& roots() const
    {
        return roots_;
    }

    /// Canonicalize a candidate path and enforce containment.
    /// Fails with EmptyInput, PathTraversal (input had a ".." segment) or PathOutsideWorkspace.
    PathResult sanitize(const std::string& path) const;

    /// True if path is inside one of the roots (component-wise)
    bool is_contained(const std::filesystem::path& path) const;

    // Static utility methods

    /// Absolute, lexically normal form without trailing separator
    static std::filesystem::path normalize(const std::filesystem::path& path);

    /// Absolute canonical form, resolving symlinks of the existing prefix.
    /// Falls back to normalize() when the filesystem cannot be queried.
    static std::filesystem::path canonical_root(const std::string& dir);

    /// True if path equals root or is a strict descendant. Both must be normalized.
    static bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

    /// Expand a leading "~" or "~/" using $HOME. std::nullopt if HOME is unset.
    static std::optional<std::string> expand_home(const std::string& path);

  private:
    struct CanonicalRoot
    {
    };

    PathSanitizer(std::filesystem::path work_dir, const std::vector<std::string>& extra_roots,
                  CanonicalRoot);

    std::filesystem::path work_dir_;
    std::vector<std::filesystem::path> roots_; // work_dir_ first
};

} // namespace toolguard

#endif // TOOLGUARD_PATH_SANITIZER_HPP

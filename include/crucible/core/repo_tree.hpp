/**
 * @file repo_tree.hpp
 * @brief Bounded snapshot of a checkout for fingerprint matching
 *
 * Adapters never touch the filesystem directly during matching; they query
 * a RepoTree built once per run. The scan is bounded in depth and entry
 * count and skips dependency/build output directories, so a repository
 * with a vendored node_modules cannot stall detection.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace crucible {
namespace core {

/**
 * @struct RepoTreeOptions
 * @brief Scan bounds
 */
struct RepoTreeOptions {
    int max_depth{3};                  ///< Directory levels below the root
    std::size_t max_entries{5000};     ///< Stop after this many entries
    std::set<std::string> skip_directories{
        ".git", "node_modules", "target", "build", "dist",
        "vendor", ".venv", "__pycache__"
    };                                 ///< Directory names never descended into
};

/**
 * @class RepoTree
 * @brief Immutable list of relative paths with query helpers
 *
 * Paths are stored relative to the root with '/' separators, e.g.
 * `src/test/java/com/acme/OrderIT.java`.
 */
class RepoTree {
public:
    /**
     * @brief Scan a directory
     * @param root Checkout root
     * @param options Scan bounds
     * @return Snapshot (empty if root is not a directory)
     */
    static RepoTree Scan(const std::filesystem::path& root,
                         const RepoTreeOptions& options = {});

    /**
     * @brief Build from explicit relative paths (tests, remote listings)
     * @param root Root used for ReadFile
     * @param files Relative file paths
     */
    static RepoTree FromPaths(const std::filesystem::path& root,
                              const std::vector<std::string>& files);

    /// True if a file exists at this relative path
    bool HasFile(const std::string& relative_path) const;

    /// True if a directory exists at this relative path
    bool HasDirectory(const std::string& relative_path) const;

    /// True if any file has this exact base name at any scanned depth
    bool HasFileNamed(const std::string& name) const;

    /// Files at the root only
    std::vector<std::string> RootFiles() const;

    /// Files whose base name ends with @p suffix (e.g. ".csproj")
    std::vector<std::string> FindBySuffix(const std::string& suffix) const;

    /// Files whose base name starts with @p prefix (e.g. "jest.config")
    std::vector<std::string> FindByPrefix(const std::string& prefix) const;

    /**
     * @brief Read a file below the root
     * @param relative_path Path relative to the root
     * @param max_bytes Read at most this many bytes
     * @return Contents, or nullopt if unreadable, not a regular file, or
     *         resolving outside the root
     */
    std::optional<std::string> ReadFile(const std::string& relative_path,
                                        std::size_t max_bytes = 256 * 1024) const;

    const std::filesystem::path& Root() const { return root_; }
    const std::vector<std::string>& Files() const { return files_; }
    std::size_t EntryCount() const { return files_.size() + directories_.size(); }
    bool Truncated() const { return truncated_; }

private:
    std::filesystem::path root_;              ///< Checkout root
    std::vector<std::string> files_;          ///< Sorted relative file paths
    std::set<std::string> file_set_;          ///< Lookup index
    std::set<std::string> directories_;       ///< Relative directory paths
    bool truncated_{false};                   ///< Entry cap was hit

    void Index();
    bool IsContainedRegularFile(const std::filesystem::path& path) const;
};

/// Base name of a '/'-separated relative path
std::string BaseName(const std::string& relative_path);

} // namespace core
} // namespace crucible

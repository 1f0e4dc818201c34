/**
 * @file repo_tree.cpp
 * @brief Bounded breadth-first scan of a checkout
 *
 * Breadth-first order means root-level markers (pom.xml, package.json) are
 * always seen even when the entry cap cuts the scan short.
 *
 * @date 2025
 */

#include "crucible/core/repo_tree.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <fstream>
#include <tuple>
#include <utility>

namespace crucible {
namespace core {

namespace fs = std::filesystem;

std::string BaseName(const std::string& relative_path) {
    auto pos = relative_path.rfind('/');
    return pos == std::string::npos ? relative_path : relative_path.substr(pos + 1);
}

RepoTree RepoTree::Scan(const fs::path& root, const RepoTreeOptions& options) {
    RepoTree tree;
    tree.root_ = root;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::warn("RepoTree: {} is not a directory", root.string());
        return tree;
    }

    // (absolute dir, relative prefix, depth)
    std::deque<std::tuple<fs::path, std::string, int>> queue;
    queue.emplace_back(root, "", 0);

    std::size_t entries = 0;

    while (!queue.empty() && !tree.truncated_) {
        auto [dir, prefix, depth] = queue.front();
        queue.pop_front();

        std::vector<fs::directory_entry> children;
        for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            children.push_back(*it);
        }
        if (ec) {
            spdlog::debug("RepoTree: cannot list {}: {}", dir.string(), ec.message());
            ec.clear();
            continue;
        }

        std::sort(children.begin(), children.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.path().filename() < b.path().filename();
                  });

        for (const auto& child : children) {
            if (entries >= options.max_entries) {
                tree.truncated_ = true;
                break;
            }

            std::string name = child.path().filename().string();
            std::string relative = prefix.empty() ? name : prefix + "/" + name;

            // Symlinks are recorded but never followed
            if (child.is_symlink(ec)) {
                tree.files_.push_back(relative);
                ++entries;
                continue;
            }

            if (child.is_directory(ec)) {
                if (options.skip_directories.count(name)) {
                    continue;
                }
                tree.directories_.insert(relative);
                ++entries;
                if (depth < options.max_depth) {
                    queue.emplace_back(child.path(), relative, depth + 1);
                }
            } else {
                tree.files_.push_back(relative);
                ++entries;
            }
        }
    }

    if (tree.truncated_) {
        spdlog::debug("RepoTree: entry cap {} reached under {}", options.max_entries, root.string());
    }

    tree.Index();
    return tree;
}

RepoTree RepoTree::FromPaths(const fs::path& root, const std::vector<std::string>& files) {
    RepoTree tree;
    tree.root_ = root;
    tree.files_ = files;

    for (const auto& file : files) {
        auto pos = file.rfind('/');
        while (pos != std::string::npos) {
            tree.directories_.insert(file.substr(0, pos));
            pos = pos == 0 ? std::string::npos : file.rfind('/', pos - 1);
        }
    }

    tree.Index();
    return tree;
}

void RepoTree::Index() {
    std::sort(files_.begin(), files_.end());
    files_.erase(std::unique(files_.begin(), files_.end()), files_.end());
    file_set_ = std::set<std::string>(files_.begin(), files_.end());
}

bool RepoTree::HasFile(const std::string& relative_path) const {
    return file_set_.count(relative_path) > 0;
}

bool RepoTree::HasDirectory(const std::string& relative_path) const {
    return directories_.count(relative_path) > 0;
}

bool RepoTree::HasFileNamed(const std::string& name) const {
    return std::any_of(files_.begin(), files_.end(),
                       [&name](const std::string& f) { return BaseName(f) == name; });
}

std::vector<std::string> RepoTree::RootFiles() const {
    std::vector<std::string> result;
    for (const auto& f : files_) {
        if (f.find('/') == std::string::npos) {
            result.push_back(f);
        }
    }
    return result;
}

std::vector<std::string> RepoTree::FindBySuffix(const std::string& suffix) const {
    std::vector<std::string> result;
    for (const auto& f : files_) {
        if (utils::StringUtils::EndsWith(BaseName(f), suffix)) {
            result.push_back(f);
        }
    }
    return result;
}

std::vector<std::string> RepoTree::FindByPrefix(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& f : files_) {
        if (utils::StringUtils::StartsWith(BaseName(f), prefix)) {
            result.push_back(f);
        }
    }
    return result;
}

bool RepoTree::IsContainedRegularFile(const fs::path& path) const {
    std::error_code ec;

    // Symlinks, FIFOs and devices in a checkout could expose host files or block
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return false;
    }

    // A symlinked parent directory can still lead outside the root
    fs::path canonical_root = fs::canonical(root_, ec);
    if (ec) {
        return false;
    }
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }

    auto root_it = canonical_root.begin();
    auto path_it = resolved.begin();
    for (; root_it != canonical_root.end(); ++root_it, ++path_it) {
        if (path_it == resolved.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> RepoTree::ReadFile(const std::string& relative_path,
                                              std::size_t max_bytes) const {
    fs::path path = root_ / relative_path;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) {
        return std::nullopt;
    }
    if (!IsContainedRegularFile(path)) {
        spdlog::warn("RepoTree: refusing to read {} (not a regular file inside the checkout)",
                     relative_path);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string content(max_bytes, '\0');
    file.read(&content[0], static_cast<std::streamsize>(max_bytes));
    content.resize(static_cast<std::size_t>(file.gcount()));
    return content;
}

} // namespace core
} // namespace crucible

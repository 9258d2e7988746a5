#include "policy/path_guard.hpp"

#include <iterator>
#include <system_error>
#include <utility>

namespace mcptools::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;

PathGuard::PathGuard(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

bool PathGuard::is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        // A trailing separator yields an empty final element.
        if (root_it->empty() && std::next(root_it) == root.end()) {
            return true;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    if (root_it != root.end() && root_it->empty() && std::next(root_it) == root.end()) {
        return true;
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PathGuard::validate_path_in_workspace(
    const std::filesystem::path& target_path) const {
    if (target_path.empty()) {
        return ToolError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(workspace_root_, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root does not exist: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ToolError{ErrorCategory::Input,
                         "Workspace root is not a directory: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve workspace root: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ToolError{ErrorCategory::Input,
                         "Unable to resolve target path: " + target_path.string(),
                         "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ToolError{ErrorCategory::Policy,
                         "Path escapes workspace root: " + target_path.string(),
                         "path_outside_workspace"};
    }

    return canonical_candidate;
}

}  // namespace mcptools::policy

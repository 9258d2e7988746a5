#pragma once

#include <filesystem>
#include "core/errors/tool_errors.hpp"

namespace mcptools::policy {

    // Confines caller-supplied paths to a working root. Paths are resolved
    // lexically plus through existing symlinks; no file is opened.
    class PathGuard {
    public:
        explicit PathGuard(std::filesystem::path workspace_root);

        core::errors::Result<std::filesystem::path> validate_path_in_workspace(
            const std::filesystem::path& target_path) const;

        const std::filesystem::path& workspace_root() const { return workspace_root_; }

        static bool is_within_root(const std::filesystem::path& root,
                                   const std::filesystem::path& child);

    private:
        std::filesystem::path workspace_root_;
    };

} // namespace mcptools::policy

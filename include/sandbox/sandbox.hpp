//! # Sandbox Interfaces
//!
//! The project directory and the terraform binary, as seen by the dispatcher
//! and by plugins.
//!
//! ## Staleness
//!
//! `has_terraform_files()` is re-evaluated on every call, because a plugin
//! command may have just created the first `.tf` file. The project content
//! snapshot behind `project_contains()` changes only on
//! `reload_terraform_project()`.

#pragma once

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wheels::sandbox {

/// Handle to the external provisioning binary.
class ToolHandle {
public:
    virtual ~ToolHandle() = default;

    /// Runs the tool with `args`, inheriting stdio, and blocks until it
    /// exits. A non-zero exit status is returned as an error.
    virtual auto invoke(const std::vector<std::string>& args) -> Result<bool> = 0;
};

/// The current project directory's provisioning state.
class Sandbox {
public:
    virtual ~Sandbox() = default;

    /// Directory the sandbox is bound to.
    [[nodiscard]] virtual auto project_dir() const -> const std::filesystem::path& = 0;

    /// True if a terraform binary can be located.
    virtual auto has_terraform() -> bool = 0;

    /// True if the project directory contains at least one `.tf` file.
    virtual auto has_terraform_files() -> Result<bool> = 0;

    /// Returns the tool handle bound to the project directory, creating it on
    /// first use. The sandbox keeps ownership.
    virtual auto get_terraform() -> Result<ToolHandle*> = 0;

    /// Re-reads the project's `.tf` files into the content snapshot.
    virtual auto reload_terraform_project() -> Result<bool> = 0;

    /// True if any `.tf` file in the snapshot contains `needle`.
    [[nodiscard]] virtual auto project_contains(std::string_view needle) const -> bool = 0;

    /// Paths are relative to the project directory.
    [[nodiscard]] virtual auto file_exists(const std::string& name) const -> bool = 0;
    virtual auto read_file(const std::string& name) -> Result<std::string> = 0;
    virtual auto write_file(const std::string& name, const std::string& content)
        -> Result<bool> = 0;
};

} // namespace wheels::sandbox

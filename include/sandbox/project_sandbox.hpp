//! # Project Sandbox
//!
//! Filesystem-backed `Sandbox` and the subprocess-backed terraform handle.
//!
//! ## Binary Lookup
//!
//! 1. `WheelsOptions::terraform_bin` (from `WHEELS_TERRAFORM_BIN`)
//! 2. an executable `terraform` in the project directory
//! 3. `terraform` on `PATH`

#pragma once

#include "sandbox/sandbox.hpp"

#include <optional>

namespace wheels::sandbox {

namespace fs = std::filesystem;

/// Runs terraform as a child process with inherited stdio.
class TerraformWrapper : public ToolHandle {
public:
    TerraformWrapper(fs::path binary, fs::path work_dir);

    auto invoke(const std::vector<std::string>& args) -> Result<bool> override;

    [[nodiscard]] auto binary() const -> const fs::path& {
        return binary_;
    }

private:
    fs::path binary_;
    fs::path work_dir_;
};

class ProjectSandbox : public Sandbox {
    /// Only `open()` can create one, so every sandbox starts with a loaded snapshot.
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    /// Opens a sandbox on `dir` and loads the project snapshot.
    static auto open(const fs::path& dir) -> Result<Box<ProjectSandbox>>;

    ProjectSandbox(OpenKey, fs::path dir);

    [[nodiscard]] auto project_dir() const -> const fs::path& override {
        return dir_;
    }

    auto has_terraform() -> bool override;
    auto has_terraform_files() -> Result<bool> override;
    auto get_terraform() -> Result<ToolHandle*> override;
    auto reload_terraform_project() -> Result<bool> override;
    [[nodiscard]] auto project_contains(std::string_view needle) const -> bool override;

    [[nodiscard]] auto file_exists(const std::string& name) const -> bool override;
    auto read_file(const std::string& name) -> Result<std::string> override;
    auto write_file(const std::string& name, const std::string& content) -> Result<bool> override;

    /// `.tf` files found by the last reload, sorted by name.
    [[nodiscard]] auto project_files() const -> const std::vector<fs::path>& {
        return files_;
    }

private:
    auto list_terraform_files() const -> Result<std::vector<fs::path>>;
    auto locate_terraform() const -> std::optional<fs::path>;

    fs::path dir_;
    std::vector<fs::path> files_;
    std::string contents_;
    Box<TerraformWrapper> terraform_;
};

/// Searches `PATH` for an executable named `name`.
auto find_in_path(const std::string& name) -> std::optional<fs::path>;

} // namespace wheels::sandbox

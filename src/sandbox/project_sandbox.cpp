#include "sandbox/project_sandbox.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace wheels::sandbox {

namespace {

auto is_executable(const fs::path& path) -> bool {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

auto find_in_path(const std::string& name) -> std::optional<fs::path> {
    const char* env = std::getenv("PATH");
    if (!env) {
        return std::nullopt;
    }

    std::string path_list = env;
    size_t pos = 0;
    while (pos <= path_list.size()) {
        size_t colon = path_list.find(':', pos);
        if (colon == std::string::npos) {
            colon = path_list.size();
        }
        std::string dir = path_list.substr(pos, colon - pos);
        if (!dir.empty()) {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate)) {
                return candidate;
            }
        }
        pos = colon + 1;
    }
    return std::nullopt;
}

ProjectSandbox::ProjectSandbox(OpenKey, fs::path dir) : dir_(std::move(dir)) {}

auto ProjectSandbox::open(const fs::path& dir) -> Result<Box<ProjectSandbox>> {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error("cannot open project directory " + dir.string() +
                     (ec ? ": " + ec.message() : ": not a directory"));
    }

    auto sandbox = make_box<ProjectSandbox>(OpenKey{}, dir);
    auto loaded = sandbox->reload_terraform_project();
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    return sandbox;
}

auto ProjectSandbox::list_terraform_files() const -> Result<std::vector<fs::path>> {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        return Error("cannot list " + dir_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && entry.path().extension() == ".tf") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

auto ProjectSandbox::has_terraform_files() -> Result<bool> {
    auto files = list_terraform_files();
    if (is_err(files)) {
        return unwrap_err(files);
    }
    return !unwrap(files).empty();
}

auto ProjectSandbox::reload_terraform_project() -> Result<bool> {
    auto listed = list_terraform_files();
    if (is_err(listed)) {
        return unwrap_err(listed);
    }

    std::string contents;
    for (const auto& path : unwrap(listed)) {
        std::ifstream file(path);
        if (!file) {
            return Error("cannot read " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        contents += buffer.str();
        contents += '\n';
    }

    files_ = std::move(unwrap(listed));
    contents_ = std::move(contents);
    WHEELS_LOG_DEBUG("sandbox", "Loaded " << files_.size() << " terraform files from " << dir_);
    return true;
}

auto ProjectSandbox::project_contains(std::string_view needle) const -> bool {
    return contents_.find(needle) != std::string::npos;
}

auto ProjectSandbox::locate_terraform() const -> std::optional<fs::path> {
    if (!WheelsOptions::terraform_bin.empty()) {
        fs::path configured = WheelsOptions::terraform_bin;
        if (is_executable(configured)) {
            return configured;
        }
        WHEELS_LOG_WARN("sandbox", "WHEELS_TERRAFORM_BIN=" << configured
                                                           << " is not an executable file");
        return std::nullopt;
    }

    fs::path local = dir_ / "terraform";
    if (is_executable(local)) {
        return local;
    }
    return find_in_path("terraform");
}

auto ProjectSandbox::has_terraform() -> bool {
    return terraform_ != nullptr || locate_terraform().has_value();
}

auto ProjectSandbox::get_terraform() -> Result<ToolHandle*> {
    if (terraform_) {
        return static_cast<ToolHandle*>(terraform_.get());
    }

    auto binary = locate_terraform();
    if (!binary) {
        return Error("terraform binary not found; install terraform " +
                     WheelsOptions::required_terraform_prefix +
                     "x or set WHEELS_TERRAFORM_BIN");
    }

    WHEELS_LOG_INFO("sandbox", "Using terraform at " << *binary);
    terraform_ = make_box<TerraformWrapper>(*binary, dir_);
    return static_cast<ToolHandle*>(terraform_.get());
}

auto ProjectSandbox::file_exists(const std::string& name) const -> bool {
    std::error_code ec;
    return fs::exists(dir_ / name, ec);
}

auto ProjectSandbox::read_file(const std::string& name) -> Result<std::string> {
    fs::path path = dir_ / name;
    std::ifstream file(path);
    if (!file) {
        return Error("cannot open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto ProjectSandbox::write_file(const std::string& name, const std::string& content)
    -> Result<bool> {
    fs::path path = dir_ / name;
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        return Error("cannot create file: " + path.string());
    }
    file << content;
    file.close();
    if (!file) {
        return Error("cannot write file: " + path.string());
    }
    WHEELS_LOG_DEBUG("sandbox", "Wrote " << content.size() << " bytes to " << path);
    return true;
}

} // namespace wheels::sandbox

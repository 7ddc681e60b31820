#include "upgrade.hpp"

#include "log/log.hpp"

namespace wheels::cli {

namespace fs = std::filesystem;

auto current_executable() -> Result<fs::path> {
    std::error_code ec;
    auto path = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return Error("cannot locate the running executable: " + ec.message());
    }
    return path;
}

auto complete_upgrade(const fs::path& source, const fs::path& target) -> Result<bool> {
    std::error_code ec;
    if (!fs::exists(target, ec)) {
        return Error("cannot upgrade " + target.string() + ": no such file");
    }
    if (fs::equivalent(source, target, ec)) {
        WHEELS_LOG_INFO("upgrade", "Source and target are the same file, nothing to do");
        return true;
    }

    fs::path staging = target;
    staging += ".upgrade";
    if (!fs::copy_file(source, staging, fs::copy_options::overwrite_existing, ec)) {
        return Error("cannot copy " + source.string() + " to " + staging.string() + ": " +
                     ec.message());
    }

    auto perms = fs::status(source, ec).permissions();
    if (!ec) {
        fs::permissions(staging, perms, ec);
    }
    if (ec) {
        std::string reason = ec.message();
        std::error_code ignored;
        fs::remove(staging, ignored);
        return Error("cannot set permissions on " + staging.string() + ": " + reason);
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return Error("cannot replace " + target.string() + ": " + ec.message());
    }

    WHEELS_LOG_INFO("upgrade", "Replaced " << target << " with " << source);
    return true;
}

auto run_upgrade(std::ostream& out, std::ostream& err) -> int {
    const auto& prog = WheelsOptions::program_name;
    err << "Error: no release channel is configured for this build of " << prog << "\n";
    out << "Install the new version separately, then run\n";
    out << "    <new-binary> wheels-complete-upgrade <path-to-" << prog << ">\n";
    out << "to replace this one.\n";
    WHEELS_LOG_DEBUG("upgrade", "wheels-upgrade called without a release channel");
    return 1;
}

auto run_complete_upgrade(const std::vector<std::string>& args, std::ostream& out,
                          std::ostream& err) -> int {
    if (args.size() < 2 || args[1].empty()) {
        err << "Error: wheels-complete-upgrade needs the path of the binary to replace\n";
        WHEELS_LOG_DEBUG("upgrade", "Missing target path");
        return 1;
    }

    auto self = current_executable();
    if (is_err(self)) {
        err << "Error: " << unwrap_err(self).message << "\n";
        WHEELS_LOG_DEBUG("upgrade", unwrap_err(self).message);
        return 1;
    }

    auto done = complete_upgrade(unwrap(self), args[1]);
    if (is_err(done)) {
        err << "Error: " << unwrap_err(done).message << "\n";
        WHEELS_LOG_DEBUG("upgrade", unwrap_err(done).message);
        return 1;
    }

    out << "Upgraded to latest version\n";
    return 0;
}

} // namespace wheels::cli

//! # Self-Upgrade
//!
//! The upgrade is two steps. A newer binary is obtained out of band, then it
//! is run as `wheels-complete-upgrade <old-path>` and copies itself over the
//! old binary. This build has no release channel, so `wheels-upgrade` only
//! explains the second step.

#pragma once

#include "common.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace wheels::cli {

/// Path of the running executable.
auto current_executable() -> Result<std::filesystem::path>;

/// Replaces `target` with a copy of `source`, keeping `source`'s
/// permissions. The copy goes to a temporary file next to `target` first,
/// then is renamed over it.
auto complete_upgrade(const std::filesystem::path& source, const std::filesystem::path& target)
    -> Result<bool>;

/// `wheels-upgrade`. Always returns 1.
auto run_upgrade(std::ostream& out, std::ostream& err) -> int;

/// `wheels-complete-upgrade <path>`. `args` starts with the meta-command.
auto run_complete_upgrade(const std::vector<std::string>& args, std::ostream& out,
                          std::ostream& err) -> int;

} // namespace wheels::cli

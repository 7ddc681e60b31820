#include "log/log.hpp"
#include "plugin/builtin.hpp"

#include <cstdlib>
#include <filesystem>

namespace wheels::plugin {

auto SshAgentPlugin::is_used(Sandbox& sandbox) -> Result<bool> {
    return sandbox.project_contains("ssh_public_key_file");
}

auto SshAgentPlugin::before_run(Sandbox& /*sandbox*/, ToolHandle& /*tool*/, bool /*is_init*/)
    -> Result<bool> {
    const char* sock = std::getenv("SSH_AUTH_SOCK");
    if (!sock || *sock == '\0') {
        return Error("SSH_AUTH_SOCK is not set; start ssh-agent and add your key with ssh-add");
    }

    std::error_code ec;
    if (!std::filesystem::exists(sock, ec)) {
        return Error(std::string("SSH_AUTH_SOCK points to ") + sock + ", which does not exist");
    }

    WHEELS_LOG_DEBUG("ssh-agent", "Using agent socket " << sock);
    return true;
}

auto SshAgentPlugin::after_run(Sandbox& /*sandbox*/, ToolHandle& /*tool*/,
                               const std::optional<Error>& /*run_error*/) -> Result<bool> {
    return true;
}

} // namespace wheels::plugin

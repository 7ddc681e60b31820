//! # Terraform Subprocess
//!
//! Launches terraform with the project directory as its working directory.
//! Stdio is inherited, not captured: terraform talks to the user directly,
//! including interactive approval prompts.
//!
//! SIGINT and SIGQUIT are ignored in the parent while the child runs, so a
//! Ctrl-C reaches terraform (which shuts down gracefully) without killing the
//! wrapper before the post-hooks run.

#include "sandbox/project_sandbox.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wheels::sandbox {

TerraformWrapper::TerraformWrapper(fs::path binary, fs::path work_dir)
    : binary_(std::move(binary)), work_dir_(std::move(work_dir)) {}

auto TerraformWrapper::invoke(const std::vector<std::string>& args) -> Result<bool> {
    std::vector<char*> c_args;
    std::string exe = binary_.string();
    c_args.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    WHEELS_LOG_DEBUG("sandbox", "Running " << exe << " with " << args.size() << " arguments");

    struct sigaction ignore = {};
    struct sigaction old_int = {};
    struct sigaction old_quit = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int);
    sigaction(SIGQUIT, &ignore, &old_quit);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
        return Error(std::string("failed to fork terraform: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child process
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
        if (chdir(work_dir_.c_str()) != 0) {
            _exit(126);
        }
        execv(exe.c_str(), c_args.data());
        _exit(127);
    }

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid, &status, 0);
    } while (ret < 0 && errno == EINTR);
    int wait_err = errno;

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGQUIT, &old_quit, nullptr);

    if (ret < 0) {
        return Error(std::string("failed to wait for terraform: ") + std::strerror(wait_err));
    }

    if (WIFSIGNALED(status)) {
        return Error("terraform terminated by signal " + std::to_string(WTERMSIG(status)));
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code == 126 || exit_code == 127) {
        WHEELS_LOG_DEBUG("sandbox", "Child exit " << exit_code << " for " << exe);
    }
    if (exit_code != 0) {
        return Error("terraform exited with status " + std::to_string(exit_code));
    }
    return true;
}

} // namespace wheels::sandbox

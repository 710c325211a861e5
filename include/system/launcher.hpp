#pragma once

#include "auth/credentials.hpp"
#include "core/config.hpp"
#include "system/system.hpp"
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace awx {
namespace system {

// Handle on a spawned child
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid() const { return pid_; }
    void forwardSignal(int sig) const;

    // Blocks until the child ends; exit code, or 128+N after signal N
    int wait();
    std::optional<int> exitStatus() const { return status_; }

private:
    pid_t pid_;
    std::optional<int> status_;
};

// "--name value" or "--name=value" among the wrapped arguments
std::optional<std::string> optionValue(const std::vector<std::string>& args, const std::string& name);
bool hasOption(const std::vector<std::string>& args, const std::string& name);

class ProcessLauncher {
public:
    explicit ProcessLauncher(const core::Config& cfg) : cfg_(cfg) {}

    // Child environment derived from `base`; `base` itself is left alone
    static Environment buildEnvironment(const Environment& base, const auth::CredentialSet& creds,
                                        const std::string& profile, const std::vector<std::string>& args);

    // Resolved path of the wrapped binary. Throws ExecutableNotFoundError.
    std::string locate() const;

    // Runs the wrapped binary with inherited stdio, forwarding SIGINT,
    // SIGTERM, SIGHUP and SIGQUIT, and returns its exit status.
    int run(const auth::CredentialSet& creds, const std::string& profile, const std::vector<std::string>& args);

private:
    const core::Config& cfg_;
};

} // namespace system
} // namespace awx

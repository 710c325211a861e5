#include "system/launcher.hpp"
#include "core/errors.hpp"
#include <array>
#include <cerrno>
#include <system_error>
#include <signal.h>
#include <sys/wait.h>

namespace awx {
namespace system {

namespace {

const std::array<int, 4> FORWARDED_SIGNALS = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

volatile sig_atomic_t gChildPid = 0;

void forwardToChild(int sig)
{
    pid_t pid = static_cast<pid_t>(gChildPid);
    if (pid > 0) {
        ::kill(pid, sig);
    }
}

// Installs the forwarding handler for the lifetime of the child. Signals are
// blocked until the child pid is known so none is lost in between.
class SignalForwarder {
public:
    SignalForwarder() {
        sigemptyset(&blocked_);
        for (int sig : FORWARDED_SIGNALS) {
            sigaddset(&blocked_, sig);
        }
        ::sigprocmask(SIG_BLOCK, &blocked_, &savedMask_);

        struct sigaction sa{};
        sa.sa_handler = forwardToChild;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        for (size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
            ::sigaction(FORWARDED_SIGNALS[i], &sa, &saved_[i]);
        }
    }

    ~SignalForwarder() {
        ::sigprocmask(SIG_BLOCK, &blocked_, nullptr);
        gChildPid = 0;
        for (size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
            ::sigaction(FORWARDED_SIGNALS[i], &saved_[i], nullptr);
        }
        ::sigprocmask(SIG_SETMASK, &savedMask_, nullptr);
    }

    SignalForwarder(const SignalForwarder&) = delete;
    SignalForwarder& operator=(const SignalForwarder&) = delete;

    void attach(pid_t pid) {
        gChildPid = pid;
        ::sigprocmask(SIG_UNBLOCK, &blocked_, nullptr);
    }

private:
    sigset_t blocked_;
    sigset_t savedMask_;
    std::array<struct sigaction, 4> saved_{};
};

} // namespace

// ChildProcess
void ChildProcess::forwardSignal(int sig) const {
    if (pid_ > 0 && !status_) {
        ::kill(pid_, sig);
    }
}

int ChildProcess::wait() {
    if (status_) {
        return *status_;
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    status_ = exitStatusFromWait(status);
    return *status_;
}

// Argument inspection
std::optional<std::string> optionValue(const std::vector<std::string>& args, const std::string& name) {
    const std::string prefix = name + "=";
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            if (i + 1 < args.size()) {
                return args[i + 1];
            }
            return std::string();
        }
        if (core::startsWith(args[i], prefix)) {
            return args[i].substr(prefix.size());
        }
    }
    return std::nullopt;
}

bool hasOption(const std::vector<std::string>& args, const std::string& name) {
    return optionValue(args, name).has_value();
}

// ProcessLauncher
Environment ProcessLauncher::buildEnvironment(const Environment& base, const auth::CredentialSet& creds,
                                              const std::string& profile, const std::vector<std::string>& args) {
    Environment env = base;

    env["AWS_ACCESS_KEY_ID"] = creds.accessKeyId;
    env["AWS_SECRET_ACCESS_KEY"] = creds.secretAccessKey;
    env.erase("AWS_SECURITY_TOKEN");
    if (creds.sessionToken) {
        env["AWS_SESSION_TOKEN"] = *creds.sessionToken;
    } else {
        env.erase("AWS_SESSION_TOKEN");
    }

    bool regionInEnv = base.count("AWS_REGION") || base.count("AWS_DEFAULT_REGION");
    if (creds.region && !creds.region->empty() && !regionInEnv && !hasOption(args, "--region")) {
        env["AWS_REGION"] = *creds.region;
        env["AWS_DEFAULT_REGION"] = *creds.region;
    }

    if (!hasOption(args, "--profile")) {
        env["AWS_PROFILE"] = profile;
    }
    return env;
}

std::string ProcessLauncher::locate() const {
    auto path = findExecutable(cfg_.awsBinary);
    if (!path) {
        throw core::ExecutableNotFoundError(cfg_.awsBinary);
    }
    return *path;
}

int ProcessLauncher::run(const auth::CredentialSet& creds, const std::string& profile,
                         const std::vector<std::string>& args) {
    std::string path = locate();

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(cfg_.awsBinary);
    argv.insert(argv.end(), args.begin(), args.end());

    Environment env = buildEnvironment(currentEnvironment(), creds, profile, args);
    core::debug(cfg_, "exec " + path + " (" + std::to_string(args.size()) + " args)");

    SignalForwarder forwarder;
    SpawnedProcess spawned = spawnProcess(path, argv, env, false);
    ChildProcess child(spawned.pid);
    forwarder.attach(child.pid());

    return child.wait();
}

} // namespace system
} // namespace awx

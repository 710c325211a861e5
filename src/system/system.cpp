#include "system/system.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <termios.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

extern char** environ;

namespace awx {
namespace system {

namespace fs = std::filesystem;

namespace {

volatile sig_atomic_t gPendingSignal = 0;
int gGuardDepth = 0;

void recordSignal(int sig)
{
    gPendingSignal = sig;
}

void makePipe(int fds[2])
{
    if (::pipe(fds) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

void closeFd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

class FileActions {
public:
    FileActions() { posix_spawn_file_actions_init(&actions_); }
    ~FileActions() { posix_spawn_file_actions_destroy(&actions_); }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

class SpawnAttr {
public:
    SpawnAttr() { posix_spawnattr_init(&attr_); }
    ~SpawnAttr() { posix_spawnattr_destroy(&attr_); }
    SpawnAttr(const SpawnAttr&) = delete;
    SpawnAttr& operator=(const SpawnAttr&) = delete;

    posix_spawnattr_t* get() { return &attr_; }

private:
    posix_spawnattr_t attr_;
};

std::vector<char*> cStrings(std::vector<std::string>& strings)
{
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(&s[0]);
    }
    out.push_back(nullptr);
    return out;
}

void writeAll(int fd, const std::string& data)
{
    // The child may exit without reading; don't die of SIGPIPE over it.
    struct sigaction ignore{};
    struct sigaction saved{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGPIPE, &ignore, &saved);

    const char* buf = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t w = ::write(fd, buf, left);
        if (w < 0) {
            if (errno == EINTR) continue;
            break;
        }
        buf += w;
        left -= static_cast<size_t>(w);
    }

    ::sigaction(SIGPIPE, &saved, nullptr);
}

// Reads one line from stdin with read(2) so that a recorded SIGINT/SIGTERM
// interrupts it.
std::string readLineRaw(bool& cancelled, bool& eof)
{
    std::string line;
    cancelled = false;
    eof = false;
    while (true) {
        if (InterruptGuard::pendingSignal() != 0) {
            cancelled = true;
            break;
        }
        char c = 0;
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n == 1) {
            if (c == '\n') break;
            if (c != '\r') line.push_back(c);
            continue;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        eof = true;
        break;
    }
    return line;
}

} // namespace

// Platform-specific file operations
void secureChmod(const fs::path& path, mode_t mode) {
    if (::chmod(path.c_str(), mode) != 0) {
        throw std::system_error(errno, std::generic_category(), "chmod " + path.string());
    }
}

void ensureSecureDir(const fs::path& path) {
    if (!fs::exists(path)) {
        fs::create_directories(path);
    }
    secureChmod(path, 0700);
}

// Environment
Environment currentEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

std::vector<std::string> toEnvp(const Environment& env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [key, value] : env) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::optional<std::string> findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto runnable = [](const fs::path& candidate) {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (runnable(name)) return name;
        return std::nullopt;
    }

    std::string path = core::getenvs("PATH", "/usr/local/bin:/usr/bin:/bin");
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        if (runnable(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

bool commandExists(const std::string& cmd) {
    return findExecutable(cmd).has_value();
}

// Process execution
SpawnedProcess spawnProcess(const std::string& path, const std::vector<std::string>& argv,
                            const Environment& env, bool captureOutput,
                            const std::string& stdinData) {
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int inPipe[2] = {-1, -1};

    FileActions actions;
    SpawnAttr attr;

    if (captureOutput) {
        makePipe(outPipe);
        makePipe(errPipe);
        if (stdinData.empty()) {
            posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        } else {
            makePipe(inPipe);
            posix_spawn_file_actions_adddup2(actions.get(), inPipe[0], STDIN_FILENO);
        }
        posix_spawn_file_actions_adddup2(actions.get(), outPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(actions.get(), errPipe[1], STDERR_FILENO);
    }

    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGHUP);
    sigaddset(&defaults, SIGQUIT);
    sigaddset(&defaults, SIGPIPE);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    posix_spawnattr_setsigdefault(attr.get(), &defaults);
    posix_spawnattr_setsigmask(attr.get(), &emptyMask);
    posix_spawnattr_setflags(attr.get(), POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<std::string> argStrings = argv;
    std::vector<std::string> envStrings = toEnvp(env);
    std::vector<char*> cargv = cStrings(argStrings);
    std::vector<char*> cenv = cStrings(envStrings);

    pid_t pid = -1;
    int rc = posix_spawn(&pid, path.c_str(), actions.get(), attr.get(), cargv.data(), cenv.data());

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(inPipe[0]);

    if (rc != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        closeFd(inPipe[1]);
        if (rc == ENOENT || rc == EACCES || rc == ENOEXEC || rc == ENOTDIR) {
            throw core::ExecutableNotFoundError(argv.empty() ? path : argv[0]);
        }
        throw std::system_error(rc, std::generic_category(), "posix_spawn " + path);
    }

    if (inPipe[1] >= 0) {
        writeAll(inPipe[1], stdinData);
        closeFd(inPipe[1]);
    }

    SpawnedProcess child;
    child.pid = pid;
    child.stdoutFd = outPipe[0];
    child.stderrFd = errPipe[0];
    return child;
}

ProcessResult runProcess(const std::string& path, const std::vector<std::string>& argv,
                         const Environment& env, std::chrono::milliseconds timeout,
                         const std::string& stdinData) {
    using Clock = std::chrono::steady_clock;

    SpawnedProcess child = spawnProcess(path, argv, env, true, stdinData);
    ProcessResult result;

    std::array<pollfd, 2> fds{};
    fds[0] = {child.stdoutFd, POLLIN, 0};
    fds[1] = {child.stderrFd, POLLIN, 0};
    std::array<std::string*, 2> sinks = {&result.out, &result.err};
    int openFds = 2;
    std::array<char, 4096> buffer{};

    auto deadline = Clock::now() + timeout;
    while (openFds > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        int rc = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::kill(child.pid, SIGKILL);
            for (auto& p : fds) closeFd(p.fd);
            while (::waitpid(child.pid, nullptr, 0) < 0 && errno == EINTR) {}
            throw std::system_error(err, std::generic_category(), "poll");
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                closeFd(fds[i].fd);
                --openFds;
            }
        }
    }

    if (result.timedOut) {
        ::kill(child.pid, SIGKILL);
    }
    for (auto& p : fds) closeFd(p.fd);

    int status = 0;
    while (::waitpid(child.pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }

    if (!result.timedOut) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.termSignal = WTERMSIG(status);
        }
    }
    return result;
}

int runInteractive(const std::string& path, const std::vector<std::string>& argv, const Environment& env) {
    InterruptGuard guard;
    if (InterruptGuard::pendingSignal() != 0) {
        throw core::AuthCancelledError();
    }
    SpawnedProcess child = spawnProcess(path, argv, env, false);

    int status = 0;
    while (::waitpid(child.pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        int sig = InterruptGuard::pendingSignal();
        if (sig != 0) {
            ::kill(child.pid, sig);
        }
    }

    if (InterruptGuard::pendingSignal() != 0) {
        throw core::AuthCancelledError();
    }
    return exitStatusFromWait(status);
}

// InterruptGuard
// Nested guards share the pending signal; only the outermost one clears it.
InterruptGuard::InterruptGuard() {
    if (gGuardDepth++ == 0) {
        gPendingSignal = 0;
    }
    struct sigaction sa{};
    sa.sa_handler = recordSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: blocking calls must see EINTR
    ::sigaction(SIGINT, &sa, &savedInt_);
    ::sigaction(SIGTERM, &sa, &savedTerm_);
}

InterruptGuard::~InterruptGuard() {
    --gGuardDepth;
    ::sigaction(SIGINT, &savedInt_, nullptr);
    ::sigaction(SIGTERM, &savedTerm_, nullptr);
}

int InterruptGuard::pendingSignal() {
    return gPendingSignal;
}

// Input handling
bool stdinIsTerminal() {
    return ::isatty(STDIN_FILENO) == 1;
}

std::string promptSecret(const std::string& prompt) {
    std::cerr << prompt;
    std::cerr.flush();

    InterruptGuard guard;

    termios oldTermios{};
    bool restore = false;
    if (stdinIsTerminal() && tcgetattr(STDIN_FILENO, &oldTermios) == 0) {
        termios newTermios = oldTermios;
        newTermios.c_lflag &= ~ECHO;
        restore = tcsetattr(STDIN_FILENO, TCSANOW, &newTermios) == 0;
    }

    bool cancelled = false;
    bool eof = false;
    std::string value = readLineRaw(cancelled, eof);

    if (restore) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldTermios);
        std::cerr << "\n";
    }

    if (cancelled || (eof && value.empty())) {
        throw core::AuthCancelledError();
    }
    return value;
}

std::string promptLine(const std::string& prompt) {
    std::cerr << prompt;
    std::cerr.flush();

    InterruptGuard guard;
    bool cancelled = false;
    bool eof = false;
    std::string value = readLineRaw(cancelled, eof);
    if (cancelled || (eof && value.empty())) {
        throw core::AuthCancelledError();
    }
    return value;
}

int exitStatusFromWait(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return core::ExitCode::SIGNAL_BASE + WTERMSIG(status);
    }
    return core::ExitCode::INTERNAL;
}

} // namespace system
} // namespace awx

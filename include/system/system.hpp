#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <signal.h>
#include <sys/types.h>

namespace awx {
namespace system {

using Environment = std::map<std::string, std::string>;

// Platform-specific file operations
void secureChmod(const std::filesystem::path& path, mode_t mode);
void ensureSecureDir(const std::filesystem::path& path);

// Environment
Environment currentEnvironment();
std::vector<std::string> toEnvp(const Environment& env);

// PATH lookup. Names containing '/' are checked as given.
std::optional<std::string> findExecutable(const std::string& name);
bool commandExists(const std::string& cmd);

// Process execution
struct ProcessResult {
    int exitCode = -1;     // -1 when killed by a signal or timed out
    int termSignal = 0;
    bool timedOut = false;
    std::string out;
    std::string err;

    bool success() const { return !timedOut && exitCode == 0; }
};

struct SpawnedProcess {
    pid_t pid = -1;
    int stdoutFd = -1;     // set only when output is captured
    int stderrFd = -1;
};

// Spawns argv (argv[0] is the display name) from the resolved executable
// path with exactly `env`. Terminating signals are reset to their default
// disposition and unblocked in the child. Throws ExecutableNotFoundError if
// the path cannot be executed.
SpawnedProcess spawnProcess(const std::string& path, const std::vector<std::string>& argv,
                            const Environment& env, bool captureOutput,
                            const std::string& stdinData = "");

// Runs to completion capturing stdout/stderr. Kills the child with SIGKILL
// once `timeout` elapses. `stdinData` is fed to the child's stdin.
ProcessResult runProcess(const std::string& path, const std::vector<std::string>& argv,
                         const Environment& env, std::chrono::milliseconds timeout,
                         const std::string& stdinData = "");

// Runs with inherited stdio. Throws AuthCancelledError if SIGINT/SIGTERM
// arrives while the child runs.
int runInteractive(const std::string& path, const std::vector<std::string>& argv, const Environment& env);

// Records SIGINT/SIGTERM while alive instead of letting them kill the
// process, so blocking reads return EINTR and the caller can unwind.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    static int pendingSignal();

private:
    struct sigaction savedInt_;
    struct sigaction savedTerm_;
};

// Input handling
bool stdinIsTerminal();
std::string promptSecret(const std::string& prompt);
std::string promptLine(const std::string& prompt);

// Exit status helpers
int exitStatusFromWait(int status);

} // namespace system
} // namespace awx

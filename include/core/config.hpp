#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>

namespace awx {
namespace core {

// Version
extern const std::string AWX_VERSION;

// Configuration structure
struct Config {
    std::string cacheDir;            // $XDG_CACHE_HOME/awx or $HOME/.cache/awx
    std::string awsConfigFile;       // AWS_CONFIG_FILE or ~/.aws/config
    std::string awsCredentialsFile;  // AWS_SHARED_CREDENTIALS_FILE or ~/.aws/credentials
    std::string awsBinary = "aws";   // AWX_AWS_BINARY
    bool verbose = false;
    bool interactive = true;         // cleared by -n or AWX_NO_INTERACTIVE
    bool cacheEnabled = false;       // AWX_CACHE
    bool cacheStatic = true;         // AWX_CACHE_STATIC=0 disables
    bool forceFileCache = false;     // AWX_CACHE_BACKEND=file
    std::string cachePassphrase;     // AWX_CACHE_PASSPHRASE
    std::chrono::seconds connectTimeout{5};
    std::chrono::seconds requestTimeout{30};
    int sessionDurationSeconds = 3600;
};

// Build the configuration from the process environment
Config loadConfig();

// Utility functions
std::string getenvs(const char* key, const std::string& defaultValue = "");
bool envFlag(const char* key, bool defaultValue = false);
bool isTruthy(const std::string& value);
std::string trim(const std::string& str);
std::string toLower(std::string str);
bool startsWith(const std::string& str, const std::string& prefix);
std::string maskValue(const std::string& value);
std::string maskArn(const std::string& arn);

// Time helpers (UTC)
std::string formatTimeUTC(std::chrono::system_clock::time_point tp);
bool parseIsoTime(const std::string& text, std::chrono::system_clock::time_point& out);

// Error handling and output. All of these write to stderr so that the
// wrapped command keeps stdout to itself.
[[noreturn]] void error(const Config& cfg, const std::string& msg, int code = 1);
void ok(const Config& cfg, const std::string& msg);
void warn(const Config& cfg, const std::string& msg);
void info(const Config& cfg, const std::string& msg);
void debug(const Config& cfg, const std::string& msg);

} // namespace core
} // namespace awx

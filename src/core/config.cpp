#include "core/config.hpp"
#include "ui/ui.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace awx {
namespace core {

// Version information
#ifndef AWX_VERSION_STRING
#define AWX_VERSION_STRING "0.3.0"
#endif
const std::string AWX_VERSION = AWX_VERSION_STRING;

namespace {

std::chrono::seconds envSeconds(const char* key, std::chrono::seconds defaultValue)
{
    std::string raw = trim(getenvs(key));
    if (raw.empty()) {
        return defaultValue;
    }
    try {
        size_t used = 0;
        long value = std::stol(raw, &used);
        if (used != raw.size() || value <= 0) {
            return defaultValue;
        }
        return std::chrono::seconds(value);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

} // namespace

Config loadConfig() {
    Config cfg;
    std::string home = getenvs("HOME");

    cfg.cacheDir = getenvs("XDG_CACHE_HOME", home + "/.cache") + "/awx";
    cfg.awsConfigFile = getenvs("AWS_CONFIG_FILE", home + "/.aws/config");
    cfg.awsCredentialsFile = getenvs("AWS_SHARED_CREDENTIALS_FILE", home + "/.aws/credentials");
    cfg.awsBinary = getenvs("AWX_AWS_BINARY", "aws");

    cfg.interactive = !envFlag("AWX_NO_INTERACTIVE");
    cfg.cacheEnabled = envFlag("AWX_CACHE");
    cfg.cacheStatic = envFlag("AWX_CACHE_STATIC", true);
    cfg.forceFileCache = toLower(getenvs("AWX_CACHE_BACKEND", "auto")) == "file";
    cfg.cachePassphrase = getenvs("AWX_CACHE_PASSPHRASE");

    cfg.connectTimeout = envSeconds("AWX_CONNECT_TIMEOUT", cfg.connectTimeout);
    cfg.requestTimeout = envSeconds("AWX_REQUEST_TIMEOUT", cfg.requestTimeout);
    cfg.sessionDurationSeconds = static_cast<int>(
        envSeconds("AWX_SESSION_DURATION", std::chrono::seconds(cfg.sessionDurationSeconds)).count());

    return cfg;
}

// Utility functions
std::string getenvs(const char* key, const std::string& defaultValue) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : defaultValue;
}

bool isTruthy(const std::string& value) {
    std::string v = toLower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

bool envFlag(const char* key, bool defaultValue) {
    const char* val = std::getenv(key);
    if (!val || !*val) {
        return defaultValue;
    }
    return isTruthy(val);
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string maskValue(const std::string& value) {
    if (value.empty()) {
        return "(empty)";
    }

    // For values 12 characters or less, mask everything
    if (value.length() <= 12) {
        return std::string(value.length(), '*');
    }

    // For longer values, show first 4 + "***" + last 4 characters
    return value.substr(0, 4) + "***" + value.substr(value.length() - 4);
}

// arn:aws:iam::123456789012:role/Admin -> arn:aws:iam::********9012:role/Admin
std::string maskArn(const std::string& arn) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(arn);
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    if (parts.size() < 6 || parts[0] != "arn") {
        return maskValue(arn);
    }

    std::string& account = parts[4];
    if (account.size() > 4) {
        account = std::string(account.size() - 4, '*') + account.substr(account.size() - 4);
    }

    std::string out = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        out += ":" + parts[i];
    }
    // getline drops a trailing empty field
    if (!arn.empty() && arn.back() == ':') {
        out += ":";
    }
    return out;
}

// Time helpers
std::string formatTimeUTC(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// Accepts 2025-10-17T00:00:00Z, 2025-10-17T00:00:00.123Z and
// 2025-10-17T02:00:00+02:00.
bool parseIsoTime(const std::string& text, std::chrono::system_clock::time_point& out) {
    std::string s = trim(text);
    std::tm tm{};
    std::istringstream in(s);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return false;
    }

    std::string rest;
    std::getline(in, rest);
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            ++pos;
        }
    }

    long offsetSeconds = 0;
    if (pos < rest.size()) {
        char sign = rest[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            std::string zone = rest.substr(pos + 1);
            zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
            if (zone.size() != 4 || !std::all_of(zone.begin(), zone.end(),
                    [](unsigned char c) { return std::isdigit(c); })) {
                return false;
            }
            offsetSeconds = std::stol(zone.substr(0, 2)) * 3600 + std::stol(zone.substr(2, 2)) * 60;
            if (sign == '-') {
                offsetSeconds = -offsetSeconds;
            }
            pos = rest.size();
        } else {
            return false;
        }
    }
    if (pos != rest.size()) {
        return false;
    }

    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(t - offsetSeconds);
    return true;
}

// Error handling and output
void error(const Config& /* cfg */, const std::string& msg, int code) {
    std::cerr << ui::colorize("❌ " + msg, ui::Colors::BRIGHT_RED) << std::endl;
    std::exit(code);
}

void ok(const Config& /* cfg */, const std::string& msg) {
    std::cerr << ui::colorize("✅ " + msg, ui::Colors::BRIGHT_GREEN) << std::endl;
}

void warn(const Config& /* cfg */, const std::string& msg) {
    std::cerr << ui::colorize("⚠️  " + msg, ui::Colors::BRIGHT_YELLOW) << std::endl;
}

void info(const Config& /* cfg */, const std::string& msg) {
    std::cerr << ui::colorize("ℹ️  " + msg, ui::Colors::BRIGHT_CYAN) << std::endl;
}

void debug(const Config& cfg, const std::string& msg) {
    if (!cfg.verbose) return;
    std::cerr << ui::colorize("[awx] " + msg, ui::Colors::DIM) << std::endl;
}

} // namespace core
} // namespace awx

#include "cli/cli.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "ui/ui.hpp"
#include <iostream>

namespace awx {
namespace cli {

namespace {

bool isWrapperOption(const std::string& arg)
{
    return arg == "--profile" || core::startsWith(arg, "--profile=")
        || arg == "--clear-cache" || core::startsWith(arg, "--clear-cache=")
        || arg == "--config" || arg == "--no-interactive"
        || arg == "--verbose" || arg == "--version" || arg == "--help";
}

std::optional<std::string> shortFlag(char c)
{
    switch (c) {
        case 'p': return std::string("--profile");
        case 'c': return std::string("--config");
        case 'n': return std::string("--no-interactive");
        case 'v': return std::string("--verbose");
        case 'V': return std::string("--version");
        case 'h': return std::string("--help");
        default: return std::nullopt;
    }
}

bool isShortCluster(const std::string& arg)
{
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    // -p swallows the rest of the cluster as its value
    for (size_t i = 1; i < arg.size(); ++i) {
        if (!shortFlag(arg[i])) {
            return false;
        }
        if (arg[i] == 'p') {
            return true;
        }
    }
    return true;
}

} // namespace

// Flag expansion
std::vector<std::string> expandShortFlags(const std::vector<std::string>& args) {
    std::vector<std::string> expanded;
    expanded.reserve(args.size() * 2);

    bool expectValue = false;
    bool optionalValue = false;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (expectValue) {
            expanded.push_back(arg);
            expectValue = false;
            continue;
        }
        if (optionalValue) {
            optionalValue = false;
            if (!arg.empty() && arg[0] != '-') {
                expanded.push_back(arg);
                continue;
            }
        }

        if (arg == "--") {
            break;
        }

        if (isShortCluster(arg)) {
            for (size_t j = 1; j < arg.size(); ++j) {
                expanded.push_back(*shortFlag(arg[j]));
                if (arg[j] == 'p') {
                    if (j + 1 < arg.size()) {
                        expanded.push_back(arg.substr(j + 1));
                    } else {
                        expectValue = true;
                    }
                    break;
                }
            }
            continue;
        }

        if (isWrapperOption(arg)) {
            expanded.push_back(arg);
            expectValue = arg == "--profile";
            optionalValue = arg == "--clear-cache";
            continue;
        }

        break; // first aws token
    }

    expanded.insert(expanded.end(), args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return expanded;
}

Options parseOptions(const std::vector<std::string>& args) {
    Options opts;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--profile") {
            if (i + 1 >= args.size() || args[i + 1].empty()) {
                throw core::ConfigError("--profile requires a profile name", "See 'awx --help'");
            }
            opts.profile = args[++i];
        } else if (core::startsWith(arg, "--profile=")) {
            std::string value = arg.substr(10);
            if (value.empty()) {
                throw core::ConfigError("--profile requires a profile name", "See 'awx --help'");
            }
            opts.profile = value;
        } else if (arg == "--clear-cache") {
            if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] != '-') {
                opts.clearCache = args[++i];
            } else {
                opts.clearCache = "all";
            }
        } else if (core::startsWith(arg, "--clear-cache=")) {
            std::string value = arg.substr(14);
            opts.clearCache = value.empty() ? "all" : value;
        } else if (arg == "--config") {
            opts.showConfig = true;
        } else if (arg == "--no-interactive") {
            opts.noInteractive = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "--help") {
            opts.help = true;
        } else {
            break;
        }
    }

    opts.awsArgs.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return opts;
}

// Help system
void cmd_help() {
    std::cout << ui::colorize("awx", ui::Colors::BRIGHT_CYAN + ui::Colors::BOLD)
              << " - authentication wrapper for the AWS CLI\n\n";

    std::cout << ui::colorize("USAGE:", ui::Colors::BRIGHT_WHITE + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("awx", ui::Colors::BRIGHT_CYAN) << " [OPTIONS] [--] <AWS_ARGS>...\n\n";

    std::cout << ui::colorize("OPTIONS:", ui::Colors::BRIGHT_GREEN + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("-p, --profile <NAME>", ui::Colors::BRIGHT_CYAN) << "         Select profile (overrides AWS_PROFILE)\n";
    std::cout << "  " << ui::colorize("-c, --config", ui::Colors::BRIGHT_CYAN) << "                 List profiles with capability badges\n";
    std::cout << "  " << ui::colorize("-n, --no-interactive", ui::Colors::BRIGHT_CYAN) << "         Never prompt; fail if login or MFA is needed\n";
    std::cout << "  " << ui::colorize("    --clear-cache [NAME|all]", ui::Colors::BRIGHT_CYAN) << " Remove cached sessions (default: all)\n";
    std::cout << "  " << ui::colorize("-v, --verbose", ui::Colors::BRIGHT_CYAN) << "                Explain each authentication step\n";
    std::cout << "  " << ui::colorize("-V, --version", ui::Colors::BRIGHT_CYAN) << "                Show version information\n";
    std::cout << "  " << ui::colorize("-h, --help", ui::Colors::BRIGHT_CYAN) << "                   Show this help message\n\n";

    std::cout << ui::colorize("ENVIRONMENT:", ui::Colors::BRIGHT_BLUE + ui::Colors::BOLD) << "\n";
    std::cout << "  AWS_PROFILE             Default profile\n";
    std::cout << "  AWX_NO_INTERACTIVE      Same as --no-interactive\n";
    std::cout << "  AWX_CACHE               Persist sessions (keychain or encrypted files)\n";
    std::cout << "  AWX_CACHE_PASSPHRASE    Passphrase of the encrypted file cache\n";
    std::cout << "  AWX_CACHE_BACKEND       auto or file\n";
    std::cout << "  AWX_CACHE_STATIC        0 to keep static keys out of the cache\n";
    std::cout << "  AWX_CONNECT_TIMEOUT     Seconds for the SSO probe (default 5)\n";
    std::cout << "  AWX_REQUEST_TIMEOUT     Seconds per STS call (default 30)\n";
    std::cout << "  AWX_SESSION_DURATION    Session length in seconds (default 3600)\n";
    std::cout << "  AWX_AWS_BINARY          Wrapped executable (default aws)\n\n";

    std::cout << ui::colorize("EXAMPLES:", ui::Colors::BRIGHT_YELLOW + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("awx -p prod s3 ls", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << "  " << ui::colorize("awx -n -p ci -- sts get-caller-identity", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << "  " << ui::colorize("AWX_CACHE=1 awx -p admin ec2 describe-instances", ui::Colors::BRIGHT_CYAN) << "\n";
}

void showVersion() {
    std::cout << "awx version " << core::AWX_VERSION << "\n";
}

} // namespace cli
} // namespace awx

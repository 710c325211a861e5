#include "cli/cli.hpp"
#include "commands/commands.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <map>
#include <string>
#include <vector>

using namespace awx;

int main(int argc, char** argv) {
    // Initialize configuration
    core::Config cfg = core::loadConfig();

    std::vector<std::string> rawArgs;
    rawArgs.reserve(argc > 0 ? argc - 1 : 0);
    for (int i = 1; i < argc; ++i) {
        rawArgs.push_back(argv[i]);
    }

    try {
        cli::Options opts = cli::parseOptions(cli::expandShortFlags(rawArgs));
        if (opts.verbose) {
            cfg.verbose = true;
        }
        if (opts.noInteractive) {
            cfg.interactive = false;
        }

        std::string cmd = "run";
        if (opts.help) {
            cmd = "help";
        } else if (opts.version) {
            cmd = "version";
        } else if (opts.clearCache) {
            cmd = "clear-cache";
        } else if (opts.showConfig) {
            cmd = "config";
        }

        // Command dispatch table
        std::map<std::string, commands::CommandHandler> commandMap = {
            {"run", commands::cmd_run},
            {"config", commands::cmd_config},
            {"clear-cache", commands::cmd_clear_cache},
            {"version", commands::cmd_version},
            {"help", commands::cmd_help}
        };

        return commandMap.at(cmd)(cfg, opts);
    } catch (const core::AwxError& e) {
        std::string msg = e.what();
        if (!e.hint().empty()) {
            msg += "\n   " + e.hint();
        }
        core::error(cfg, msg, e.exitCode());
    } catch (const std::exception& e) {
        core::error(cfg, std::string("Unexpected error: ") + e.what(), core::ExitCode::INTERNAL);
    }
}

#pragma once

#include "cli/cli.hpp"
#include "core/config.hpp"
#include "profiles/profile_store.hpp"
#include <string>

namespace awx {
namespace commands {

// Command handler type definition
using CommandHandler = int(*)(const core::Config& cfg, const cli::Options& opts);

// Individual command handlers
int cmd_run(const core::Config& cfg, const cli::Options& opts);
int cmd_config(const core::Config& cfg, const cli::Options& opts);
int cmd_clear_cache(const core::Config& cfg, const cli::Options& opts);
int cmd_version(const core::Config& cfg, const cli::Options& opts);
int cmd_help(const core::Config& cfg, const cli::Options& opts);

// Profile selection: -p, then AWS_PROFILE, then an interactive menu when
// several profiles exist, then "default".
std::string selectProfileName(const core::Config& cfg, const cli::Options& opts,
                              const profiles::ProfileStore& store);

} // namespace commands
} // namespace awx

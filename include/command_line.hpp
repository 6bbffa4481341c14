//
//  command_line.hpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "oggfetch.hpp"

namespace oggfetch {

inline constexpr char kCatalogEnv[] = "OGGFETCH_CATALOG";
inline constexpr char kDefaultCatalogDir[] = "catalog";

enum class CommandAction {
    Run,         ///< Options complete; start a run.
    Usage,       ///< Help requested or required input missing.
    Version,     ///< Print the version banner.
    UsageError,  ///< Unknown option, missing option value or bad level.
};

struct CommandLine {
    CommandAction action = CommandAction::Usage;
    RunOptions options;
    std::optional<LogVerbosity> log_level;
    std::string error;  ///< Message for UsageError.
};

// Parse the arguments following the program name. `catalog_env` is the value of
// kCatalogEnv (or null) and seeds the catalog directory before -c/--catalog is applied.
CommandLine parse_command_line(const std::vector<std::string> &args, const char *catalog_env);

// Exit code for the actions that end the program without a run.
int exit_code_for(CommandAction action);

void print_usage(std::ostream &out, const std::string &program);

}  // namespace oggfetch

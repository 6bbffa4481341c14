//
//  command_line.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "command_line.hpp"

#include <string>
#include <utility>

namespace oggfetch {

namespace {

// Options taking a value; the value must follow as the next argument.
bool is_value_option(const std::string &arg) {
    return arg == "-u" || arg == "--user" || arg == "-p" || arg == "--pass" || arg == "-f" ||
           arg == "--format" || arg == "-c" || arg == "--catalog" || arg == "--log-level";
}

CommandLine usage_error(CommandLine cl, const std::string &message) {
    cl.action = CommandAction::UsageError;
    cl.error = message;
    return cl;
}

}  // namespace

CommandLine parse_command_line(const std::vector<std::string> &args, const char *catalog_env) {
    CommandLine cl;
    cl.options.catalog_dir = catalog_env ? catalog_env : kDefaultCatalogDir;

    bool help = false;
    bool version = false;
    bool have_user = false;
    bool have_pass = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "-h" || arg == "--help") {
            help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            version = true;
            continue;
        }
        if (is_value_option(arg)) {
            if (i + 1 >= args.size()) {
                return usage_error(std::move(cl), "argument to option " + arg + " missing");
            }
            const std::string &value = args[++i];
            if (arg == "-u" || arg == "--user") {
                cl.options.credentials.username = value;
                have_user = true;
            } else if (arg == "-p" || arg == "--pass") {
                cl.options.credentials.password = value;
                have_pass = true;
            } else if (arg == "-f" || arg == "--format") {
                cl.options.output_template = value;
            } else if (arg == "-c" || arg == "--catalog") {
                cl.options.catalog_dir = value;
            } else {
                cl.log_level = parse_log_verbosity(value);
                if (!cl.log_level) {
                    return usage_error(std::move(cl), "invalid log level " + value);
                }
            }
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            return usage_error(std::move(cl), "unrecognized option " + arg);
        }
        cl.options.inputs.push_back(arg);
    }

    if (help) {
        cl.action = CommandAction::Usage;
    } else if (version) {
        cl.action = CommandAction::Version;
    } else if (!have_user || !have_pass || cl.options.inputs.empty()) {
        cl.action = CommandAction::Usage;
    } else {
        cl.action = CommandAction::Run;
    }
    return cl;
}

int exit_code_for(CommandAction action) {
    switch (action) {
        case CommandAction::Run:
        case CommandAction::Usage:
        case CommandAction::Version:
            return 0;
        case CommandAction::UsageError:
            return 1;
    }
    return 1;
}

void print_usage(std::ostream &out, const std::string &program) {
    out << "OggFetch " << version_string() << "\n"
        << "Copyright (c) 2026 Till Toenshoff\n\n"
        << "Usage: " << program << " [OPTIONS] URIs...\n\n"
        << "Options:\n"
        << "  -h, --help          Print this help menu.\n"
        << "  -v, --version       Print the version and exit.\n"
        << "  -u, --user USER     User login name, required.\n"
        << "  -p, --pass PASS     User password, required.\n"
        << "  -f, --format FMT    Output format to use. " << kDefaultOutputTemplate
        << " is used by default.\n"
        << "                      Available format specifiers are: {author}, {album},\n"
        << "                      {name} and {ext}. When a track has more than one author,\n"
        << "                      {author} evaluates to the main one only (track metadata\n"
        << "                      still lists every artist).\n"
        << "  -c, --catalog DIR   Catalog directory (default: $" << kCatalogEnv << " or ./"
        << kDefaultCatalogDir << ").\n"
        << "  --log-level LEVEL   Set logging verbosity: error|warn|info|debug "
        << "(default: info).\n\n"
        << "URIs may be spotify:<kind>:<id> or https://open.spotify.com/<kind>/<id> with\n"
        << "<kind> one of track, playlist, album, artist.\n";
}

}  // namespace oggfetch

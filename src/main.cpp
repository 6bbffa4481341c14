//
//  main.cpp
//  OggFetch
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "command_line.hpp"
#include "logging.hpp"
#include "oggfetch.hpp"

int main(int argc, char **argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto cl = oggfetch::parse_command_line(args, std::getenv(oggfetch::kCatalogEnv));

    switch (cl.action) {
        case oggfetch::CommandAction::UsageError:
            std::cout << "error: " << cl.error << "\n";
            return oggfetch::exit_code_for(cl.action);
        case oggfetch::CommandAction::Version:
            std::cout << "OggFetch " << oggfetch::version_string() << "\n";
            return oggfetch::exit_code_for(cl.action);
        case oggfetch::CommandAction::Usage:
            oggfetch::print_usage(std::cout, argv[0]);
            return oggfetch::exit_code_for(cl.action);
        case oggfetch::CommandAction::Run:
            break;
    }

    if (cl.log_level) {
        oggfetch::set_log_verbosity(*cl.log_level);
    }

    auto report = oggfetch::run_offline(cl.options, std::cout);
    if (report.exit == oggfetch::RunExit::AuthFailed) {
        std::cout << "error: cannot log in: " << report.status.message << "\n";
    } else if (report.exit == oggfetch::RunExit::Aborted) {
        std::cout << "error: " << report.status.message << ", aborting...\n";
    }
    return oggfetch::exit_code_for(report.exit);
}

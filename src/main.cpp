/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point.
 *
 * @details
 * 1. Argument check (a single positional path, no flags).
 * 2. Configuration from the environment.
 * 3. One rendering pass over the input file.
 */

#include "logview/app/viewer.hpp"
#include "logview/infra/config.hpp"
#include "logview/infra/logger.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cerr << "No input." << std::endl;
        return 0;
    }

    const auto config = logview::infra::Config::from_env();
    logview::infra::Logger::set_level(config.log_level);

    try {
        const std::string path = argv[1];
        logview::infra::Logger::log(logview::infra::LogLevel::DEBUG,
                                    "Config: input '" + path + "', color " +
                                        (config.colorize ? "on" : "off"));

        logview::app::Viewer viewer(config, std::cout);
        viewer.run(path);
    } catch (const std::exception& e) {
        logview::infra::Logger::log(logview::infra::LogLevel::FATAL,
                                    "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

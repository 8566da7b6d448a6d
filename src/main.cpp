// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief Application entry point
 *
 * All command logic lives in CliApplication (src/application/cli_application.cpp).
 *
 * @see CliApplication
 */

#include "cli_application.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>

// Log to stderr without spdlog; it may not be initialized or may be broken.
static void log_fatal(const char* msg) {
    fprintf(stderr, "[FATAL] %s\n", msg);
    fflush(stderr);
}

// Called by std::terminate(): logs what we can before aborting.
static void terminate_handler() {
    // Guard against re-entrance (e.g. exception::what() throws)
    static bool entered = false;
    if (entered) {
        abort();
    }
    entered = true;

    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            fprintf(stderr, "[FATAL] Uncaught exception: %s\n", e.what());
            fflush(stderr);
        } catch (...) {
            log_fatal("Uncaught non-std::exception");
        }
    } else {
        log_fatal("std::terminate() called without active exception");
    }

    abort();
}

int main(int argc, char** argv) {
    std::set_terminate(terminate_handler);

    try {
        cardforge::CliApplication app(std::cout, std::cerr);
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "[FATAL] Unhandled exception: %s\n", e.what());
        fflush(stderr);
        return cardforge::CLI_EXIT_RUNTIME_ERROR;
    } catch (...) {
        log_fatal("Unhandled non-std::exception");
        return cardforge::CLI_EXIT_RUNTIME_ERROR;
    }
}

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// tus_cli - resumable upload client
// Creates, inspects, uploads and deletes tus upload resources

#include <exception>
#include <iostream>

#include <tus_log_init.hpp>

#include "commands.hpp"

#define TUS_LOG_COMPONENT "tus_cli"
#include <tus_log_macros.hpp>

/**
 * Main entry point for tus_cli
 */
int main(int argc, char* argv[]) {
  int rc = 1;
  try {
    tus::cli::Commands commands;
    rc = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    TUS_LOG_FATAL("Unhandled exception" << tus::logging::kv("what", e.what()));
    std::cerr << "Error: " << e.what() << std::endl;
    rc = 1;
  }
  tus::logging::shutdown_logging();
  return rc;
}

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// ferry - S3 transfer tool
// Parallel ranged downloads, multipart uploads and copies with pause/resume

#include <csignal>
#include <exception>
#include <iostream>

#include <ferry_log_init.hpp>

#include "commands.hpp"

namespace {

ferry::cli::Commands* g_commands = nullptr;

void signal_handler(int signal) {
  if ((signal == SIGINT || signal == SIGTERM) && g_commands) {
    g_commands->interrupt();
  }
}

}  // namespace

/**
 * Main entry point for ferry
 */
int main(int argc, char* argv[]) {
  int rc = 1;
  {
    ferry::cli::Commands commands;
    g_commands = &commands;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
      rc = commands.execute(argc, argv);
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << std::endl;
      rc = 1;
    }
    g_commands = nullptr;
  }

  ferry::logging::shutdown_logging();
  return rc;
}

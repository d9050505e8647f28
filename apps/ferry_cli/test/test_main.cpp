// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <ferry_log_init.hpp>

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  // Console only, so transfer logs do not bury gtest output
  ferry::logging::LoggingConfig log_config;
  log_config.file_enabled = false;
  log_config.console_colors = false;
  log_config.console_level = ferry::logging::severity_level::warn;
  ferry::logging::apply_env_overrides(log_config);
  ferry::logging::init_logging(log_config);

  int result = RUN_ALL_TESTS();
  ferry::logging::shutdown_logging();
  return result;
}

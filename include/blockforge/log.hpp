// SPDX-License-Identifier: MIT
// Blockforge - Logging
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <string>

namespace blockforge
{

/// Log levels, lowest is most verbose
enum class LogLevel : int
{
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  None = 4
};

/// Set the process-wide minimum level (default: Info)
void log_set_level (LogLevel level);
LogLevel log_get_level ();

/// Prefix each line with a local timestamp (default: on)
void log_enable_timestamps (bool enable);

void log_debug (const std::string &msg);
void log_info (const std::string &msg);
void log_warn (const std::string &msg);
void log_error (const std::string &msg);

} // namespace blockforge

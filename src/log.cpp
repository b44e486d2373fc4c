// SPDX-License-Identifier: MIT
// Blockforge - Logging Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace blockforge
{

namespace
{
std::atomic<LogLevel> g_level{ LogLevel::Info };
std::atomic<bool> g_timestamps{ true };
std::mutex g_mutex;

void
write_line (LogLevel level, const char *tag, const std::string &msg)
{
  if (level < g_level.load (std::memory_order_relaxed))
    return;

  std::lock_guard<std::mutex> lock (g_mutex);
  if (g_timestamps.load (std::memory_order_relaxed))
    {
      const std::time_t now = std::chrono::system_clock::to_time_t (
          std::chrono::system_clock::now ());
      std::tm tm{};
      localtime_r (&now, &tm);
      char buf[32];
      std::snprintf (buf, sizeof (buf), "%04d-%02d-%02d %02d:%02d:%02d",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                     tm.tm_hour, tm.tm_min, tm.tm_sec);
      std::cerr << "[" << tag << "][" << buf << "] " << msg << '\n';
    }
  else
    {
      std::cerr << "[" << tag << "] " << msg << '\n';
    }
}
}

void
log_set_level (LogLevel level)
{
  g_level.store (level, std::memory_order_relaxed);
}

LogLevel
log_get_level ()
{
  return g_level.load (std::memory_order_relaxed);
}

void
log_enable_timestamps (bool enable)
{
  g_timestamps.store (enable, std::memory_order_relaxed);
}

void
log_debug (const std::string &msg)
{
  write_line (LogLevel::Debug, "DEBUG", msg);
}

void
log_info (const std::string &msg)
{
  write_line (LogLevel::Info, "INFO", msg);
}

void
log_warn (const std::string &msg)
{
  write_line (LogLevel::Warn, "WARN", msg);
}

void
log_error (const std::string &msg)
{
  write_line (LogLevel::Error, "ERROR", msg);
}

} // namespace blockforge

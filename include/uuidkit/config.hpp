// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include <uuidkit/export.hpp>

namespace uuidkit {

enum class LogLevel {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6
};

UUIDKIT_API void set_log_level(LogLevel level) noexcept;
UUIDKIT_API LogLevel log_level() noexcept;

// "trace", "debug", ... Returns std::nullopt for anything else.
UUIDKIT_API std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

struct Config {
  std::optional<LogLevel>      log_level;                      // left alone when unset
  std::optional<std::uint64_t> node_id;                        // masked to 48 bits
  bool                         use_hardware_address = true;    // otherwise random + multicast bit
  std::optional<std::uint16_t> clock_sequence;                 // masked to 14 bits
  std::filesystem::path        clock_sequence_file;            // persisted across restarts when set
};

} // namespace uuidkit

// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "logging.hpp"

#include <array>
#include <utility>

namespace uuidkit::impl {

std::shared_ptr<SimpleLogger>& get_logger()
{
  static std::shared_ptr<SimpleLogger> logger =
      std::make_shared<SimpleLogger>("uuidkit", LogLevel::info);
  return logger;
}

} // namespace uuidkit::impl

namespace uuidkit {

UUIDKIT_API void set_log_level(LogLevel level) noexcept
{
  impl::get_logger()->set_level(level);
}

UUIDKIT_API LogLevel log_level() noexcept
{
  return impl::get_logger()->level();
}

UUIDKIT_API std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept
{
  static constexpr std::array<std::pair<std::string_view, LogLevel>, 7> names{{
      {"trace", LogLevel::trace},
      {"debug", LogLevel::debug},
      {"info", LogLevel::info},
      {"warn", LogLevel::warn},
      {"error", LogLevel::error},
      {"critical", LogLevel::critical},
      {"off", LogLevel::off},
  }};

  for (auto const& [n, level] : names) {
    if (n == name)
      return level;
  }
  return std::nullopt;
}

} // namespace uuidkit

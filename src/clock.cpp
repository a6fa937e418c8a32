// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <uuidkit/clock.hpp>

#include "layout.hpp"
#include "logging.hpp"

#include <chrono>

namespace uuidkit {

UUIDKIT_API std::uint64_t SystemClock::monotonic()
{
  using ticks = std::chrono::duration<std::uint64_t, std::ratio<1, 10'000'000>>;

  auto const now = std::chrono::duration_cast<ticks>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count() +
                   gregorian_offset;
  auto tick = now & impl::layout::timestamp_mask;

  std::lock_guard<std::mutex> lock(mutex_);
  if (tick <= last_) {
    if (last_ - tick > 10'000'000)
      UUIDKIT_LOG_DEBUG("wall clock is {} ticks behind the last issued timestamp",
                        last_ - tick);
    tick = (last_ + 1) & impl::layout::timestamp_mask;
  }
  last_ = tick;
  return tick;
}

UUIDKIT_API std::shared_ptr<SystemClock> SystemClock::instance()
{
  static auto clock = std::make_shared<SystemClock>();
  return clock;
}

UUIDKIT_API std::uint32_t SystemPosixClock::seconds()
{
  auto const now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch());
  return static_cast<std::uint32_t>(now.count());
}

UUIDKIT_API std::shared_ptr<SystemPosixClock> SystemPosixClock::instance()
{
  static auto clock = std::make_shared<SystemPosixClock>();
  return clock;
}

} // namespace uuidkit

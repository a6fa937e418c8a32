// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include <uuidkit/export.hpp>

namespace uuidkit {

// 100ns ticks between 1582-10-15T00:00:00Z and the Unix epoch.
inline constexpr std::uint64_t gregorian_offset = 0x01B21DD213814000ULL;

// Source of V1 timestamps.
class UUIDKIT_API Clock
{
public:
  virtual ~Clock() = default;

  // 60-bit count of 100ns ticks since 1582-10-15, strictly greater than
  // any value previously returned by this clock.
  virtual std::uint64_t monotonic() = 0;
};

// Source of Unix epoch seconds for SQUUIDs.
class UUIDKIT_API PosixClock
{
public:
  virtual ~PosixClock() = default;

  virtual std::uint32_t seconds() = 0;
};

/**
 * Wall clock based Clock. When the wall clock has not advanced (or went
 * backwards) since the last call the previous tick is bumped by one, so
 * every caller observes a distinct value.
 */
class UUIDKIT_API SystemClock final : public Clock
{
  std::mutex mutex_;
  std::uint64_t last_ = 0;

public:
  std::uint64_t monotonic() override;

  // The process-wide instance shared by every default context.
  static std::shared_ptr<SystemClock> instance();
};

class UUIDKIT_API SystemPosixClock final : public PosixClock
{
public:
  std::uint32_t seconds() override;

  static std::shared_ptr<SystemPosixClock> instance();
};

} // namespace uuidkit

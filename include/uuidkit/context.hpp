// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

#include <uuidkit/clock.hpp>
#include <uuidkit/config.hpp>
#include <uuidkit/export.hpp>
#include <uuidkit/node.hpp>

namespace uuidkit {

// Everything the time-based constructors depend on.
class UUIDKIT_API GenerationContext
{
  Node node_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<PosixClock> posix_;

public:
  GenerationContext(Node node, std::shared_ptr<Clock> clock,
                    std::shared_ptr<PosixClock> posix) noexcept;

  const Node& node() const noexcept { return node_; }
  Clock& clock() const noexcept { return *clock_; }
  PosixClock& posix() const noexcept { return *posix_; }

  // Node::instance() with the process-wide system clocks.
  static const GenerationContext& default_context();
};

class UUIDKIT_API ContextBuilder
{
  Config cfg_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<PosixClock> posix_;

public:
  ContextBuilder() = default;
  explicit ContextBuilder(Config cfg);

  ContextBuilder& set_log_level(LogLevel level) noexcept;
  ContextBuilder& with_node_id(std::uint64_t id) noexcept;
  ContextBuilder& with_random_node() noexcept;
  ContextBuilder& with_clock_sequence(std::uint16_t clock_sequence) noexcept;
  ContextBuilder& with_clock_sequence_file(std::filesystem::path path);
  ContextBuilder& with_clock(std::shared_ptr<Clock> clock) noexcept;
  ContextBuilder& with_posix_clock(std::shared_ptr<PosixClock> posix) noexcept;

  const Config& config() const noexcept { return cfg_; }

  // Applies the log level, if one was set, and creates a new node identity.
  GenerationContext build() const;
};

} // namespace uuidkit

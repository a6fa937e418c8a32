// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <uuidkit/context.hpp>

#include "logging.hpp"

#include <utility>

namespace uuidkit {

UUIDKIT_API GenerationContext::GenerationContext(
    Node node, std::shared_ptr<Clock> clock,
    std::shared_ptr<PosixClock> posix) noexcept
    : node_(node)
    , clock_(std::move(clock))
    , posix_(std::move(posix))
{
}

UUIDKIT_API const GenerationContext& GenerationContext::default_context()
{
  static const GenerationContext ctx(Node::instance(), SystemClock::instance(),
                                     SystemPosixClock::instance());
  return ctx;
}

UUIDKIT_API ContextBuilder::ContextBuilder(Config cfg)
    : cfg_(std::move(cfg))
{
}

UUIDKIT_API ContextBuilder& ContextBuilder::set_log_level(LogLevel level) noexcept
{
  cfg_.log_level = level;
  return *this;
}

UUIDKIT_API ContextBuilder& ContextBuilder::with_node_id(std::uint64_t id) noexcept
{
  cfg_.node_id = id;
  return *this;
}

UUIDKIT_API ContextBuilder& ContextBuilder::with_random_node() noexcept
{
  cfg_.node_id.reset();
  cfg_.use_hardware_address = false;
  return *this;
}

UUIDKIT_API ContextBuilder&
ContextBuilder::with_clock_sequence(std::uint16_t clock_sequence) noexcept
{
  cfg_.clock_sequence = clock_sequence;
  return *this;
}

UUIDKIT_API ContextBuilder&
ContextBuilder::with_clock_sequence_file(std::filesystem::path path)
{
  cfg_.clock_sequence_file = std::move(path);
  return *this;
}

UUIDKIT_API ContextBuilder&
ContextBuilder::with_clock(std::shared_ptr<Clock> clock) noexcept
{
  clock_ = std::move(clock);
  return *this;
}

UUIDKIT_API ContextBuilder&
ContextBuilder::with_posix_clock(std::shared_ptr<PosixClock> posix) noexcept
{
  posix_ = std::move(posix);
  return *this;
}

UUIDKIT_API GenerationContext ContextBuilder::build() const
{
  if (cfg_.log_level)
    uuidkit::set_log_level(*cfg_.log_level);

  auto node = Node::create(cfg_);
  UUIDKIT_LOG_DEBUG("generation context: node id {:012x}, clock sequence {}",
                    node.id(), node.clock_sequence());

  // Custom contexts still share the process-wide system clock so that V1
  // timestamps stay distinct across contexts.
  return GenerationContext(
      node, clock_ ? clock_ : SystemClock::instance(),
      posix_ ? posix_ : SystemPosixClock::instance());
}

} // namespace uuidkit

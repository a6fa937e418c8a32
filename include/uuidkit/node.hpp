// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

#include <uuidkit/config.hpp>
#include <uuidkit/export.hpp>

namespace uuidkit {

/**
 * Node identity used by V1 UUIDs: a 48-bit node id and a 14-bit clock
 * sequence. Both values are fixed once the object exists.
 *
 * Node::instance() is the process-wide identity, created lazily on first
 * access from a hardware address when one is available, otherwise from
 * random bits with the multicast bit set (RFC 4122 section 4.5).
 */
class UUIDKIT_API Node
{
  std::uint64_t id_;
  std::uint16_t clock_sequence_;

public:
  // id is masked to 48 bits and clock_sequence to 14 bits.
  Node(std::uint64_t id, std::uint16_t clock_sequence) noexcept;

  std::uint64_t id() const noexcept { return id_; }
  std::uint16_t clock_sequence() const noexcept { return clock_sequence_; }

  // True for ids that did not come from a network card.
  bool is_multicast() const noexcept;

  // Builds a fresh identity according to cfg. Throws EntropyError when
  // random bits are needed and cannot be obtained.
  static Node create(const Config& cfg);

  static const Node& instance();
};

} // namespace uuidkit

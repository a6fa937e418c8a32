// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <uuidkit/bits.hpp>

// RFC 4122 field positions inside the msb/lsb words.
namespace uuidkit::impl::layout {

using bits::mask;

// msb
inline constexpr unsigned version_offset = 12;
inline constexpr auto version_mask = mask(4, version_offset);

// 60-bit timestamp split for V1
inline constexpr auto time_low_mask = mask(32, 0);
inline constexpr auto time_mid_mask = mask(16, 32);
inline constexpr auto time_high_mask = mask(12, 48);
inline constexpr unsigned time_low_shift = 32;
inline constexpr unsigned time_mid_shift = 16;
inline constexpr auto timestamp_mask = mask(60, 0);

// lsb
inline constexpr unsigned variant_offset = 62;
inline constexpr auto variant_mask = mask(2, variant_offset);
inline constexpr std::uint64_t variant_rfc4122 = 0x2;

inline constexpr unsigned clock_seq_high_offset = 56;
inline constexpr auto clock_seq_high_mask = mask(6, clock_seq_high_offset);
inline constexpr unsigned clock_seq_low_offset = 48;
inline constexpr auto clock_seq_low_mask = mask(8, clock_seq_low_offset);
inline constexpr auto node_mask = mask(48, 0);

inline constexpr auto clock_seq_mask = mask(14, 0);
inline constexpr unsigned multicast_bit = 40;

constexpr std::uint64_t with_version(std::uint64_t msb,
                                     std::uint64_t version) noexcept
{
  return bits::write_byte(version_mask, version_offset, msb, version);
}

constexpr std::uint64_t with_rfc4122_variant(std::uint64_t lsb) noexcept
{
  return bits::write_byte(variant_mask, variant_offset, lsb, variant_rfc4122);
}

} // namespace uuidkit::impl::layout

// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>

// Mask/shift primitives over 64-bit words. Offsets count from the least
// significant bit (offset 0 is the LSB).
namespace uuidkit::bits {

using word_t = std::uint64_t;

// `width` contiguous one-bits starting at `offset`.
// width + offset must not exceed 64.
constexpr word_t mask(unsigned width, unsigned offset) noexcept
{
  assert(width + offset <= 64);
  word_t const ones = width >= 64 ? ~word_t{0} : (word_t{1} << width) - 1;
  return offset >= 64 ? word_t{0} : ones << offset;
}

constexpr word_t read_byte(word_t mask, unsigned offset, word_t word) noexcept
{
  return (word & mask) >> offset;
}

constexpr word_t
write_byte(word_t mask, unsigned offset, word_t word, word_t value) noexcept
{
  return (word & ~mask) | ((value << offset) & mask);
}

// Big-endian.
constexpr std::array<std::uint8_t, 8> to_bytes(word_t word) noexcept
{
  std::array<std::uint8_t, 8> bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i)
    bytes[i] = static_cast<std::uint8_t>(word >> (56 - 8 * i));
  return bytes;
}

// Big-endian. Fewer than 8 bytes land in the low-order positions.
constexpr word_t from_bytes(std::span<const std::uint8_t> bytes) noexcept
{
  assert(bytes.size() <= 8);
  word_t word = 0;
  for (auto b : bytes)
    word = (word << 8) | b;
  return word;
}

} // namespace uuidkit::bits

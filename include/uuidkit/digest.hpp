// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include <uuidkit/export.hpp>
#include <uuidkit/uuid.hpp>

namespace uuidkit {

enum class Algorithm {
  md5,  // 16 byte digest, used by V3
  sha1, // 20 byte digest, used by V5
};

/**
 * Streaming hash accumulator.
 * digest() finalises the accumulator; any call after that throws.
 * Instances are not meant to be shared between threads.
 */
class UUIDKIT_API Digest
{
  struct Impl;
  std::unique_ptr<Impl> pimpl_;

public:
  explicit Digest(Algorithm algorithm);
  Digest(Digest&&) noexcept;
  Digest& operator=(Digest&&) noexcept;
  ~Digest();

  Digest& update(std::span<const std::uint8_t> bytes);
  Digest& update(std::string_view text);

  std::vector<std::uint8_t> digest();

  Algorithm algorithm() const noexcept;
  std::size_t size() const noexcept;
};

// Byte encoding used by the name-based constructors. Specialize with a
// static to_bytes(const T&) to make a type usable as a name.
template <typename T> struct Digestible {
};

template <> struct Digestible<std::string_view> {
  static std::vector<std::uint8_t> to_bytes(std::string_view value)
  {
    return {value.begin(), value.end()};
  }
};

template <> struct Digestible<std::vector<std::uint8_t>> {
  static std::vector<std::uint8_t> to_bytes(const std::vector<std::uint8_t>& value)
  {
    return value;
  }
};

// msb then lsb, big-endian
template <> struct Digestible<Uuid> {
  static std::vector<std::uint8_t> to_bytes(const Uuid& value)
  {
    auto const bytes = value.to_bytes();
    return {bytes.begin(), bytes.end()};
  }
};

template <typename T>
concept digestible = requires(const T& value) {
  { Digestible<T>::to_bytes(value) } -> std::convertible_to<std::vector<std::uint8_t>>;
};

} // namespace uuidkit

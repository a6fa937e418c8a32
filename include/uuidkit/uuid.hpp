// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <uuidkit/export.hpp>

namespace uuidkit {

enum class ParseError {
  wrong_length = 1,
  missing_hyphen,
  invalid_hex_digit,
};

UUIDKIT_API const std::error_category& parse_category() noexcept;

inline std::error_code make_error_code(ParseError e) noexcept
{
  return {static_cast<int>(e), parse_category()};
}

/**
 * An immutable RFC 4122 UUID: a 128-bit value held as two 64-bit words.
 *
 * Equality and ordering follow the unsigned 128-bit integer
 * `(msb << 64) | lsb`. The kind tag is derived from the version nibble
 * when the value is constructed and never changes afterwards.
 */
class UUIDKIT_API Uuid
{
public:
  using bytes_type = std::array<std::uint8_t, 16>;

  // Layout family, from the top bits of octet 8.
  enum class Variant : std::uint8_t {
    ncs = 0,
    rfc4122 = 2,
    microsoft = 6,
    future = 7,
  };

  enum class Kind : std::uint8_t {
    nil,
    v1,
    v2,
    v3,
    v4,
    v5,
    unknown,
  };

  constexpr Uuid() noexcept = default;

  static constexpr Uuid nil() noexcept { return Uuid{}; }

  // No masking is applied. The kind is taken from the version nibble.
  static Uuid from_words(std::uint64_t msb, std::uint64_t lsb) noexcept;

  static Uuid from_bytes(const bytes_type& bytes) noexcept;

  // Accepts only the canonical 36 character hyphenated form.
  static std::optional<Uuid> parse(std::string_view text,
                                   std::error_code& ec) noexcept;
  static std::optional<Uuid> parse(std::string_view text) noexcept;

  // Same as parse() but throws ParseException.
  static Uuid from_string(std::string_view text);

  std::uint64_t msb() const noexcept { return msb_; }
  std::uint64_t lsb() const noexcept { return lsb_; }

  Variant variant() const noexcept;

  // The raw version nibble, 0 for nil.
  std::uint8_t version() const noexcept;

  Kind kind() const noexcept { return kind_; }
  bool is(Kind kind) const noexcept { return kind_ == kind; }
  bool is_nil() const noexcept { return msb_ == 0 && lsb_ == 0; }

  // Lower-case hyphenated form.
  std::string to_string() const;
  bytes_type to_bytes() const noexcept;

  friend bool operator==(const Uuid& a, const Uuid& b) noexcept
  {
    return a.msb_ == b.msb_ && a.lsb_ == b.lsb_;
  }

  friend std::strong_ordering operator<=>(const Uuid& a,
                                          const Uuid& b) noexcept
  {
    if (auto cmp = a.msb_ <=> b.msb_; cmp != 0)
      return cmp;
    return a.lsb_ <=> b.lsb_;
  }

private:
  Uuid(std::uint64_t msb, std::uint64_t lsb, Kind kind) noexcept
      : msb_(msb)
      , lsb_(lsb)
      , kind_(kind)
  {
  }

  std::uint64_t msb_ = 0;
  std::uint64_t lsb_ = 0;
  Kind kind_ = Kind::nil;
};

// Unsigned comparison: msb first, then lsb.
inline std::strong_ordering compare(const Uuid& a, const Uuid& b) noexcept
{
  return a <=> b;
}

UUIDKIT_API std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

UUIDKIT_API std::string_view to_string(Uuid::Variant variant) noexcept;
UUIDKIT_API std::string_view to_string(Uuid::Kind kind) noexcept;

} // namespace uuidkit

template <> struct std::is_error_code_enum<uuidkit::ParseError> : std::true_type {
};

template <> struct std::hash<uuidkit::Uuid> {
  UUIDKIT_API std::size_t operator()(const uuidkit::Uuid& uuid) const noexcept;
};

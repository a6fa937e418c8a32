// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <uuidkit/uuid.hpp>
#include <uuidkit/bits.hpp>
#include <uuidkit/exception.hpp>

#include "layout.hpp"

#include <boost/container_hash/hash.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <ostream>
#include <span>
#include <stdexcept>

namespace uuidkit {

namespace {

class ParseCategory : public std::error_category
{
public:
  const char* name() const noexcept override { return "uuidkit.parse"; }

  std::string message(int ev) const override
  {
    switch (static_cast<ParseError>(ev)) {
    case ParseError::wrong_length:
      return "expected 36 characters";
    case ParseError::missing_hyphen:
      return "expected '-' at positions 8, 13, 18 and 23";
    case ParseError::invalid_hex_digit:
      return "invalid hexadecimal digit";
    default:
      return "unknown parse error";
    }
  }
};

constexpr std::size_t canonical_length = 36;
constexpr std::size_t hyphen_positions[] = {8, 13, 18, 23};

Uuid::Kind kind_of(std::uint64_t msb, std::uint64_t lsb) noexcept
{
  if (msb == 0 && lsb == 0)
    return Uuid::Kind::nil;

  switch (bits::read_byte(impl::layout::version_mask,
                          impl::layout::version_offset, msb)) {
  case 1:
    return Uuid::Kind::v1;
  case 2:
    return Uuid::Kind::v2;
  case 3:
    return Uuid::Kind::v3;
  case 4:
    return Uuid::Kind::v4;
  case 5:
    return Uuid::Kind::v5;
  default:
    return Uuid::Kind::unknown;
  }
}

boost::uuids::uuid to_boost(const Uuid& uuid) noexcept
{
  boost::uuids::uuid u;
  auto const bytes = uuid.to_bytes();
  std::copy(bytes.begin(), bytes.end(), u.begin());
  return u;
}

} // namespace

UUIDKIT_API const std::error_category& parse_category() noexcept
{
  static const ParseCategory category;
  return category;
}

Uuid Uuid::from_words(std::uint64_t msb, std::uint64_t lsb) noexcept
{
  return Uuid(msb, lsb, kind_of(msb, lsb));
}

Uuid Uuid::from_bytes(const bytes_type& bytes) noexcept
{
  std::span<const std::uint8_t> const all(bytes);
  return from_words(bits::from_bytes(all.first<8>()),
                    bits::from_bytes(all.last<8>()));
}

std::optional<Uuid> Uuid::parse(std::string_view text,
                                std::error_code& ec) noexcept
{
  ec.clear();

  if (text.size() != canonical_length) {
    ec = ParseError::wrong_length;
    return std::nullopt;
  }

  for (auto pos : hyphen_positions) {
    if (text[pos] != '-') {
      ec = ParseError::missing_hyphen;
      return std::nullopt;
    }
  }

  // The layout has been checked above, the codec only has hex digits
  // left to reject.
  boost::uuids::uuid u;
  try {
    u = boost::uuids::string_generator()(text.begin(), text.end());
  } catch (const std::runtime_error&) {
    ec = ParseError::invalid_hex_digit;
    return std::nullopt;
  }

  bytes_type bytes;
  std::copy(u.begin(), u.end(), bytes.begin());
  return from_bytes(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view text) noexcept
{
  std::error_code ec;
  return parse(text, ec);
}

Uuid Uuid::from_string(std::string_view text)
{
  std::error_code ec;
  auto uuid = parse(text, ec);
  if (!uuid)
    throw ParseException(ec, std::string(text));
  return *uuid;
}

Uuid::Variant Uuid::variant() const noexcept
{
  auto const top = bits::read_byte(bits::mask(3, 61), 61, lsb_);
  if ((top & 0b100) == 0)
    return Variant::ncs;
  if ((top & 0b110) == 0b100)
    return Variant::rfc4122;
  if (top == 0b110)
    return Variant::microsoft;
  return Variant::future;
}

std::uint8_t Uuid::version() const noexcept
{
  return static_cast<std::uint8_t>(bits::read_byte(
      impl::layout::version_mask, impl::layout::version_offset, msb_));
}

std::string Uuid::to_string() const
{
  return boost::uuids::to_string(to_boost(*this));
}

Uuid::bytes_type Uuid::to_bytes() const noexcept
{
  bytes_type bytes;
  auto const hi = bits::to_bytes(msb_);
  auto const lo = bits::to_bytes(lsb_);
  std::copy(hi.begin(), hi.end(), bytes.begin());
  std::copy(lo.begin(), lo.end(), bytes.begin() + hi.size());
  return bytes;
}

UUIDKIT_API std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
  return os << uuid.to_string();
}

UUIDKIT_API std::string_view to_string(Uuid::Variant variant) noexcept
{
  switch (variant) {
  case Uuid::Variant::ncs:
    return "ncs";
  case Uuid::Variant::rfc4122:
    return "rfc4122";
  case Uuid::Variant::microsoft:
    return "microsoft";
  case Uuid::Variant::future:
    return "future";
  }
  return "unknown";
}

UUIDKIT_API std::string_view to_string(Uuid::Kind kind) noexcept
{
  switch (kind) {
  case Uuid::Kind::nil:
    return "nil";
  case Uuid::Kind::v1:
    return "v1";
  case Uuid::Kind::v2:
    return "v2";
  case Uuid::Kind::v3:
    return "v3";
  case Uuid::Kind::v4:
    return "v4";
  case Uuid::Kind::v5:
    return "v5";
  case Uuid::Kind::unknown:
    return "unknown";
  }
  return "unknown";
}

} // namespace uuidkit

std::size_t std::hash<uuidkit::Uuid>::operator()(
    const uuidkit::Uuid& uuid) const noexcept
{
  std::size_t seed = 0;
  boost::hash_combine(seed, uuid.msb());
  boost::hash_combine(seed, uuid.lsb());
  return seed;
}

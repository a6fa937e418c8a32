// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <uuidkit/bits.hpp>
#include <uuidkit/exception.hpp>
#include <uuidkit/generators.hpp>

#include "layout.hpp"
#include "logging.hpp"

#include <boost/uuid/entropy_error.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <span>

namespace uuidkit {

namespace layout = impl::layout;
using bits::read_byte;
using bits::write_byte;

namespace ns {

UUIDKIT_API const Uuid& dns() noexcept
{
  static const Uuid u = Uuid::from_words(0x6ba7b8109dad11d1, 0x80b400c04fd430c8);
  return u;
}

UUIDKIT_API const Uuid& url() noexcept
{
  static const Uuid u = Uuid::from_words(0x6ba7b8119dad11d1, 0x80b400c04fd430c8);
  return u;
}

UUIDKIT_API const Uuid& oid() noexcept
{
  static const Uuid u = Uuid::from_words(0x6ba7b8129dad11d1, 0x80b400c04fd430c8);
  return u;
}

UUIDKIT_API const Uuid& x500() noexcept
{
  static const Uuid u = Uuid::from_words(0x6ba7b8149dad11d1, 0x80b400c04fd430c8);
  return u;
}

} // namespace ns

UUIDKIT_API Uuid impl::name_based(Algorithm algorithm, std::uint64_t version,
                                  const Uuid& namespace_uuid,
                                  std::span<const std::uint8_t> local)
{
  Digest digest(algorithm);
  digest.update(Digestible<Uuid>::to_bytes(namespace_uuid));
  digest.update(local);
  auto const bytes = digest.digest();

  // MD5 yields 16 bytes and SHA-1 20; only the first 16 are used.
  std::span<const std::uint8_t> const hash(bytes);
  auto const raw_msb = bits::from_bytes(hash.subspan(0, 8));
  auto const raw_lsb = bits::from_bytes(hash.subspan(8, 8));

  return Uuid::from_words(layout::with_version(raw_msb, version),
                          layout::with_rfc4122_variant(raw_lsb));
}

namespace v1 {

UUIDKIT_API Uuid next(const GenerationContext& ctx)
{
  auto const timestamp = ctx.clock().monotonic();
  auto const& node = ctx.node();

  auto const low = read_byte(layout::time_low_mask, 0, timestamp);
  auto const mid = read_byte(layout::time_mid_mask, 32, timestamp);
  auto const high = read_byte(layout::time_high_mask, 48, timestamp);
  auto const msb = layout::with_version(high, 1) |
                   (low << layout::time_low_shift) |
                   (mid << layout::time_mid_shift);

  std::uint64_t const seq = node.clock_sequence();
  auto lsb = node.id();
  lsb = write_byte(layout::clock_seq_low_mask, layout::clock_seq_low_offset,
                   lsb, read_byte(bits::mask(8, 0), 0, seq));
  lsb = write_byte(layout::clock_seq_high_mask, layout::clock_seq_high_offset,
                   lsb, read_byte(bits::mask(6, 8), 8, seq));
  lsb = layout::with_rfc4122_variant(lsb);

  return Uuid::from_words(msb, lsb);
}

UUIDKIT_API Uuid next()
{
  return next(GenerationContext::default_context());
}

UUIDKIT_API std::uint64_t timestamp(const Uuid& uuid) noexcept
{
  auto const msb = uuid.msb();
  auto const low = read_byte(bits::mask(32, 32), 32, msb);
  auto const mid = read_byte(bits::mask(16, 16), 16, msb);
  auto const high = read_byte(bits::mask(12, 0), 0, msb);
  return (high << 48) | (mid << 32) | low;
}

UUIDKIT_API std::uint16_t clock_sequence(const Uuid& uuid) noexcept
{
  auto const lsb = uuid.lsb();
  auto const high = read_byte(layout::clock_seq_high_mask,
                              layout::clock_seq_high_offset, lsb);
  auto const low = read_byte(layout::clock_seq_low_mask,
                             layout::clock_seq_low_offset, lsb);
  return static_cast<std::uint16_t>((high << 8) | low);
}

UUIDKIT_API std::uint64_t node(const Uuid& uuid) noexcept
{
  return read_byte(layout::node_mask, 0, uuid.lsb());
}

} // namespace v1

namespace v3 {

UUIDKIT_API Uuid from(const Uuid& namespace_uuid, std::string_view name)
{
  auto const bytes = Digestible<std::string_view>::to_bytes(name);
  return impl::name_based(Algorithm::md5, 3, namespace_uuid, bytes);
}

} // namespace v3

namespace v4 {

UUIDKIT_API Uuid from(std::uint64_t msb, std::uint64_t lsb) noexcept
{
  return Uuid::from_words(layout::with_version(msb, 4),
                          layout::with_rfc4122_variant(lsb));
}

UUIDKIT_API Uuid random()
{
  boost::uuids::uuid u;
  try {
    // random_generator is not thread-safe, one per thread
    thread_local boost::uuids::random_generator gen;
    u = gen();
  } catch (const boost::uuids::entropy_error& e) {
    UUIDKIT_LOG_ERROR("random UUID generation failed: {}", e.what());
    throw EntropyError(e.what());
  }

  std::span<const std::uint8_t> const bytes(u.data, sizeof(u.data));
  return from(bits::from_bytes(bytes.subspan(0, 8)),
              bits::from_bytes(bytes.subspan(8, 8)));
}

UUIDKIT_API Uuid squuid(const GenerationContext& ctx)
{
  auto const uuid = random();
  std::uint64_t const seconds = ctx.posix().seconds();
  auto const msb = write_byte(bits::mask(32, 32), 32, uuid.msb(), seconds);
  return Uuid::from_words(msb, uuid.lsb());
}

UUIDKIT_API Uuid squuid()
{
  return squuid(GenerationContext::default_context());
}

} // namespace v4

namespace v5 {

UUIDKIT_API Uuid from(const Uuid& namespace_uuid, std::string_view name)
{
  auto const bytes = Digestible<std::string_view>::to_bytes(name);
  return impl::name_based(Algorithm::sha1, 5, namespace_uuid, bytes);
}

} // namespace v5

} // namespace uuidkit

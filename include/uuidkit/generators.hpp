// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include <uuidkit/context.hpp>
#include <uuidkit/digest.hpp>
#include <uuidkit/export.hpp>
#include <uuidkit/uuid.hpp>

namespace uuidkit {

// Well-known namespaces, RFC 4122 appendix C.
namespace ns {
UUIDKIT_API const Uuid& dns() noexcept;
UUIDKIT_API const Uuid& url() noexcept;
UUIDKIT_API const Uuid& oid() noexcept;
UUIDKIT_API const Uuid& x500() noexcept;
} // namespace ns

namespace impl {
// Hashes the 16 namespace bytes followed by `local`, then stamps the
// version nibble and the RFC 4122 variant.
UUIDKIT_API Uuid name_based(Algorithm algorithm, std::uint64_t version,
                            const Uuid& namespace_uuid,
                            std::span<const std::uint8_t> local);
} // namespace impl

namespace v1 {

// Time-based UUID from the context's clock and node identity.
UUIDKIT_API Uuid next(const GenerationContext& ctx);
UUIDKIT_API Uuid next();

// Field readers for time-based values.
UUIDKIT_API std::uint64_t timestamp(const Uuid& uuid) noexcept;
UUIDKIT_API std::uint16_t clock_sequence(const Uuid& uuid) noexcept;
UUIDKIT_API std::uint64_t node(const Uuid& uuid) noexcept;

} // namespace v1

namespace v3 {

UUIDKIT_API Uuid from(const Uuid& namespace_uuid, std::string_view name);

template <digestible T> Uuid from(const Uuid& namespace_uuid, const T& local)
{
  auto const bytes = Digestible<T>::to_bytes(local);
  return impl::name_based(Algorithm::md5, 3, namespace_uuid, bytes);
}

} // namespace v3

namespace v4 {

// 128 random bits with the version and variant stamped in.
UUIDKIT_API Uuid random();

// Stamps version 4 and the RFC 4122 variant into caller supplied words.
UUIDKIT_API Uuid from(std::uint64_t msb, std::uint64_t lsb) noexcept;

// random() with the top 32 bits of msb replaced by Unix epoch seconds.
UUIDKIT_API Uuid squuid(const GenerationContext& ctx);
UUIDKIT_API Uuid squuid();

} // namespace v4

namespace v5 {

UUIDKIT_API Uuid from(const Uuid& namespace_uuid, std::string_view name);

template <digestible T> Uuid from(const Uuid& namespace_uuid, const T& local)
{
  auto const bytes = Digestible<T>::to_bytes(local);
  return impl::name_based(Algorithm::sha1, 5, namespace_uuid, bytes);
}

} // namespace v5

} // namespace uuidkit

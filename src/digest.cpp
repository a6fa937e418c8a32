// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <uuidkit/digest.hpp>
#include <uuidkit/exception.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <string>

namespace uuidkit {

namespace {

std::string openssl_error()
{
  char buf[256];
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  return buf;
}

const EVP_MD* evp_md(Algorithm algorithm) noexcept
{
  switch (algorithm) {
  case Algorithm::md5:
    return EVP_md5();
  case Algorithm::sha1:
    return EVP_sha1();
  }
  return nullptr;
}

} // namespace

struct Digest::Impl {
  Algorithm algorithm;
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(),
                                                              &EVP_MD_CTX_free};
  bool finalized = false;

  explicit Impl(Algorithm algo)
      : algorithm(algo)
  {
    if (!ctx)
      throw Exception("EVP_MD_CTX_new failed: " + openssl_error());
    if (EVP_DigestInit_ex(ctx.get(), evp_md(algorithm), nullptr) != 1)
      throw Exception("EVP_DigestInit_ex failed: " + openssl_error());
  }

  void check_open() const
  {
    if (finalized)
      throw Exception("Digest has already been finalized");
  }
};

UUIDKIT_API Digest::Digest(Algorithm algorithm)
    : pimpl_(std::make_unique<Impl>(algorithm))
{
}

UUIDKIT_API Digest::Digest(Digest&&) noexcept = default;
UUIDKIT_API Digest& Digest::operator=(Digest&&) noexcept = default;
UUIDKIT_API Digest::~Digest() = default;

UUIDKIT_API Digest& Digest::update(std::span<const std::uint8_t> bytes)
{
  pimpl_->check_open();
  if (EVP_DigestUpdate(pimpl_->ctx.get(), bytes.data(), bytes.size()) != 1)
    throw Exception("EVP_DigestUpdate failed: " + openssl_error());
  return *this;
}

UUIDKIT_API Digest& Digest::update(std::string_view text)
{
  return update(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

UUIDKIT_API std::vector<std::uint8_t> Digest::digest()
{
  pimpl_->check_open();

  std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(pimpl_->ctx.get(), out.data(), &len) != 1)
    throw Exception("EVP_DigestFinal_ex failed: " + openssl_error());

  pimpl_->finalized = true;
  out.resize(len);
  return out;
}

UUIDKIT_API Algorithm Digest::algorithm() const noexcept
{
  return pimpl_->algorithm;
}

UUIDKIT_API std::size_t Digest::size() const noexcept
{
  return static_cast<std::size_t>(EVP_MD_size(evp_md(pimpl_->algorithm)));
}

} // namespace uuidkit

// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace uuidkit {

class Exception : public std::runtime_error
{
public:
  explicit Exception(char const* const msg) noexcept : std::runtime_error(msg)
  {
  }

  explicit Exception(std::string const& msg) noexcept : std::runtime_error(msg)
  {
  }
};

// Thrown when the system randomness source cannot deliver bytes.
// There is no fallback to non-random data.
class EntropyError : public Exception
{
public:
  using Exception::Exception;
};

class ParseException : public Exception
{
  std::error_code code_;

public:
  ParseException(std::error_code code, std::string const& text)
      : Exception("invalid uuid string '" + text + "': " + code.message())
      , code_(code)
  {
  }

  const std::error_code& code() const noexcept { return code_; }
};

} // namespace uuidkit

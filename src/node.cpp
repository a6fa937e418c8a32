// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <uuidkit/bits.hpp>
#include <uuidkit/exception.hpp>
#include <uuidkit/node.hpp>

#include "layout.hpp"
#include "logging.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <fstream>
#include <optional>
#include <span>
#include <string>

#ifdef __linux__
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <sys/socket.h>
#endif

namespace uuidkit {

namespace {

namespace layout = impl::layout;

void random_bytes(std::span<std::uint8_t> out)
{
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    UUIDKIT_LOG_ERROR("RAND_bytes failed: {}", buf);
    throw EntropyError(std::string("RAND_bytes failed: ") + buf);
  }
}

std::uint64_t random_node_id()
{
  std::array<std::uint8_t, 6> bytes;
  random_bytes(bytes);
  return bits::write_byte(bits::mask(1, layout::multicast_bit),
                          layout::multicast_bit, bits::from_bytes(bytes), 1);
}

std::uint16_t random_clock_sequence()
{
  std::array<std::uint8_t, 2> bytes;
  random_bytes(bytes);
  return static_cast<std::uint16_t>(bits::from_bytes(bytes) &
                                    layout::clock_seq_mask);
}

// First non-loopback interface with a 48-bit, non-zero hardware address.
std::optional<std::uint64_t> hardware_address()
{
#ifdef __linux__
  struct ifaddrs* ifaphead = nullptr;
  if (getifaddrs(&ifaphead) == -1) {
    UUIDKIT_LOG_DEBUG("getifaddrs failed, no hardware address available");
    return std::nullopt;
  }

  std::optional<std::uint64_t> result;
  for (auto* ifap = ifaphead; ifap; ifap = ifap->ifa_next) {
    if (!ifap->ifa_addr || ifap->ifa_addr->sa_family != AF_PACKET)
      continue;
    if (ifap->ifa_flags & IFF_LOOPBACK)
      continue;

    auto const* ll = reinterpret_cast<const sockaddr_ll*>(ifap->ifa_addr);
    if (ll->sll_halen != 6)
      continue;

    auto const id = bits::from_bytes(
        std::span<const std::uint8_t>(ll->sll_addr, ll->sll_halen));
    if (id == 0)
      continue;

    UUIDKIT_LOG_INFO("node id taken from interface {}", ifap->ifa_name);
    result = id;
    break;
  }
  freeifaddrs(ifaphead);
  return result;
#else
  return std::nullopt;
#endif
}

std::optional<std::uint16_t>
load_clock_sequence(const std::filesystem::path& path)
{
  std::ifstream is(path);
  if (!is)
    return std::nullopt;

  unsigned long value = 0;
  if (!(is >> value) || value > layout::clock_seq_mask) {
    UUIDKIT_LOG_WARN("ignoring malformed clock sequence file {}",
                     path.string());
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(value);
}

void store_clock_sequence(const std::filesystem::path& path,
                          std::uint16_t clock_sequence)
{
  std::ofstream os(path, std::ios::trunc);
  os << clock_sequence << '\n';
  os.flush();
  if (!os) {
    UUIDKIT_LOG_WARN("could not persist clock sequence to {}", path.string());
  }
}

std::uint16_t clock_sequence_for(const Config& cfg)
{
  if (cfg.clock_sequence)
    return *cfg.clock_sequence;

  if (cfg.clock_sequence_file.empty()) {
    UUIDKIT_LOG_DEBUG("clock sequence drawn at random, not persisted");
    return random_clock_sequence();
  }

  std::uint16_t seq;
  if (auto previous = load_clock_sequence(cfg.clock_sequence_file)) {
    // RFC 4122 4.2.1: a known previous value is incremented
    seq = static_cast<std::uint16_t>((*previous + 1) & layout::clock_seq_mask);
    UUIDKIT_LOG_INFO("clock sequence reloaded from {}: {} -> {}",
                     cfg.clock_sequence_file.string(), *previous, seq);
  } else {
    seq = random_clock_sequence();
    UUIDKIT_LOG_INFO("clock sequence initialized at random: {}", seq);
  }
  store_clock_sequence(cfg.clock_sequence_file, seq);
  return seq;
}

} // namespace

UUIDKIT_API Node::Node(std::uint64_t id, std::uint16_t clock_sequence) noexcept
    : id_(id & layout::node_mask)
    , clock_sequence_(
          static_cast<std::uint16_t>(clock_sequence & layout::clock_seq_mask))
{
}

UUIDKIT_API bool Node::is_multicast() const noexcept
{
  return bits::read_byte(bits::mask(1, layout::multicast_bit),
                         layout::multicast_bit, id_) != 0;
}

UUIDKIT_API Node Node::create(const Config& cfg)
{
  std::optional<std::uint64_t> id = cfg.node_id;
  if (!id && cfg.use_hardware_address)
    id = hardware_address();
  if (!id) {
    id = random_node_id();
    UUIDKIT_LOG_INFO("node id generated at random");
  }

  return Node(*id, clock_sequence_for(cfg));
}

UUIDKIT_API const Node& Node::instance()
{
  static const Node node = Node::create(Config{});
  return node;
}

} // namespace uuidkit

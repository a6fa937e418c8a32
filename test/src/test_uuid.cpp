#include <algorithm>
#include <cstdint>
#include <limits>
#include <random>
#include <sstream>
#include <unordered_set>
#include <vector>

#include <gtest/gtest.h>

#include <uuidkit/exception.hpp>
#include <uuidkit/uuid.hpp>

using namespace uuidkit;
using namespace std::string_view_literals;

TEST(Uuid, NilIsAllZeros) {
  auto const nil = Uuid::nil();
  EXPECT_EQ(nil.msb(), 0u);
  EXPECT_EQ(nil.lsb(), 0u);
  EXPECT_TRUE(nil.is_nil());
  EXPECT_TRUE(nil.is(Uuid::Kind::nil));
  EXPECT_EQ(nil.version(), 0);
  EXPECT_EQ(nil.variant(), Uuid::Variant::ncs);
  EXPECT_EQ(nil.to_string(), "00000000-0000-0000-0000-000000000000");
  EXPECT_EQ(Uuid(), nil);
}

TEST(Uuid, FromWordsKeepsBitsAndDerivesKind) {
  auto const v1 = Uuid::from_words(0x89abcdef45671123, 0x92340123456789ab);
  EXPECT_EQ(v1.msb(), 0x89abcdef45671123u);
  EXPECT_EQ(v1.lsb(), 0x92340123456789abu);
  EXPECT_EQ(v1.kind(), Uuid::Kind::v1);
  EXPECT_EQ(v1.version(), 1);

  EXPECT_EQ(Uuid::from_words(0x0000000000002000, 1).kind(), Uuid::Kind::v2);
  EXPECT_EQ(Uuid::from_words(0x0000000000003000, 1).kind(), Uuid::Kind::v3);
  EXPECT_EQ(Uuid::from_words(0x0000000000004000, 1).kind(), Uuid::Kind::v4);
  EXPECT_EQ(Uuid::from_words(0x0000000000005000, 1).kind(), Uuid::Kind::v5);

  auto const unknown = Uuid::from_words(0x000000000000F000, 1);
  EXPECT_EQ(unknown.kind(), Uuid::Kind::unknown);
  EXPECT_EQ(unknown.version(), 0xF);
  EXPECT_FALSE(unknown.is(Uuid::Kind::v4));

  // version 0 but not nil
  EXPECT_EQ(Uuid::from_words(0, 1).kind(), Uuid::Kind::unknown);
}

TEST(Uuid, Variant) {
  auto with_top = [](std::uint64_t top3) {
    return Uuid::from_words(0, top3 << 61).variant();
  };
  EXPECT_EQ(with_top(0b000), Uuid::Variant::ncs);
  EXPECT_EQ(with_top(0b011), Uuid::Variant::ncs);
  EXPECT_EQ(with_top(0b100), Uuid::Variant::rfc4122);
  EXPECT_EQ(with_top(0b101), Uuid::Variant::rfc4122);
  EXPECT_EQ(with_top(0b110), Uuid::Variant::microsoft);
  EXPECT_EQ(with_top(0b111), Uuid::Variant::future);
}

TEST(Uuid, CompareIsUnsigned) {
  auto const high = Uuid::from_words(0xFFFFFFFFFFFFFFFF, 0);
  auto const low = Uuid::from_words(0x0000000000000001, 0);
  EXPECT_EQ(compare(high, low), std::strong_ordering::greater);
  EXPECT_EQ(compare(low, high), std::strong_ordering::less);
  EXPECT_GT(high, low);

  // msb decides before lsb
  EXPECT_LT(Uuid::from_words(0, std::numeric_limits<std::uint64_t>::max()),
            Uuid::from_words(1, 0));

  // lsb compared unsigned as well
  EXPECT_LT(Uuid::from_words(7, 0x7FFFFFFFFFFFFFFF),
            Uuid::from_words(7, 0x8000000000000000));

  auto const a = Uuid::from_words(0x8000000000000000, 42);
  EXPECT_EQ(compare(a, a), std::strong_ordering::equal);
  EXPECT_EQ(a, Uuid::from_words(0x8000000000000000, 42));
}

TEST(Uuid, CompareIsATotalOrder) {
  std::mt19937_64 rng(12345);
  std::vector<Uuid> values;
  for (int i = 0; i < 200; ++i)
    values.push_back(Uuid::from_words(rng(), rng()));
  // a few values sharing msb to exercise the lsb path
  for (int i = 0; i < 20; ++i)
    values.push_back(Uuid::from_words(values[0].msb(), rng()));

  std::sort(values.begin(), values.end(),
            [](const Uuid& a, const Uuid& b) { return compare(a, b) < 0; });

  for (std::size_t i = 1; i < values.size(); ++i) {
    auto const& prev = values[i - 1];
    auto const& cur = values[i];
    // same order as the unsigned 128-bit integer
    bool const ordered = prev.msb() < cur.msb() ||
                         (prev.msb() == cur.msb() && prev.lsb() <= cur.lsb());
    EXPECT_TRUE(ordered);
    EXPECT_NE(compare(prev, cur), std::strong_ordering::greater);
    EXPECT_NE(compare(cur, prev), std::strong_ordering::less);
  }
}

TEST(Uuid, ToStringIsLowerCaseCanonical) {
  auto const uuid = Uuid::from_words(0x6BA7B8109DAD11D1, 0x80B400C04FD430C8);
  EXPECT_EQ(uuid.to_string(), "6ba7b810-9dad-11d1-80b4-00c04fd430c8");

  std::ostringstream os;
  os << uuid;
  EXPECT_EQ(os.str(), uuid.to_string());
}

TEST(Uuid, ParseRoundTrip) {
  std::mt19937_64 rng(42);
  for (int i = 0; i < 100; ++i) {
    auto const uuid = Uuid::from_words(rng(), rng());
    auto const parsed = Uuid::parse(uuid.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, uuid);
    EXPECT_EQ(parsed->kind(), uuid.kind());
  }

  auto const upper = Uuid::parse("6BA7B810-9DAD-11D1-80B4-00C04FD430C8");
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(upper->msb(), 0x6ba7b8109dad11d1u);
  EXPECT_EQ(upper->lsb(), 0x80b400c04fd430c8u);
}

TEST(Uuid, ParseErrors) {
  std::error_code ec;

  EXPECT_FALSE(Uuid::parse("", ec).has_value());
  EXPECT_EQ(ec, ParseError::wrong_length);

  EXPECT_FALSE(Uuid::parse("6ba7b8109dad11d180b400c04fd430c8", ec).has_value());
  EXPECT_EQ(ec, ParseError::wrong_length);

  EXPECT_FALSE(Uuid::parse("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}", ec).has_value());
  EXPECT_EQ(ec, ParseError::wrong_length);

  EXPECT_FALSE(Uuid::parse("6ba7b810-9dad-11d1-80b4+00c04fd430c8", ec).has_value());
  EXPECT_EQ(ec, ParseError::missing_hyphen);

  EXPECT_FALSE(Uuid::parse("6ba7b8109-dad-11d1-80b4-00c04fd430c8", ec).has_value());
  EXPECT_EQ(ec, ParseError::missing_hyphen);

  EXPECT_FALSE(Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430cg", ec).has_value());
  EXPECT_EQ(ec, ParseError::invalid_hex_digit);

  EXPECT_FALSE(Uuid::parse("zba7b810-9dad-11d1-80b4-00c04fd430c8", ec).has_value());
  EXPECT_EQ(ec, ParseError::invalid_hex_digit);
  EXPECT_EQ(ec.category().name(), "uuidkit.parse"sv);
  EXPECT_FALSE(ec.message().empty());

  EXPECT_TRUE(Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8", ec).has_value());
  EXPECT_FALSE(ec);
}

TEST(Uuid, FromStringThrows) {
  EXPECT_NO_THROW(Uuid::from_string("00000000-0000-0000-0000-000000000000"));
  try {
    Uuid::from_string("not-a-uuid");
    FAIL() << "Expected ParseException";
  } catch (const ParseException& ex) {
    EXPECT_EQ(ex.code(), ParseError::wrong_length);
  }
  EXPECT_THROW(Uuid::from_string("6ba7b810-9dad-11d1-80b4-00c04fd430cx"), Exception);
}

TEST(Uuid, Bytes) {
  Uuid::bytes_type bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                         0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
  auto const uuid = Uuid::from_bytes(bytes);
  EXPECT_EQ(uuid.msb(), 0x6ba7b8109dad11d1u);
  EXPECT_EQ(uuid.lsb(), 0x80b400c04fd430c8u);
  EXPECT_EQ(uuid.to_bytes(), bytes);
}

TEST(Uuid, HashFollowsEquality) {
  std::hash<Uuid> h;
  auto const a = Uuid::from_words(1, 2);
  EXPECT_EQ(h(a), h(Uuid::from_words(1, 2)));

  std::unordered_set<Uuid> set{a, Uuid::from_words(2, 1), Uuid::from_words(1, 2)};
  EXPECT_EQ(set.size(), 2u);
}

TEST(Uuid, EnumNames) {
  EXPECT_EQ(to_string(Uuid::Variant::rfc4122), "rfc4122");
  EXPECT_EQ(to_string(Uuid::Kind::v5), "v5");
  EXPECT_EQ(to_string(Uuid::Kind::unknown), "unknown");
}

#include <cstdint>
#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include <uuidkit/uuidkit.hpp>

using namespace uuidkit;

namespace {

class FixedClock : public Clock
{
public:
  std::uint64_t monotonic() override { return ++value; }
  std::uint64_t value = 0x1000;
};

class FixedPosixClock : public PosixClock
{
public:
  std::uint32_t seconds() override { return 1234567890; }
};

} // namespace

TEST(ContextBuilder, Defaults) {
  ContextBuilder builder;
  EXPECT_FALSE(builder.config().log_level);
  EXPECT_FALSE(builder.config().node_id);
  EXPECT_FALSE(builder.config().clock_sequence);
  EXPECT_TRUE(builder.config().use_hardware_address);
  EXPECT_TRUE(builder.config().clock_sequence_file.empty());

  auto const ctx = builder.build();
  EXPECT_LT(ctx.node().id(), std::uint64_t{1} << 48);
  EXPECT_EQ(&ctx.clock(), SystemClock::instance().get());
  EXPECT_EQ(&ctx.posix(), SystemPosixClock::instance().get());
}

TEST(ContextBuilder, FixedNode) {
  auto const ctx = ContextBuilder()
                     .with_node_id(0xA1B2C3D4E5F6)
                     .with_clock_sequence(0x0ABC)
                     .build();
  EXPECT_EQ(ctx.node().id(), 0xA1B2C3D4E5F6u);
  EXPECT_EQ(ctx.node().clock_sequence(), 0x0ABC);

  auto const uuid = v1::next(ctx);
  EXPECT_EQ(v1::node(uuid), 0xA1B2C3D4E5F6u);
  EXPECT_EQ(v1::clock_sequence(uuid), 0x0ABC);
}

TEST(ContextBuilder, RandomNode) {
  ContextBuilder builder;
  builder.with_node_id(42).with_random_node();
  EXPECT_FALSE(builder.config().node_id);
  EXPECT_FALSE(builder.config().use_hardware_address);
  EXPECT_TRUE(builder.build().node().is_multicast());
}

TEST(ContextBuilder, CustomClocks) {
  auto clock = std::make_shared<FixedClock>();
  auto const ctx = ContextBuilder()
                     .with_node_id(1)
                     .with_clock(clock)
                     .with_posix_clock(std::make_shared<FixedPosixClock>())
                     .build();

  EXPECT_EQ(v1::timestamp(v1::next(ctx)), 0x1001u);
  EXPECT_EQ(v1::timestamp(v1::next(ctx)), 0x1002u);
  EXPECT_EQ(clock->value, 0x1002u);
  EXPECT_EQ(v4::squuid(ctx).msb() >> 32, 1234567890u);
}

TEST(ContextBuilder, AppliesLogLevel) {
  auto const previous = log_level();
  ContextBuilder().set_log_level(LogLevel::error).with_node_id(1).build();
  EXPECT_EQ(log_level(), LogLevel::error);
  set_log_level(previous);
}

TEST(ContextBuilder, KeepsProcessLogLevel) {
  auto const previous = log_level();
  set_log_level(LogLevel::critical);
  ContextBuilder().with_node_id(1).build();
  EXPECT_EQ(log_level(), LogLevel::critical);

  Config cfg;
  cfg.node_id = 2;
  ContextBuilder{cfg}.build();
  EXPECT_EQ(log_level(), LogLevel::critical);
  set_log_level(previous);
}

TEST(ContextBuilder, FromConfig) {
  Config cfg;
  cfg.node_id = 7;
  cfg.clock_sequence = 9;
  ContextBuilder builder(cfg);
  auto const ctx = builder.build();
  EXPECT_EQ(ctx.node().id(), 7u);
  EXPECT_EQ(ctx.node().clock_sequence(), 9);
}

TEST(ContextBuilder, ClockSequenceFile) {
  auto const path = std::filesystem::temp_directory_path() / "uuidkit_context_clock_seq";
  std::filesystem::remove(path);

  ContextBuilder builder;
  builder.with_node_id(1).with_clock_sequence_file(path);
  EXPECT_EQ(builder.config().clock_sequence_file, path);

  auto const first = builder.build();
  auto const second = builder.build();
  EXPECT_EQ(second.node().clock_sequence(), (first.node().clock_sequence() + 1) & 0x3FFF);

  std::filesystem::remove(path);
}

TEST(LogLevel, FromString) {
  EXPECT_EQ(log_level_from_string("debug"), LogLevel::debug);
  EXPECT_EQ(log_level_from_string("off"), LogLevel::off);
  EXPECT_FALSE(log_level_from_string("loud"));
}

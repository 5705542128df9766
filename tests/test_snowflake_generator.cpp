#include "flakeid/core/clock.h"
#include "flakeid/core/id_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstdint>
#include <vector>

#include "support/base62_decode.h"

using namespace flakeid::core;
using flakeid::testing::machine_field;
using flakeid::testing::sequence_field;
using flakeid::testing::timestamp_field;

namespace {

constexpr std::int64_t kT0 = layout::kEpochMillis + 1'000'000;

// Returns `base` for the first `stall_reads` reads, then base + 1 forever.
// Counts every read so tests can observe the overflow wait.
class StallingClock final : public IClock {
 public:
  StallingClock(std::int64_t base, std::int64_t stall_reads)
      : base_(base), stall_reads_(stall_reads) {}

  std::int64_t now_unix_millis() override {
    const auto n = reads_.fetch_add(1) + 1;
    return n <= stall_reads_ ? base_ : base_ + 1;
  }

  [[nodiscard]] std::int64_t reads() const { return reads_.load(); }

 private:
  std::int64_t base_;
  std::int64_t stall_reads_;
  std::atomic<std::int64_t> reads_{0};
};

std::shared_ptr<SnowflakeGenerator> make_generator(int machine_id, IClock& clock) {
  auto result = SnowflakeGenerator::create(machine_id, clock);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

// ── Construction ────────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator::create: machine id bounds", "[snowflake][construction]") {
  FixedClock clock(kT0);

  SECTION("0 and 1023 are accepted") {
    CHECK(SnowflakeGenerator::create(0, clock).has_value());
    CHECK(SnowflakeGenerator::create(1023, clock).has_value());
  }

  SECTION("1024 and -1 are rejected with kInvalidMachineId") {
    const auto too_high = SnowflakeGenerator::create(1024, clock);
    REQUIRE_FALSE(too_high.has_value());
    CHECK(too_high.error() == IdError::kInvalidMachineId);

    const auto negative = SnowflakeGenerator::create(-1, clock);
    REQUIRE_FALSE(negative.has_value());
    CHECK(negative.error() == IdError::kInvalidMachineId);
  }

  SECTION("machine_id() reports the constructed value") {
    CHECK(make_generator(517, clock)->machine_id() == 517);
  }
}

// ── Layout ──────────────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator: bit layout", "[snowflake][layout]") {
  FixedClock clock(kT0);
  auto gen = make_generator(1023, clock);

  const auto id = gen->next_id();
  REQUIRE(id.has_value());
  CHECK(id.value() == ((kT0 - layout::kEpochMillis) << 22 | (1023LL << 12) | 0));
  CHECK(timestamp_field(id.value()) == kT0 - layout::kEpochMillis);
  CHECK(machine_field(id.value()) == 1023);
  CHECK(sequence_field(id.value()) == 0);
}

TEST_CASE("SnowflakeGenerator: first id at the epoch with machine 0 is zero", "[snowflake][layout]") {
  FixedClock clock(layout::kEpochMillis);
  auto gen = make_generator(0, clock);

  const auto id = gen->next_id();
  REQUIRE(id.has_value());
  CHECK(id.value() == 0);
}

TEST_CASE("SnowflakeGenerator: largest representable timestamp stays non-negative",
          "[snowflake][layout]") {
  FixedClock clock(layout::kEpochMillis + layout::kMaxTimestampDelta);
  auto gen = make_generator(1023, clock);

  const auto id = gen->next_id();
  REQUIRE(id.has_value());
  CHECK(id.value() > 0);
  CHECK(timestamp_field(id.value()) == layout::kMaxTimestampDelta);
}

// ── Sequencing ──────────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator: same millisecond increments the sequence only",
          "[snowflake][sequence]") {
  FixedClock clock(kT0);
  auto gen = make_generator(7, clock);

  const auto a = gen->next_id();
  const auto b = gen->next_id();
  const auto c = gen->next_id();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());

  CHECK(b.value() == a.value() + 1);
  CHECK(c.value() == b.value() + 1);
  CHECK(sequence_field(c.value()) == 2);
  CHECK(timestamp_field(a.value()) == timestamp_field(c.value()));
}

TEST_CASE("SnowflakeGenerator: a new millisecond resets the sequence", "[snowflake][sequence]") {
  FixedClock clock(kT0);
  auto gen = make_generator(7, clock);

  REQUIRE(gen->next_id().has_value());
  REQUIRE(gen->next_id().has_value());

  clock.advance(1);
  const auto id = gen->next_id();
  REQUIRE(id.has_value());
  CHECK(sequence_field(id.value()) == 0);
  CHECK(timestamp_field(id.value()) == kT0 + 1 - layout::kEpochMillis);
}

TEST_CASE("SnowflakeGenerator: sequential ids strictly increase with a forward clock",
          "[snowflake][sequence]") {
  FixedClock clock(kT0);
  auto gen = make_generator(42, clock);

  std::int64_t previous = -1;
  for (int i = 0; i < 20'000; ++i) {
    if (i % 1000 == 0) {
      clock.advance(1);
    }
    const auto id = gen->next_id();
    REQUIRE(id.has_value());
    CHECK(id.value() > previous);
    previous = id.value();
  }
}

TEST_CASE("SnowflakeGenerator: different machine numbers never collide in the same tick",
          "[snowflake][sequence]") {
  FixedClock clock(kT0);
  auto gen_a = make_generator(1, clock);
  auto gen_b = make_generator(2, clock);

  const auto a = gen_a->next_id();
  const auto b = gen_b->next_id();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(sequence_field(a.value()) == sequence_field(b.value()));
  CHECK(a.value() != b.value());
}

// ── Overflow ────────────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator: 4097th id in one millisecond waits for the next tick",
          "[snowflake][overflow]") {
  // 4097 reads serve the first 4097 calls; 5 further reads keep the wait spinning.
  constexpr std::int64_t kNormalReads = 4097;
  constexpr std::int64_t kSpinReads = 5;
  StallingClock clock(kT0, kNormalReads + kSpinReads);
  auto gen = make_generator(3, clock);

  std::vector<std::int64_t> ids;
  for (int i = 0; i < 4096; ++i) {
    const auto id = gen->next_id();
    REQUIRE(id.has_value());
    ids.push_back(id.value());
  }
  CHECK(sequence_field(ids.front()) == 0);
  CHECK(sequence_field(ids.back()) == 4095);
  CHECK(timestamp_field(ids.front()) == timestamp_field(ids.back()));

  const auto overflow = gen->next_id();
  REQUIRE(overflow.has_value());

  // The generator kept reading the clock until it moved on.
  CHECK(clock.reads() == kNormalReads + kSpinReads + 1);
  CHECK(timestamp_field(overflow.value()) == timestamp_field(ids.back()) + 1);
  CHECK(sequence_field(overflow.value()) == 0);
  CHECK(overflow.value() > ids.back());

  // The advanced tick continues normally.
  const auto next = gen->next_id();
  REQUIRE(next.has_value());
  CHECK(sequence_field(next.value()) == 1);
}

// ── Clock regression ────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator: clock regression fails the call and leaves state intact",
          "[snowflake][clock]") {
  FixedClock clock(kT0);
  auto gen = make_generator(9, clock);

  const auto first = gen->next_id();
  REQUIRE(first.has_value());

  clock.set(kT0 - 5);
  const auto regressed = gen->next_id();
  REQUIRE_FALSE(regressed.has_value());
  CHECK(regressed.error() == IdError::kClockRegression);

  SECTION("recovering to the previous maximum continues the sequence") {
    clock.set(kT0);
    const auto recovered = gen->next_id();
    REQUIRE(recovered.has_value());
    CHECK(recovered.value() == first.value() + 1);
  }

  SECTION("moving past the previous maximum starts a fresh tick") {
    clock.set(kT0 + 1);
    const auto recovered = gen->next_id();
    REQUIRE(recovered.has_value());
    CHECK(sequence_field(recovered.value()) == 0);
    CHECK(recovered.value() > first.value());
  }
}

// ── Timestamp range ─────────────────────────────────────────────────────────

TEST_CASE("SnowflakeGenerator: readings outside the 41-bit window are rejected",
          "[snowflake][clock]") {
  SECTION("before the epoch") {
    FixedClock clock(layout::kEpochMillis - 1);
    auto gen = make_generator(0, clock);
    const auto id = gen->next_id();
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error() == IdError::kTimestampOutOfRange);
  }

  SECTION("past the 41-bit horizon") {
    FixedClock clock(layout::kEpochMillis + layout::kMaxTimestampDelta + 1);
    auto gen = make_generator(0, clock);
    const auto id = gen->next_id();
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error() == IdError::kTimestampOutOfRange);
  }

  SECTION("a rejected reading does not poison later calls") {
    FixedClock clock(layout::kEpochMillis - 1);
    auto gen = make_generator(0, clock);
    REQUIRE_FALSE(gen->next_id().has_value());

    clock.set(kT0);
    CHECK(gen->next_id().has_value());
  }
}

TEST_CASE("to_string(IdError): every error has a description", "[snowflake][errors]") {
  CHECK_FALSE(to_string(IdError::kInvalidMachineId).empty());
  CHECK_FALSE(to_string(IdError::kClockRegression).empty());
  CHECK_FALSE(to_string(IdError::kTimestampOutOfRange).empty());
}

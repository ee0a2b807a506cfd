#include <chrono>
#include <cmath>
#include <limits>
#include <ratio>
#include <unordered_set>

#include <gtest/gtest.h>
#include <unixts.hpp>

using namespace unixts;

// Test fixture for Duration tests
class DurationTest : public ::testing::Test {
protected:
    static constexpr uint32_t NANOS_PER_SEC = Duration::NANOSECONDS_PER_SECOND;
    static constexpr uint64_t uint64_max = std::numeric_limits<uint64_t>::max();
};

// ==============================================================================
// Construction and Named Constants
// ==============================================================================

TEST_F(DurationTest, DefaultConstruction) {
    Duration d;
    EXPECT_EQ(d.seconds(), 0U);
    EXPECT_EQ(d.subsec_nanos(), 0U);
    EXPECT_TRUE(d.is_zero());
}

TEST_F(DurationTest, Zero) {
    EXPECT_EQ(Duration::zero(), Duration());
    EXPECT_TRUE(Duration::zero().is_zero());
    EXPECT_FALSE(saturated(Duration::zero()));
}

TEST_F(DurationTest, Max) {
    auto d = Duration::max();
    EXPECT_EQ(d.seconds(), uint64_max);
    EXPECT_EQ(d.subsec_nanos(), Duration::MAX_NANOSECONDS);
    EXPECT_TRUE(saturated(d));
}

TEST_F(DurationTest, ComponentConstructionCarries) {
    Duration d(2, 2'500'000'000ULL);
    EXPECT_EQ(d.seconds(), 4U);
    EXPECT_EQ(d.subsec_nanos(), 500'000'000U);
}

TEST_F(DurationTest, ComponentConstructionSaturates) {
    EXPECT_EQ(Duration(uint64_max, NANOS_PER_SEC), Duration::max());
}

// ==============================================================================
// Direct Factories
// ==============================================================================

TEST_F(DurationTest, FromSeconds) {
    auto d = Duration::from_seconds(86400);
    EXPECT_EQ(d.seconds(), 86400U);
    EXPECT_EQ(d.subsec_nanos(), 0U);
}

TEST_F(DurationTest, FromMilliseconds) {
    auto d = Duration::from_milliseconds(1750);
    EXPECT_EQ(d.seconds(), 1U);
    EXPECT_EQ(d.subsec_nanos(), 750'000'000U);
}

TEST_F(DurationTest, FromMicroseconds) {
    auto d = Duration::from_microseconds(2'000'001);
    EXPECT_EQ(d.seconds(), 2U);
    EXPECT_EQ(d.subsec_nanos(), 1'000U);
}

TEST_F(DurationTest, FromNanoseconds) {
    auto d = Duration::from_nanoseconds(3'000'000'007ULL);
    EXPECT_EQ(d.seconds(), 3U);
    EXPECT_EQ(d.subsec_nanos(), 7U);
}

TEST_F(DurationTest, FromMillisecondsLargeValue) {
    auto d = Duration::from_milliseconds(uint64_max);
    EXPECT_EQ(d.seconds(), uint64_max / 1'000);
    EXPECT_EQ(d.subsec_nanos(), (uint64_max % 1'000) * 1'000'000U);
}

// ==============================================================================
// Checked Factories
// ==============================================================================

TEST_F(DurationTest, TryFromSeconds) {
    auto d = Duration::try_from_seconds(1.5);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->seconds(), 1U);
    EXPECT_EQ(d->subsec_nanos(), 500'000'000U);
}

TEST_F(DurationTest, TryFromSecondsRoundsToNearestNanosecond) {
    auto d = Duration::try_from_seconds(0.1);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->seconds(), 0U);
    EXPECT_EQ(d->subsec_nanos(), 100'000'000U);
}

TEST_F(DurationTest, TryFromSecondsRejectsNegative) {
    EXPECT_FALSE(Duration::try_from_seconds(-0.5).has_value());
}

TEST_F(DurationTest, TryFromSecondsRejectsNonFinite) {
    EXPECT_FALSE(Duration::try_from_seconds(std::nan("")).has_value());
    EXPECT_FALSE(Duration::try_from_seconds(std::numeric_limits<double>::infinity()).has_value());
}

TEST_F(DurationTest, TryFromSecondsRejectsHuge) {
    EXPECT_FALSE(Duration::try_from_seconds(1e20).has_value());
}

TEST_F(DurationTest, FromChrono) {
    auto d = Duration::from_chrono(std::chrono::milliseconds(2500));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Duration(2, 500'000'000));
}

TEST_F(DurationTest, FromChronoRejectsNegative) {
    EXPECT_FALSE(Duration::from_chrono(std::chrono::nanoseconds(-1)).has_value());
    EXPECT_FALSE(Duration::from_chrono(std::chrono::hours(-1)).has_value());
}

TEST_F(DurationTest, FromChronoBeyondNanosecondRange) {
    auto d = Duration::from_chrono(std::chrono::hours(24 * 365 * 300));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Duration::from_seconds(9'460'800'000));

    auto longest = Duration::from_chrono(std::chrono::seconds(std::numeric_limits<int64_t>::max()));
    ASSERT_TRUE(longest.has_value());
    EXPECT_EQ(longest->seconds(), static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
    EXPECT_EQ(longest->subsec_nanos(), 0U);
}

TEST_F(DurationTest, FromChronoSaturates) {
    auto d = Duration::from_chrono(std::chrono::hours(std::numeric_limits<int64_t>::max()));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Duration::max());
    EXPECT_TRUE(saturated(*d));
}

TEST_F(DurationTest, FromChronoFractionalPeriod) {
    // One third of a second truncates to whole nanoseconds
    auto d = Duration::from_chrono(std::chrono::duration<int64_t, std::ratio<1, 3>>(4));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, Duration(1, 333'333'333));
}

// ==============================================================================
// Conversions and Accessors
// ==============================================================================

TEST_F(DurationTest, ToChrono) {
    EXPECT_EQ(Duration(1, 500).to_chrono(), std::chrono::nanoseconds(1'000'000'500));
}

TEST_F(DurationTest, ToChronoSaturates) {
    EXPECT_EQ(Duration::max().to_chrono(), std::chrono::nanoseconds::max());
}

TEST_F(DurationTest, ToSeconds) {
    EXPECT_DOUBLE_EQ(Duration(2, 250'000'000).to_seconds(), 2.25);
}

TEST_F(DurationTest, Subsec) {
    Duration d(0, 123'456'789);
    EXPECT_EQ(d.subsec(0), 0U);
    EXPECT_EQ(d.subsec(3), 123U);
    EXPECT_EQ(d.subsec(6), 123'456U);
    EXPECT_EQ(d.subsec(9), 123'456'789U);
    EXPECT_EQ(d.subsec(15), 123'456'789U);
}

// ==============================================================================
// Arithmetic
// ==============================================================================

TEST_F(DurationTest, Addition) {
    auto d = Duration(1, 600'000'000) + Duration(2, 700'000'000);
    EXPECT_EQ(d, Duration(4, 300'000'000));
}

TEST_F(DurationTest, AdditionSaturates) {
    auto d = Duration::max() + Duration(0, 1);
    EXPECT_EQ(d, Duration::max());
    EXPECT_TRUE(saturated(d));
}

TEST_F(DurationTest, Subtraction) {
    auto d = Duration(3, 100'000'000) - Duration(1, 200'000'000);
    EXPECT_EQ(d, Duration(1, 900'000'000));
}

TEST_F(DurationTest, SubtractionSaturatesToZero) {
    auto d = Duration(1, 0) - Duration(1, 1);
    EXPECT_TRUE(d.is_zero());
}

TEST_F(DurationTest, CompoundAssignment) {
    Duration d(5, 0);
    d += Duration::from_milliseconds(500);
    EXPECT_EQ(d, Duration(5, 500'000'000));
    d -= Duration::from_seconds(5);
    EXPECT_EQ(d, Duration(0, 500'000'000));
}

// ==============================================================================
// Comparison and Hashing
// ==============================================================================

TEST_F(DurationTest, Ordering) {
    EXPECT_LT(Duration(1, 999'999'999), Duration(2, 0));
    EXPECT_GT(Duration(2, 1), Duration(2, 0));
    EXPECT_EQ(Duration(1, NANOS_PER_SEC), Duration(2, 0));
}

TEST_F(DurationTest, HashMatchesEquality) {
    std::unordered_set<Duration> set;
    set.insert(Duration(1, NANOS_PER_SEC));
    set.insert(Duration(2, 0));
    set.insert(Duration::from_milliseconds(2001));
    EXPECT_EQ(set.size(), 2U);
}

static_assert(Duration(0, 1'500'000'000) == Duration(1, 500'000'000));
static_assert(Duration(1, 0) - Duration(2, 0) == Duration::zero());

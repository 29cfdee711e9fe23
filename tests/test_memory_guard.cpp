#include <gtest/gtest.h>
#include "palmtree/core/Config.hpp"
#include "palmtree/core/MemoryGuard.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>

using namespace palmtree;
using namespace palmtree::core;

class MemoryGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        MemoryGuard::instance().reset_for_testing();
        set_memory_check_enabled(true);
    }

    void TearDown() override {
        MemoryGuard::instance().reset_for_testing();
        set_memory_check_enabled(true);
    }
};

TEST_F(MemoryGuardTest, SingletonInstance) {
    MemoryGuard& guard1 = MemoryGuard::instance();
    MemoryGuard& guard2 = MemoryGuard::instance();
    EXPECT_EQ(&guard1, &guard2);
}

TEST_F(MemoryGuardTest, SystemStatsArePlausible) {
    MemoryGuard& guard = MemoryGuard::instance();
    EXPECT_GT(guard.get_total_system_ram(), 0u);
    EXPECT_GT(guard.get_available_system_ram(), 0u);
    EXPECT_LE(guard.get_available_system_ram(), guard.get_total_system_ram());
}

TEST_F(MemoryGuardTest, CanFitRespectsSafetyMargin) {
    MemoryGuard& guard = MemoryGuard::instance();
    guard.set_available_ram_override_for_testing(1000);

    guard.set_safety_margin(0);
    EXPECT_TRUE(guard.can_fit_in_ram(999));
    EXPECT_FALSE(guard.can_fit_in_ram(1000));

    guard.set_safety_margin(500);
    EXPECT_EQ(guard.get_safety_margin(), 500u);
    EXPECT_TRUE(guard.can_fit_in_ram(499));
    EXPECT_FALSE(guard.can_fit_in_ram(500));

    // size + margin would wrap around.
    EXPECT_FALSE(guard.can_fit_in_ram((std::numeric_limits<uint64_t>::max)()));
}

TEST_F(MemoryGuardTest, OverrideOfZeroIsRepresentable) {
    MemoryGuard& guard = MemoryGuard::instance();
    guard.set_available_ram_override_for_testing(0);
    EXPECT_EQ(guard.get_available_system_ram(), 0u);
    guard.set_available_ram_override_for_testing(std::nullopt);
    EXPECT_GT(guard.get_available_system_ram(), 0u);
}

TEST_F(MemoryGuardTest, AllocateFillsMatrix) {
    MemoryGuard& guard = MemoryGuard::instance();
    guard.set_safety_margin(0);

    auto result = guard.allocate<double>(4, 3, std::numeric_limits<double>::quiet_NaN());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.matrix->rows(), 4u);
    EXPECT_EQ(result.matrix->cols(), 3u);
    EXPECT_EQ(result.matrix->size_in_bytes(), 96u);
    EXPECT_EQ(result.matrix->get_data_type(), DataType::FLOAT64);
    EXPECT_TRUE(std::isnan(result.matrix->get(3, 2)));
}

TEST_F(MemoryGuardTest, RefusedAllocationReportsWithoutThrowing) {
    MemoryGuard& guard = MemoryGuard::instance();
    guard.set_safety_margin(0);
    guard.set_available_ram_override_for_testing(64);

    AllocationResult<double> result;
    EXPECT_NO_THROW(result = guard.allocate<double>(10, 10, 0.0));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failure.bytes_requested, 800u);
    EXPECT_EQ(result.failure.bytes_available, 64u);
}

TEST_F(MemoryGuardTest, OverflowingShapeIsRefused) {
    MemoryGuard& guard = MemoryGuard::instance();
    const uint64_t huge = (std::numeric_limits<uint64_t>::max)() / 2;

    auto result = guard.allocate<double>(huge, 4, 0.0);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failure.bytes_requested, (std::numeric_limits<uint64_t>::max)());
}

TEST_F(MemoryGuardTest, DisabledCheckSkipsPreflight) {
    MemoryGuard& guard = MemoryGuard::instance();
    guard.set_available_ram_override_for_testing(0);

    set_memory_check_enabled(false);
    auto result = guard.allocate<int32_t>(2, 2, 7);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.matrix->get(1, 1), 7);
    EXPECT_EQ(result.matrix->get_data_type(), DataType::INT32);
}

TEST_F(MemoryGuardTest, EmptyShapeAlwaysFits) {
    MemoryGuard& guard = MemoryGuard::instance();
    guard.set_safety_margin(0);
    guard.set_available_ram_override_for_testing(1);

    auto result = guard.allocate<double>(0, 5, 0.0);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.matrix->size(), 0u);
}

TEST(ConfigTest, ParsesLogLevels) {
    EXPECT_EQ(parse_log_level("silent").value(), LogLevel::SILENT);
    EXPECT_EQ(parse_log_level("ERROR").value(), LogLevel::ERRORS);
    EXPECT_EQ(parse_log_level("Warnings").value(), LogLevel::WARNINGS);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(ConfigTest, LogLevelRoundTrips) {
    const LogLevel before = get_log_level();
    set_log_level(LogLevel::SILENT);
    EXPECT_EQ(get_log_level(), LogLevel::SILENT);
    set_log_level(before);
}

#ifndef _WIN32
TEST(ConfigTest, SafetyMarginFromEnvironment) {
    ::setenv("PALMTREE_MEMORY_SAFETY_MARGIN_MB", "256", 1);
    EXPECT_EQ(get_default_safety_margin(), 256ull * 1024 * 1024);

    // Values past the byte range saturate instead of wrapping.
    ::setenv("PALMTREE_MEMORY_SAFETY_MARGIN_MB", "17592186044416", 1);
    EXPECT_EQ(get_default_safety_margin(), (std::numeric_limits<uint64_t>::max)());

    ::setenv("PALMTREE_MEMORY_SAFETY_MARGIN_MB", "lots", 1);
    EXPECT_EQ(get_default_safety_margin(), 0u);

    ::unsetenv("PALMTREE_MEMORY_SAFETY_MARGIN_MB");
    EXPECT_EQ(get_default_safety_margin(), 0u);
}
#endif

/**
 * @file RetryScheduleTest.cpp
 * @brief Unit tests for RetrySchedule, ProjectionFailure and health thresholds
 */

#include <gtest/gtest.h>
#include "domain/ProjectionFailure.hpp"
#include "domain/RetrySchedule.hpp"
#include "domain/enums/HealthStatus.hpp"

using namespace chronicle::domain;

// ============================================================================
// RETRY SCHEDULE
// ============================================================================

TEST(RetryScheduleTest, DelayFollowsSchedule) {
    RetrySchedule schedule({1, 2, 4, 8, 16}, 5);

    EXPECT_EQ(schedule.delayFor(0).count(), 1);
    EXPECT_EQ(schedule.delayFor(1).count(), 2);
    EXPECT_EQ(schedule.delayFor(4).count(), 16);
}

TEST(RetryScheduleTest, LastDelayRepeats) {
    RetrySchedule schedule({1, 2}, 10);

    EXPECT_EQ(schedule.delayFor(7).count(), 2);
}

TEST(RetryScheduleTest, NoDelayAfterMaxRetries) {
    RetrySchedule schedule({1, 2, 4, 8, 16}, 5);

    EXPECT_TRUE(schedule.nextDelay(4).has_value());
    EXPECT_FALSE(schedule.nextDelay(5).has_value());
    EXPECT_FALSE(schedule.nextDelay(6).has_value());
}

TEST(RetryScheduleTest, EmptyScheduleFallsBackToOneSecond) {
    RetrySchedule schedule({}, 3);

    EXPECT_EQ(schedule.delayFor(0).count(), 1);
}

// ============================================================================
// DUE FOR RETRY
// ============================================================================

class ProjectionFailureTest : public ::testing::Test {
protected:
    Timestamp now = Timestamp::fromUnixMillis(1767225600000);

    ProjectionFailure failure(std::optional<Timestamp> nextRetryAt) {
        ProjectionFailure f;
        f.id = "f-1";
        f.eventId = "e-1";
        f.projectionName = "document_views";
        f.retryCount = 1;
        f.maxRetries = 5;
        f.nextRetryAt = nextRetryAt;
        return f;
    }
};

TEST_F(ProjectionFailureTest, PastRetryTimeIsDue) {
    EXPECT_TRUE(failure(now.addSeconds(-1)).isDueForRetry(now));
    EXPECT_TRUE(failure(now).isDueForRetry(now));
}

TEST_F(ProjectionFailureTest, FutureRetryTimeIsNotDue) {
    EXPECT_FALSE(failure(now.addSeconds(30)).isDueForRetry(now));
}

TEST_F(ProjectionFailureTest, ResolvedIsNeverDue) {
    auto f = failure(now.addSeconds(-10));
    f.resolvedAt = now;

    EXPECT_FALSE(f.isActive());
    EXPECT_FALSE(f.isDueForRetry(now));
}

TEST_F(ProjectionFailureTest, ExhaustedIsNeverDue) {
    auto f = failure(now.addSeconds(-10));
    f.retryCount = 5;

    EXPECT_FALSE(f.isDueForRetry(now));
    EXPECT_FALSE(failure(std::nullopt).isDueForRetry(now));
}

// ============================================================================
// HEALTH THRESHOLDS
// ============================================================================

TEST(HealthStatusTest, Thresholds) {
    EXPECT_EQ(healthStatusFor(0), HealthStatus::HEALTHY);
    EXPECT_EQ(healthStatusFor(1), HealthStatus::DEGRADED);
    EXPECT_EQ(healthStatusFor(9), HealthStatus::DEGRADED);
    EXPECT_EQ(healthStatusFor(10), HealthStatus::CRITICAL);
    EXPECT_EQ(healthStatusFor(49), HealthStatus::CRITICAL);
    EXPECT_EQ(healthStatusFor(50), HealthStatus::OFFLINE);
}

TEST(HealthStatusTest, StringRoundTrip) {
    EXPECT_EQ(toString(HealthStatus::CRITICAL), "critical");
    EXPECT_EQ(healthStatusFromString("offline"), HealthStatus::OFFLINE);
    EXPECT_THROW(healthStatusFromString("sleepy"), std::invalid_argument);
}

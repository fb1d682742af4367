#include <gtest/gtest.h>
#include "application/ProjectionAdminService.hpp"
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemoryProjectionFailureTracker.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/FakeProjection.hpp"
#include "mocks/FakeSettings.hpp"
#include "mocks/TestEvents.hpp"

using namespace chronicle;
using namespace chronicle::application;
using namespace chronicle::tests;
using Code = domain::AdminError::Code;

class ProjectionAdminServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        registry_ = std::make_shared<ProjectionRegistry>();
        eventStore_ = std::make_shared<adapters::secondary::InMemoryEventStore>(
            std::make_shared<EventUpcasterRegistry>());
        tracker_ = std::make_shared<adapters::secondary::InMemoryProjectionFailureTracker>(
            std::make_shared<FakeFailureTrackerSettings>(), clock_);
        settings_ = std::make_shared<FakeRetryWorkerSettings>();
        settings_->replayBatchSize = 3;

        views_ = std::make_shared<FakeProjection>("views");
        registry_->registerProjection(views_);

        service_ = std::make_shared<ProjectionAdminService>(registry_, tracker_, eventStore_, settings_, clock_);
    }

    void storeEvents(int count) {
        for (int i = 0; i < count; ++i) {
            auto result = eventStore_->append("agg-1", {makeEvent("agg-1")}, static_cast<int64_t>(stored_.size()));
            stored_.push_back(result.value().front());
        }
    }

    std::string failOn(const domain::DomainEvent& event) {
        return tracker_->recordFailure(event, "views", "boom", "trace");
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<ProjectionRegistry> registry_;
    std::shared_ptr<adapters::secondary::InMemoryEventStore> eventStore_;
    std::shared_ptr<ports::output::IProjectionFailureTracker> tracker_;
    std::shared_ptr<FakeRetryWorkerSettings> settings_;
    std::shared_ptr<FakeProjection> views_;
    std::shared_ptr<ProjectionAdminService> service_;
    std::vector<domain::DomainEvent> stored_;
};

// ============================================================================
// REPLAY
// ============================================================================

TEST_F(ProjectionAdminServiceTest, Replay_WholeLogAcrossBatches) {
    storeEvents(7);

    auto result = service_->replay({"views", std::nullopt, std::nullopt, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().fromSequence, 1);
    EXPECT_EQ(result.value().toSequence, 7);
    EXPECT_EQ(result.value().eventsReplayed, 7);
    EXPECT_EQ(views_->handled().size(), 7u);
    EXPECT_EQ(tracker_->getCheckpoint("views")->lastEventSequence, 7);
}

TEST_F(ProjectionAdminServiceTest, Replay_DefaultsToCheckpointPlusOne) {
    storeEvents(5);
    tracker_->recordSuccess(stored_[2], "views", domain::ResolutionMethod::AUTO_RETRY);

    auto result = service_->replay({"views", std::nullopt, std::nullopt, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().fromSequence, 4);
    EXPECT_EQ(result.value().eventsReplayed, 2);
    EXPECT_EQ(views_->handled(), (std::vector<std::string>{stored_[3].eventId, stored_[4].eventId}));
}

TEST_F(ProjectionAdminServiceTest, Replay_ExplicitRangeIsInclusive) {
    storeEvents(10);

    auto result = service_->replay({"views", 3, 6, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().eventsReplayed, 4);
    auto handled = views_->handled();
    ASSERT_EQ(handled.size(), 4u);
    EXPECT_EQ(handled.front(), stored_[2].eventId);
    EXPECT_EQ(handled.back(), stored_[5].eventId);
}

TEST_F(ProjectionAdminServiceTest, Replay_SkipFailed) {
    storeEvents(4);
    failOn(stored_[1]);

    auto result = service_->replay({"views", 1, std::nullopt, true});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().eventsReplayed, 3);
    EXPECT_EQ(result.value().eventsSkipped, 1);
    EXPECT_EQ(tracker_->getFailures("views", false).size(), 1u);
}

TEST_F(ProjectionAdminServiceTest, Replay_WithoutSkipResolvesRecoveredFailure) {
    storeEvents(2);
    auto failureId = failOn(stored_[0]);

    auto result = service_->replay({"views", 1, std::nullopt, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().eventsReplayed, 2);
    EXPECT_FALSE(tracker_->findFailure(failureId)->isActive());
}

TEST_F(ProjectionAdminServiceTest, Replay_CountsFailuresAndRecordsThem) {
    storeEvents(3);
    views_->failAlways();

    auto result = service_->replay({"views", 1, std::nullopt, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().eventsFailed, 3);
    EXPECT_EQ(result.value().eventsReplayed, 0);

    auto failures = tracker_->getFailures("views", false);
    ASSERT_EQ(failures.size(), 3u);
    EXPECT_NE(failures[0].errorTrace.find("origin=replay"), std::string::npos);
}

TEST_F(ProjectionAdminServiceTest, Replay_EmptyRangeIsNoOp) {
    storeEvents(3);
    for (const auto& event : stored_) {
        tracker_->recordSuccess(event, "views", domain::ResolutionMethod::AUTO_RETRY);
    }

    auto result = service_->replay({"views", std::nullopt, std::nullopt, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().eventsReplayed, 0);
    EXPECT_TRUE(views_->handled().empty());
}

TEST_F(ProjectionAdminServiceTest, Replay_InvalidRange) {
    storeEvents(3);

    auto reversed = service_->replay({"views", 5, 2, false});
    ASSERT_FALSE(reversed);
    EXPECT_EQ(reversed.error().code, Code::INVALID_RANGE);

    auto zero = service_->replay({"views", 0, std::nullopt, false});
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, Code::INVALID_RANGE);
}

TEST_F(ProjectionAdminServiceTest, Replay_UnknownProjection) {
    auto result = service_->replay({"nope", std::nullopt, std::nullopt, false});

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::PROJECTION_NOT_FOUND);
}

TEST_F(ProjectionAdminServiceTest, Replay_StoreUnavailable) {
    storeEvents(1);
    eventStore_->setAvailable(false);

    auto result = service_->replay({"views", std::nullopt, std::nullopt, false});

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::STORE_UNAVAILABLE);
}

// ============================================================================
// RESET
// ============================================================================

TEST_F(ProjectionAdminServiceTest, Reset_ClearsReadModelCheckpointAndFailures) {
    storeEvents(3);
    tracker_->recordSuccess(stored_[0], "views", domain::ResolutionMethod::AUTO_RETRY);
    auto failureId = failOn(stored_[1]);

    auto result = service_->reset("views");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().failuresResolved, 1);
    EXPECT_EQ(views_->resets(), 1);
    EXPECT_FALSE(tracker_->getCheckpoint("views").has_value());

    auto failure = tracker_->findFailure(failureId);
    EXPECT_EQ(failure->resolutionMethod, domain::ResolutionMethod::MANUAL_RESET);

    auto metrics = tracker_->getHealthMetrics(std::string("views"));
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].healthStatus, domain::HealthStatus::HEALTHY);
    EXPECT_EQ(metrics[0].totalEventsProcessed, 0);
}

TEST_F(ProjectionAdminServiceTest, ResetThenReplay_RebuildsFromStart) {
    storeEvents(4);
    ASSERT_TRUE(service_->replay({"views", std::nullopt, std::nullopt, false}));
    ASSERT_TRUE(service_->reset("views"));

    auto result = service_->replay({"views", std::nullopt, std::nullopt, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().fromSequence, 1);
    EXPECT_EQ(views_->handled().size(), 4u);
}

TEST_F(ProjectionAdminServiceTest, Reset_UnknownProjection) {
    auto result = service_->reset("nope");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::PROJECTION_NOT_FOUND);
}

// ============================================================================
// RESOLVE
// ============================================================================

TEST_F(ProjectionAdminServiceTest, Resolve_Skip) {
    storeEvents(1);
    auto failureId = failOn(stored_[0]);

    auto result = service_->resolve(failureId, "skip");

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().resolved);
    EXPECT_EQ(result.value().resolutionMethod, domain::ResolutionMethod::MANUAL_SKIP);
    EXPECT_TRUE(views_->handled().empty());
    EXPECT_FALSE(tracker_->findFailure(failureId)->isActive());
}

TEST_F(ProjectionAdminServiceTest, Resolve_ManualFix) {
    storeEvents(1);
    auto failureId = failOn(stored_[0]);

    auto result = service_->resolve(failureId, "manual_fix");

    ASSERT_TRUE(result);
    EXPECT_EQ(tracker_->findFailure(failureId)->resolutionMethod, domain::ResolutionMethod::MANUAL_FIX);
}

TEST_F(ProjectionAdminServiceTest, Resolve_RetrySucceeds) {
    storeEvents(1);
    auto failureId = failOn(stored_[0]);

    auto result = service_->resolve(failureId, "retry");

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().resolved);
    EXPECT_EQ(views_->handled(), std::vector<std::string>{stored_[0].eventId});
    EXPECT_EQ(tracker_->findFailure(failureId)->resolutionMethod, domain::ResolutionMethod::MANUAL_RETRY);
}

TEST_F(ProjectionAdminServiceTest, Resolve_RetryFailsAgain) {
    storeEvents(1);
    auto failureId = failOn(stored_[0]);
    views_->failAlways();

    auto result = service_->resolve(failureId, "retry");

    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().resolved);

    auto failure = tracker_->findFailure(failureId);
    EXPECT_TRUE(failure->isActive());
    EXPECT_EQ(failure->retryCount, 1);
}

TEST_F(ProjectionAdminServiceTest, Replay_NonStandardExceptionCountedAsFailure) {
    storeEvents(2);
    views_->throwNonStandard();

    auto result = service_->replay({"views", 1, 2, false});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().eventsFailed, 2);
    auto failures = tracker_->getFailures("views", false);
    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].errorMessage, "unknown exception");
}

TEST_F(ProjectionAdminServiceTest, Resolve_RetryOfMissingEvent) {
    auto failureId = failOn(makeEvent("agg-ghost"));

    auto result = service_->resolve(failureId, "retry");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::EVENT_NOT_FOUND);
}

TEST_F(ProjectionAdminServiceTest, Resolve_InvalidStrategy) {
    storeEvents(1);
    auto failureId = failOn(stored_[0]);

    auto result = service_->resolve(failureId, "ignore");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::INVALID_STRATEGY);
    EXPECT_TRUE(tracker_->findFailure(failureId)->isActive());
}

TEST_F(ProjectionAdminServiceTest, Resolve_NotFound) {
    auto result = service_->resolve("no-such-failure", "skip");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::FAILURE_NOT_FOUND);
}

TEST_F(ProjectionAdminServiceTest, Resolve_AlreadyResolved) {
    storeEvents(1);
    auto failureId = failOn(stored_[0]);
    ASSERT_TRUE(service_->resolve(failureId, "skip"));

    auto result = service_->resolve(failureId, "skip");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Code::ALREADY_RESOLVED);
}

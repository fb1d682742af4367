/**
 * @file EventPublisherTest.cpp
 * @brief Unit tests for EventPublisher
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/EventPublisher.hpp"
#include "adapters/secondary/persistence/InMemoryProjectionFailureTracker.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/FakeProjection.hpp"
#include "mocks/FakeSettings.hpp"
#include "mocks/MockProjectionFailureTracker.hpp"
#include "mocks/TestEvents.hpp"

using namespace chronicle;
using namespace chronicle::application;
using namespace chronicle::tests;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class EventPublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<ProjectionRegistry>();
        clock_ = std::make_shared<FakeClock>();
        settings_ = std::make_shared<FakePublisherSettings>();
        tracker_ = std::make_shared<adapters::secondary::InMemoryProjectionFailureTracker>(
            std::make_shared<FakeFailureTrackerSettings>(), clock_);

        views_ = std::make_shared<FakeProjection>("views");
        search_ = std::make_shared<FakeProjection>("search");
        registry_->registerProjection(views_);
        registry_->registerProjection(search_);

        publisher_ = std::make_shared<EventPublisher>(registry_, tracker_, settings_, clock_);
    }

    domain::DomainEvent storedEvent(int64_t sequence) {
        auto event = makeEvent("agg-1");
        event.version = sequence;
        event.sequence = sequence;
        return event;
    }

    std::shared_ptr<ProjectionRegistry> registry_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<FakePublisherSettings> settings_;
    std::shared_ptr<ports::output::IProjectionFailureTracker> tracker_;
    std::shared_ptr<FakeProjection> views_;
    std::shared_ptr<FakeProjection> search_;
    std::shared_ptr<EventPublisher> publisher_;
};

TEST_F(EventPublisherTest, Publish_DeliversToEveryProjection) {
    auto event = storedEvent(1);
    publisher_->publish(event);

    EXPECT_EQ(views_->handled(), std::vector<std::string>{event.eventId});
    EXPECT_EQ(search_->handled(), std::vector<std::string>{event.eventId});
    EXPECT_TRUE(clock_->delays().empty());
}

TEST_F(EventPublisherTest, Publish_SkipsProjectionThatCannotHandle) {
    auto picky = std::make_shared<FakeProjection>("picky", std::set<std::string>{"OnlyThis"});
    registry_->registerProjection(picky);

    publisher_->publish(storedEvent(1));

    EXPECT_EQ(picky->attempts(), 0);
    EXPECT_FALSE(tracker_->getCheckpoint("picky").has_value());
}

TEST_F(EventPublisherTest, Success_AdvancesCheckpoint) {
    publisher_->publishAll({storedEvent(1), storedEvent(2), storedEvent(3)});

    auto checkpoint = tracker_->getCheckpoint("views");
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->lastEventSequence, 3);
    EXPECT_EQ(checkpoint->eventsProcessed, 3);
}

TEST_F(EventPublisherTest, TransientFailure_RetriedInline) {
    views_->failTimes(2);
    auto event = storedEvent(1);

    publisher_->publish(event);

    EXPECT_EQ(views_->attempts(), 3);
    EXPECT_EQ(views_->handled(), std::vector<std::string>{event.eventId});
    EXPECT_EQ(clock_->delays(), (std::vector<std::chrono::milliseconds>{
        std::chrono::milliseconds(1000), std::chrono::milliseconds(2000)}));
    EXPECT_TRUE(tracker_->getFailures("views", true).empty());
}

TEST_F(EventPublisherTest, PersistentFailure_RecordedAfterFinalAttempt) {
    views_->failAlways();
    auto event = storedEvent(1);

    publisher_->publish(event);

    EXPECT_EQ(views_->attempts(), 4);
    EXPECT_EQ(clock_->delays(), (std::vector<std::chrono::milliseconds>{
        std::chrono::milliseconds(1000), std::chrono::milliseconds(2000), std::chrono::milliseconds(4000)}));

    auto failures = tracker_->getFailures("views", false);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].eventId, event.eventId);
    EXPECT_EQ(failures[0].retryCount, 0);
    EXPECT_THAT(failures[0].errorMessage, HasSubstr("cannot handle"));
    EXPECT_THAT(failures[0].errorTrace, HasSubstr("origin=publisher"));
    EXPECT_THAT(failures[0].errorTrace, HasSubstr("event_id=" + event.eventId));
}

TEST_F(EventPublisherTest, FailingProjection_DoesNotBlockOthers) {
    views_->failAlways();

    publisher_->publishAll({storedEvent(1), storedEvent(2)});

    EXPECT_EQ(search_->handled().size(), 2u);
    EXPECT_EQ(tracker_->getFailures("views", false).size(), 2u);
    EXPECT_FALSE(tracker_->getCheckpoint("views").has_value());

    auto metrics = tracker_->getHealthMetrics(std::string("views"));
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].healthStatus, domain::HealthStatus::DEGRADED);
}

TEST_F(EventPublisherTest, NonStandardException_RecordedAndOthersStillRun) {
    views_->throwNonStandard();
    auto event = storedEvent(1);

    EXPECT_NO_THROW(publisher_->publish(event));

    EXPECT_EQ(views_->attempts(), 4);
    EXPECT_EQ(search_->handled(), std::vector<std::string>{event.eventId});

    auto failures = tracker_->getFailures("views", false);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].errorMessage, "unknown exception");
}

TEST_F(EventPublisherTest, ZeroInlineRetries_FailsImmediately) {
    settings_->maxRetries = 0;
    auto publisher = std::make_shared<EventPublisher>(registry_, tracker_, settings_, clock_);
    views_->failAlways();

    publisher->publish(storedEvent(1));

    EXPECT_EQ(views_->attempts(), 1);
    EXPECT_TRUE(clock_->delays().empty());
    EXPECT_EQ(tracker_->getFailures("views", false).size(), 1u);
}

TEST_F(EventPublisherTest, TrackerErrors_AreSwallowed) {
    auto mockTracker = std::make_shared<MockProjectionFailureTracker>();
    auto publisher = std::make_shared<EventPublisher>(registry_, mockTracker, settings_, clock_);
    views_->failAlways();

    EXPECT_CALL(*mockTracker, recordFailure(_, "views", _, _))
        .WillOnce(Throw(std::runtime_error("tracker down")));
    EXPECT_CALL(*mockTracker, recordSuccess(_, "search", _))
        .WillOnce(Throw(std::runtime_error("tracker down")));

    EXPECT_NO_THROW(publisher->publish(storedEvent(1)));
    EXPECT_EQ(search_->handled().size(), 1u);
}

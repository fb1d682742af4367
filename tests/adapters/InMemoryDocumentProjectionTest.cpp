#include <gtest/gtest.h>
#include "adapters/secondary/projections/InMemoryDocumentProjection.hpp"
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemoryProjectionFailureTracker.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "application/DocumentRepository.hpp"
#include "application/EventPublisher.hpp"
#include "application/RetryWorker.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/FakeSettings.hpp"

using namespace chronicle;
using namespace chronicle::adapters::secondary;
using namespace chronicle::tests;

namespace {

/**
 * @brief Проекция документов, у которой первая доставка AnalysisStarted падает
 */
class FlakyDocumentProjection : public ports::output::IProjection {
public:
    explicit FlakyDocumentProjection(std::shared_ptr<InMemoryDocumentProjection> inner)
        : inner_(std::move(inner)) {}

    std::string name() const override { return inner_->name(); }
    bool canHandle(const domain::DomainEvent& event) const override { return inner_->canHandle(event); }

    void handle(const domain::DomainEvent& event) override {
        if (event.eventType == domain::events::AnalysisStarted::TYPE && !failedOnce_) {
            failedOnce_ = true;
            throw std::runtime_error("connection reset");
        }
        inner_->handle(event);
    }

    void reset() override { inner_->reset(); }

private:
    std::shared_ptr<InMemoryDocumentProjection> inner_;
    bool failedOnce_ = false;
};

} // namespace

class InMemoryDocumentProjectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        projection_ = std::make_shared<InMemoryDocumentProjection>();
    }

    static std::vector<domain::DomainEvent> analyzedDocumentEvents() {
        auto doc = domain::Document::upload("doc-1", "policy.pdf", 2048, "pdf", "alice");
        doc.convert("# Policy", {}, {});
        doc.startAnalysis("repo-7", "claude", "bob");
        doc.completeAnalysis(2, 0.95, {}, 1500);
        return doc.pendingEvents();
    }

    std::shared_ptr<InMemoryDocumentProjection> projection_;
};

TEST_F(InMemoryDocumentProjectionTest, CanHandle_OnlyDocumentEvents) {
    auto events = analyzedDocumentEvents();
    EXPECT_TRUE(projection_->canHandle(events[0]));

    auto shared = events[0];
    shared.eventType = domain::events::DocumentSharedWithGroup::TYPE;
    EXPECT_TRUE(projection_->canHandle(shared));

    auto foreign = events[0];
    foreign.aggregateType = "Invoice";
    EXPECT_FALSE(projection_->canHandle(foreign));
}

TEST_F(InMemoryDocumentProjectionTest, Handle_BuildsView) {
    for (const auto& event : analyzedDocumentEvents()) {
        projection_->handle(event);
    }

    auto view = projection_->find("doc-1");
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->title, "policy.pdf");
    EXPECT_EQ(view->status, domain::DocumentStatus::ANALYZED);
    EXPECT_EQ(view->complianceStatus, std::optional<std::string>("compliant"));
    EXPECT_EQ(view->version, 4);
}

TEST_F(InMemoryDocumentProjectionTest, Handle_SameEventTwiceIsIdempotent) {
    auto events = analyzedDocumentEvents();
    for (const auto& event : events) {
        projection_->handle(event);
    }
    auto before = projection_->find("doc-1");

    projection_->handle(events[0]);
    projection_->handle(events[2]);

    EXPECT_EQ(projection_->size(), 1u);
    auto after = projection_->find("doc-1");
    EXPECT_EQ(after->status, before->status);
    EXPECT_EQ(after->version, before->version);
}

TEST_F(InMemoryDocumentProjectionTest, Handle_MissingRowThrows) {
    auto events = analyzedDocumentEvents();

    EXPECT_THROW(projection_->handle(events[1]), std::runtime_error);
    EXPECT_EQ(projection_->size(), 0u);
}

TEST_F(InMemoryDocumentProjectionTest, Handle_VersionGapThrowsAndKeepsView) {
    auto events = analyzedDocumentEvents();
    projection_->handle(events[0]);
    projection_->handle(events[1]);

    EXPECT_THROW(projection_->handle(events[3]), std::runtime_error);

    auto view = projection_->find("doc-1");
    EXPECT_EQ(view->status, domain::DocumentStatus::CONVERTED);
    EXPECT_EQ(view->version, 2);

    projection_->handle(events[2]);
    projection_->handle(events[3]);
    EXPECT_EQ(projection_->find("doc-1")->version, 4);
}

TEST_F(InMemoryDocumentProjectionTest, Handle_SharingEventKeepsVersionsContiguous) {
    auto doc = domain::Document::upload("doc-1", "policy.pdf", 2048, "pdf", "alice");
    doc.convert("# Policy", {}, {});
    doc.shareWithGroup("legal", "alice");
    doc.startAnalysis("repo-7", "claude", "bob");

    for (const auto& event : doc.pendingEvents()) {
        projection_->handle(event);
    }

    auto view = projection_->find("doc-1");
    EXPECT_EQ(view->status, domain::DocumentStatus::ANALYZING);
    EXPECT_EQ(view->policyRepositoryId, std::optional<std::string>("repo-7"));
    EXPECT_EQ(view->version, 4);
}

TEST_F(InMemoryDocumentProjectionTest, Reset_ClearsViews) {
    projection_->handle(analyzedDocumentEvents()[0]);

    projection_->reset();

    EXPECT_EQ(projection_->size(), 0u);
    EXPECT_FALSE(projection_->find("doc-1").has_value());
}

// ============================================================================
// REPOSITORY -> PUBLISHER -> PROJECTION
// ============================================================================

TEST_F(InMemoryDocumentProjectionTest, SavedDocumentReachesReadModel) {
    auto clock = std::make_shared<FakeClock>();
    auto upcasters = std::make_shared<application::EventUpcasterRegistry>();
    application::registerDocumentUpcasters(*upcasters);

    auto registry = std::make_shared<application::ProjectionRegistry>();
    registry->registerProjection(projection_);

    auto tracker = std::make_shared<InMemoryProjectionFailureTracker>(
        std::make_shared<FakeFailureTrackerSettings>(), clock);
    auto publisher = std::make_shared<application::EventPublisher>(
        registry, tracker, std::make_shared<FakePublisherSettings>(), clock);

    application::DocumentRepository repository(
        std::make_shared<InMemoryEventStore>(upcasters),
        std::make_shared<InMemorySnapshotStore>(),
        publisher,
        std::make_shared<FakeRepositorySettings>(),
        clock);

    auto doc = domain::Document::upload("doc-1", "policy.pdf", 2048, "pdf", "alice");
    doc.convert("# Policy", {}, {});
    ASSERT_TRUE(repository.save(doc));

    doc.startAnalysis("repo-7", "claude", "bob");
    ASSERT_TRUE(repository.save(doc));

    auto view = projection_->find("doc-1");
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->status, domain::DocumentStatus::ANALYZING);
    EXPECT_EQ(view->policyRepositoryId, std::optional<std::string>("repo-7"));
    EXPECT_EQ(view->version, 3);

    auto checkpoint = tracker->getCheckpoint(InMemoryDocumentProjection::NAME);
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->lastEventSequence, 3);
}

TEST_F(InMemoryDocumentProjectionTest, FailedEventRetriedAfterLaterEvent_ViewConverges) {
    auto clock = std::make_shared<FakeClock>();
    auto upcasters = std::make_shared<application::EventUpcasterRegistry>();
    application::registerDocumentUpcasters(*upcasters);
    auto eventStore = std::make_shared<InMemoryEventStore>(upcasters);

    auto registry = std::make_shared<application::ProjectionRegistry>();
    registry->registerProjection(std::make_shared<FlakyDocumentProjection>(projection_));

    auto tracker = std::make_shared<InMemoryProjectionFailureTracker>(
        std::make_shared<FakeFailureTrackerSettings>(), clock);
    auto publisherSettings = std::make_shared<FakePublisherSettings>();
    publisherSettings->maxRetries = 0;
    auto publisher = std::make_shared<application::EventPublisher>(
        registry, tracker, publisherSettings, clock);

    application::DocumentRepository repository(
        eventStore, std::make_shared<InMemorySnapshotStore>(), publisher,
        std::make_shared<FakeRepositorySettings>(), clock);

    auto doc = domain::Document::upload("doc-1", "policy.pdf", 2048, "pdf", "alice");
    doc.convert("# Policy", {}, {});
    ASSERT_TRUE(repository.save(doc));
    doc.startAnalysis("policy-42", "claude", "bob");
    ASSERT_TRUE(repository.save(doc));
    doc.completeAnalysis(1, 0.8, {}, 900);
    ASSERT_TRUE(repository.save(doc));

    EXPECT_EQ(projection_->find("doc-1")->version, 2);
    EXPECT_EQ(tracker->getFailures(InMemoryDocumentProjection::NAME, false).size(), 2u);

    application::RetryWorker worker(registry, tracker, eventStore, std::make_shared<FakeRetryWorkerSettings>());
    clock->advanceSeconds(5);
    worker.runOnce();
    clock->advanceSeconds(5);
    worker.runOnce();

    auto view = projection_->find("doc-1");
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->policyRepositoryId, std::optional<std::string>("policy-42"));
    EXPECT_EQ(view->status, domain::DocumentStatus::ANALYZED);
    EXPECT_EQ(view->complianceStatus, std::optional<std::string>("partial"));
    EXPECT_EQ(view->version, 4);
    EXPECT_TRUE(tracker->getFailures(InMemoryDocumentProjection::NAME, false).empty());
}

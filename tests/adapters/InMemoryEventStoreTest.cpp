#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "mocks/TestEvents.hpp"
#include <atomic>
#include <thread>

using namespace chronicle;
using namespace chronicle::adapters::secondary;
using namespace chronicle::tests;

class InMemoryEventStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryEventStore>(std::make_shared<application::EventUpcasterRegistry>());
    }

    std::vector<domain::DomainEvent> events(const std::string& aggregateId, int count) {
        std::vector<domain::DomainEvent> result;
        for (int i = 0; i < count; ++i) {
            result.push_back(makeEvent(aggregateId));
        }
        return result;
    }

    std::shared_ptr<InMemoryEventStore> store_;
};

// ================================================================
// APPEND
// ================================================================

TEST_F(InMemoryEventStoreTest, Append_AssignsVersionsAndSequences) {
    auto result = store_->append("agg-1", events("agg-1", 3), 0);

    ASSERT_TRUE(result);
    const auto& stored = result.value();
    ASSERT_EQ(stored.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(stored[i].version, i + 1);
        EXPECT_EQ(stored[i].sequence, i + 1);
    }
}

TEST_F(InMemoryEventStoreTest, Append_WrongExpectedVersion) {
    ASSERT_TRUE(store_->append("agg-1", events("agg-1", 2), 0));

    auto result = store_->append("agg-1", events("agg-1", 1), 1);

    ASSERT_FALSE(result);
    ASSERT_TRUE(std::holds_alternative<domain::ConcurrencyError>(result.error()));
    const auto& conflict = std::get<domain::ConcurrencyError>(result.error());
    EXPECT_EQ(conflict.expectedVersion, 1);
    EXPECT_EQ(conflict.actualVersion, 2);

    EXPECT_EQ(store_->countEvents("agg-1").value(), 2);
}

TEST_F(InMemoryEventStoreTest, Append_NewAggregateMustExpectZero) {
    auto result = store_->append("agg-new", events("agg-new", 1), 3);

    ASSERT_FALSE(result);
    EXPECT_TRUE(std::holds_alternative<domain::ConcurrencyError>(result.error()));
}

TEST_F(InMemoryEventStoreTest, Append_RejectedNewAggregateLeavesNoStream) {
    ASSERT_FALSE(store_->append("agg-new", events("agg-new", 1), 3));

    EXPECT_EQ(store_->streamCount(), 0u);
    EXPECT_EQ(store_->countEvents("agg-new").value(), 0);

    ASSERT_TRUE(store_->append("agg-new", events("agg-new", 1), 0));
    EXPECT_EQ(store_->streamCount(), 1u);
}

TEST_F(InMemoryEventStoreTest, Append_SequenceIsGlobalAcrossAggregates) {
    ASSERT_TRUE(store_->append("agg-1", events("agg-1", 2), 0));
    auto second = store_->append("agg-2", events("agg-2", 2), 0);

    ASSERT_TRUE(second);
    EXPECT_EQ(second.value()[0].version, 1);
    EXPECT_EQ(second.value()[0].sequence, 3);
    EXPECT_EQ(store_->latestSequence().value(), 4);
}

TEST_F(InMemoryEventStoreTest, ConcurrentAppends_ExactlyOneWins) {
    ASSERT_TRUE(store_->append("agg-1", events("agg-1", 4), 0));

    std::atomic<int> succeeded{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&]() {
            auto result = store_->append("agg-1", {makeEvent("agg-1")}, 4);
            if (result) {
                ++succeeded;
            } else if (std::holds_alternative<domain::ConcurrencyError>(result.error())) {
                ++conflicts;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(conflicts.load(), 9);
    EXPECT_EQ(store_->countEvents("agg-1").value(), 5);
}

// ================================================================
// LOAD
// ================================================================

TEST_F(InMemoryEventStoreTest, Load_FromVersion) {
    ASSERT_TRUE(store_->append("agg-1", events("agg-1", 5), 0));

    auto tail = store_->load("agg-1", 3);

    ASSERT_TRUE(tail);
    ASSERT_EQ(tail.value().size(), 2u);
    EXPECT_EQ(tail.value()[0].version, 4);
    EXPECT_EQ(tail.value()[1].version, 5);
}

TEST_F(InMemoryEventStoreTest, Load_UnknownAggregateIsEmpty) {
    auto result = store_->load("missing", 0);

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().empty());
}

TEST_F(InMemoryEventStoreTest, LoadAll_OrderedBySequenceWithLimit) {
    ASSERT_TRUE(store_->append("agg-1", events("agg-1", 2), 0));
    ASSERT_TRUE(store_->append("agg-2", events("agg-2", 2), 0));
    ASSERT_TRUE(store_->append("agg-1", events("agg-1", 1), 2));

    auto page = store_->loadAll(1, 3);

    ASSERT_TRUE(page);
    ASSERT_EQ(page.value().size(), 3u);
    EXPECT_EQ(page.value()[0].sequence, 2);
    EXPECT_EQ(page.value()[1].sequence, 3);
    EXPECT_EQ(page.value()[1].aggregateId, "agg-2");
    EXPECT_EQ(page.value()[2].sequence, 4);

    EXPECT_TRUE(store_->loadAll(5, 10).value().empty());
}

TEST_F(InMemoryEventStoreTest, LoadEvent_ById) {
    auto stored = store_->append("agg-1", events("agg-1", 2), 0).value();

    auto found = store_->loadEvent(stored[1].eventId);
    ASSERT_TRUE(found);
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->version, 2);

    auto missing = store_->loadEvent("nope");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(InMemoryEventStoreTest, Load_UpcastsOnRead) {
    auto upcasters = std::make_shared<application::EventUpcasterRegistry>();
    upcasters->registerUpcaster("SomethingHappened", 1, [](nlohmann::json payload) {
        payload["added"] = true;
        return payload;
    });
    InMemoryEventStore store(upcasters);
    ASSERT_TRUE(store.append("agg-1", {makeEvent("agg-1")}, 0));

    auto loaded = store.load("agg-1", 0).value();

    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].schemaVersion, 2);
    EXPECT_TRUE(loaded[0].payload.at("added").get<bool>());
}

// ================================================================
// AVAILABILITY
// ================================================================

TEST_F(InMemoryEventStoreTest, Unavailable_EveryOperationFails) {
    store_->setAvailable(false);

    auto append = store_->append("agg-1", events("agg-1", 1), 0);
    ASSERT_FALSE(append);
    EXPECT_TRUE(std::holds_alternative<domain::StoreUnavailable>(append.error()));
    EXPECT_FALSE(domain::isRetryable(append.error()));

    EXPECT_FALSE(store_->load("agg-1", 0));
    EXPECT_FALSE(store_->loadAll(0, 10));
    EXPECT_FALSE(store_->loadEvent("x"));
    EXPECT_FALSE(store_->latestSequence());
    EXPECT_FALSE(store_->countEvents("agg-1"));
}

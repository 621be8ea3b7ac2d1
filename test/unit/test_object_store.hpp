#ifndef DOCSANITIZER_TEST_UNIT_TEST_OBJECT_STORE_HPP
#define DOCSANITIZER_TEST_UNIT_TEST_OBJECT_STORE_HPP

// test/unit/test_object_store.hpp
// -----------------------------------------------------------
// Ephemeral object store: round-trip, TTL expiry, explicit removal, the
// reclamation sweep and concurrent access.

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "store/object_store.hpp"
#include "util/identifiers.hpp"

namespace {

using docsanitizer::core::MediaKind;
using docsanitizer::store::ObjectNotFoundError;
using docsanitizer::store::ObjectStore;

// A clock tests can move forward by hand.
struct ManualClock
{
    std::shared_ptr<std::atomic<int64_t>> offsetMs = std::make_shared<std::atomic<int64_t>>(0);
    ObjectStore::Clock::time_point base = ObjectStore::Clock::now();

    ObjectStore::ClockFn fn() const
    {
        auto offset = offsetMs;
        auto start = base;
        return [offset, start] { return start + std::chrono::milliseconds(offset->load()); };
    }

    void advance(std::chrono::milliseconds by) { *offsetMs += by.count(); }
};

std::vector<uint8_t> bytesOf(const std::string &s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(ObjectStoreTest, PutThenGetReturnsSameBytes) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::seconds(1));
    std::string id = store.put(bytesOf("hello world"), MediaKind::PlainText, "note.txt");

    EXPECT_TRUE(docsanitizer::util::identifiers::isWellFormedObjectId(id));
    auto object = store.get(id);
    ASSERT_TRUE(object != nullptr);
    EXPECT_EQ(std::string(object->bytes.begin(), object->bytes.end()), "hello world");
    EXPECT_EQ(object->mediaKind, MediaKind::PlainText);
    EXPECT_EQ(object->originalName, "note.txt");
    EXPECT_EQ(object->expiresAt - object->createdAt, std::chrono::seconds(60));

    // Reads are non-destructive.
    EXPECT_NO_THROW(store.get(id));
    EXPECT_EQ(store.size(), (size_t)1);
}

TEST(ObjectStoreTest, UnknownIdIsNotFound) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::seconds(1));
    EXPECT_THROW(store.get("00000000-0000-4000-8000-000000000000"), ObjectNotFoundError);
    EXPECT_EQ(store.stats().misses, (uint64_t)1);
}

TEST(ObjectStoreTest, ExpiredObjectIsNotFoundEvenBeforeSweep) {
    ManualClock clock;
    ObjectStore store(std::chrono::seconds(10), std::chrono::seconds(1), 0, clock.fn());
    std::string id = store.put(bytesOf("x"), MediaKind::PlainText);

    clock.advance(std::chrono::milliseconds(9999));
    EXPECT_NO_THROW(store.get(id));

    clock.advance(std::chrono::milliseconds(1));
    EXPECT_THROW(store.get(id), ObjectNotFoundError);
    EXPECT_FALSE(store.contains(id));
    // Still physically present until the sweep runs.
    EXPECT_EQ(store.size(), (size_t)1);
    EXPECT_EQ(store.sweepExpired(), (size_t)1);
    EXPECT_EQ(store.size(), (size_t)0);
    EXPECT_EQ(store.stats().evictions, (uint64_t)1);
}

TEST(ObjectStoreTest, SweepKeepsLiveObjects) {
    ManualClock clock;
    ObjectStore store(std::chrono::seconds(10), std::chrono::seconds(1), 0, clock.fn());
    std::string oldId = store.put(bytesOf("old"), MediaKind::PlainText);
    clock.advance(std::chrono::seconds(6));
    std::string newId = store.put(bytesOf("new"), MediaKind::PlainText);
    clock.advance(std::chrono::seconds(5));

    EXPECT_EQ(store.sweepExpired(), (size_t)1);
    EXPECT_FALSE(store.contains(oldId));
    EXPECT_TRUE(store.contains(newId));
}

TEST(ObjectStoreTest, RemoveAndTake) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::seconds(1));
    std::string a = store.put(bytesOf("a"), MediaKind::PlainText);
    std::string b = store.put(bytesOf("b"), MediaKind::DelimitedText);

    EXPECT_TRUE(store.remove(a));
    EXPECT_FALSE(store.remove(a));
    EXPECT_THROW(store.get(a), ObjectNotFoundError);

    auto taken = store.take(b);
    ASSERT_TRUE(taken != nullptr);
    EXPECT_EQ(taken->mediaKind, MediaKind::DelimitedText);
    EXPECT_THROW(store.take(b), ObjectNotFoundError);
    EXPECT_EQ(store.size(), (size_t)0);
}

TEST(ObjectStoreTest, RejectsOversizedPayload) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::seconds(1), 4);
    EXPECT_THROW(store.put(bytesOf("12345"), MediaKind::PlainText), std::invalid_argument);
    EXPECT_NO_THROW(store.put(bytesOf("1234"), MediaKind::PlainText));
}

TEST(ObjectStoreTest, RejectsNonPositiveDurations) {
    EXPECT_THROW(ObjectStore(std::chrono::milliseconds(0), std::chrono::seconds(1)), std::invalid_argument);
    EXPECT_THROW(ObjectStore(std::chrono::seconds(1), std::chrono::milliseconds(0)), std::invalid_argument);
}

TEST(ObjectStoreTest, LiveIdIsNeverReused) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::seconds(1));
    int calls = 0;
    store.setIdGenerator([&calls] {
        ++calls;
        return calls < 3 ? std::string("same-id") : std::string("other-id");
    });
    EXPECT_EQ(store.put(bytesOf("1"), MediaKind::PlainText), "same-id");
    EXPECT_EQ(store.put(bytesOf("2"), MediaKind::PlainText), "other-id");
    EXPECT_EQ(calls, 3);
}

TEST(ObjectStoreTest, ReclamationThreadEvictsExpiredObjects) {
    ObjectStore store(std::chrono::milliseconds(30), std::chrono::milliseconds(10));
    store.startReclamation();
    EXPECT_TRUE(store.isReclaiming());
    store.put(bytesOf("short-lived"), MediaKind::PlainText);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (store.size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(store.size(), (size_t)0);
    store.stopReclamation();
    EXPECT_FALSE(store.isReclaiming());
}

TEST(ObjectStoreTest, RacingStartAndStopLeaveAConsistentState) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::milliseconds(1));

    const int threads = 6;
    const int rounds = 40;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&store, t] {
            for (int i = 0; i < rounds; ++i) {
                if ((t + i) % 2 == 0) {
                    store.startReclamation();
                } else {
                    store.stopReclamation();
                }
            }
        });
    }
    for (auto &w : workers) {
        w.join();
    }

    // Whatever the interleaving, one more cycle still starts and joins cleanly.
    store.stopReclamation();
    EXPECT_FALSE(store.isReclaiming());
    store.startReclamation();
    EXPECT_TRUE(store.isReclaiming());
    store.stopReclamation();
    EXPECT_FALSE(store.isReclaiming());
}

TEST(ObjectStoreTest, ConcurrentPutsAndReadsDuringSweep) {
    ObjectStore store(std::chrono::seconds(60), std::chrono::milliseconds(1));
    store.startReclamation();

    const int threads = 4;
    const int perThread = 50;
    std::vector<std::vector<std::string>> ids(threads);
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < perThread; ++i) {
                std::string payload = "t" + std::to_string(t) + "-" + std::to_string(i);
                std::string id = store.put(bytesOf(payload), MediaKind::PlainText);
                auto object = store.get(id);
                if (std::string(object->bytes.begin(), object->bytes.end()) != payload) {
                    ++failures;
                }
                ids[t].push_back(id);
            }
        });
    }
    for (auto &w : workers) {
        w.join();
    }
    store.stopReclamation();

    std::set<std::string> unique;
    for (const auto &list : ids) {
        unique.insert(list.begin(), list.end());
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(unique.size(), (size_t)(threads * perThread));
    EXPECT_EQ(store.size(), (size_t)(threads * perThread));
}

} // anonymous namespace

#endif // DOCSANITIZER_TEST_UNIT_TEST_OBJECT_STORE_HPP

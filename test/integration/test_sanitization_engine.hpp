#ifndef DOCSANITIZER_TEST_INTEGRATION_TEST_SANITIZATION_ENGINE_HPP
#define DOCSANITIZER_TEST_INTEGRATION_TEST_SANITIZATION_ENGINE_HPP

// test/integration/test_sanitization_engine.hpp
// -----------------------------------------------------------
// The engine end to end: object store, profile store, extraction, chunking
// and in-process model doubles.

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/errors.hpp"
#include "extract/format_extractors.hpp"
#include "policy/policy_resolver.hpp"
#include "policy/profile_store.hpp"
#include "sanitize/sanitization_engine.hpp"
#include "store/object_store.hpp"
#include "support/fake_backends.hpp"

namespace {

using docsanitizer::core::BackendUnavailableError;
using docsanitizer::core::DocumentUnavailableError;
using docsanitizer::core::ExtractionFailedError;
using docsanitizer::core::MediaKind;
using docsanitizer::core::PartialSanitizationFailureError;
using docsanitizer::core::ProfileNotFoundError;
using docsanitizer::core::TimeoutError;
using docsanitizer::policy::PiiCategory;
using docsanitizer::policy::PolicyResolver;
using docsanitizer::policy::ProfileStore;
using docsanitizer::sanitize::EngineOptions;
using docsanitizer::sanitize::InvalidCompletionError;
using docsanitizer::sanitize::SanitizationEngine;
using docsanitizer::sanitize::SanitizationResult;
using docsanitizer::store::ObjectStore;
namespace fakes = docsanitizer::test;

class EngineScenarioTest : public ::testing::Test
{
protected:
    EngineScenarioTest()
        : profiles(":memory:")
        , resolver(profiles)
        , store(std::chrono::seconds(60), std::chrono::seconds(1), 0, [this] {
            return epoch + std::chrono::milliseconds(clockOffsetMs.load());
        })
    {
    }

    std::string upload(const std::string &content, MediaKind kind = MediaKind::PlainText)
    {
        return store.put(std::vector<uint8_t>(content.begin(), content.end()), kind, "upload");
    }

    EngineOptions quickOptions() const
    {
        EngineOptions options;
        options.backoff.initialDelay = std::chrono::milliseconds(1);
        options.requestTimeout = std::chrono::seconds(20);
        return options;
    }

    std::shared_ptr<fakes::RecordingDelay> noSleep = std::make_shared<fakes::RecordingDelay>();
    ObjectStore::Clock::time_point epoch = ObjectStore::Clock::now();
    std::atomic<int64_t> clockOffsetMs{0};
    ProfileStore profiles;
    PolicyResolver resolver;
    ObjectStore store;
};

TEST_F(EngineScenarioTest, DeletesNamesAndEmailsPerProfile) {
    profiles.createProfile("strict");
    profiles.updateProfile("strict", {{"person_name", "delete"}, {"email", "delete"}});

    fakes::ReplacingBackend backend({{"Jane Doe", "[NAME_REMOVED]"}, {"jane@example.com", "[EMAIL_REMOVED]"}});
    SanitizationEngine engine(store, resolver, backend, quickOptions(), noSleep);

    std::string id = upload("Meeting notes\nJane Doe emailed jane@example.com about the budget.\n");
    SanitizationResult result = engine.sanitize(id, "strict");

    EXPECT_EQ(result.text, "Meeting notes\n[NAME_REMOVED] emailed [EMAIL_REMOVED] about the budget.\n");
    EXPECT_EQ(result.countFor(PiiCategory::PersonName), (size_t)1);
    EXPECT_EQ(result.countFor(PiiCategory::Email), (size_t)1);
    EXPECT_EQ(result.countFor(PiiCategory::Phone), (size_t)0);
    EXPECT_EQ(result.actionCounts.size(), (size_t)8);
    EXPECT_EQ(result.chunkCount, (size_t)1);
    EXPECT_EQ(result.profileName, "strict");
    EXPECT_EQ(result.modelName, "fake-model");
    EXPECT_FALSE(result.timestamp.empty());

    // The prompt carried the profile's rules.
    auto prompts = backend.prompts();
    ASSERT_EQ(prompts.size(), (size_t)1);
    EXPECT_NE(prompts[0].find("Person names: DELETE"), std::string::npos);
    EXPECT_NE(prompts[0].find("Email addresses: DELETE"), std::string::npos);

    // Deleted after a successful run.
    EXPECT_FALSE(store.contains(id));
}

TEST_F(EngineScenarioTest, ExpiredDocumentIsUnavailable) {
    fakes::EchoBackend backend;
    SanitizationEngine engine(store, resolver, backend, quickOptions(), noSleep);

    std::string id = upload("Jane Doe");
    clockOffsetMs += 61000;

    try {
        engine.sanitize(id, "default");
        FAIL() << "expected DocumentUnavailableError";
    } catch (const DocumentUnavailableError &ex) {
        EXPECT_EQ(ex.objectId(), id);
        EXPECT_EQ(ex.stage(), docsanitizer::core::FailureStage::Store);
    }
    EXPECT_EQ(backend.calls(), (size_t)0);
}

TEST_F(EngineScenarioTest, UnknownProfileFailsBeforeTouchingTheStore) {
    fakes::EchoBackend backend;
    SanitizationEngine engine(store, resolver, backend, quickOptions(), noSleep);
    std::string id = upload("Jane Doe");

    EXPECT_THROW(engine.sanitize(id, "nonexistent"), ProfileNotFoundError);
    EXPECT_EQ(store.stats().reads, (uint64_t)0);
    EXPECT_TRUE(store.contains(id));
    EXPECT_EQ(backend.calls(), (size_t)0);
}

TEST_F(EngineScenarioTest, ChunkThatNeverValidatesFailsWholeRequest) {
    fakes::FunctionBackend backend([](const std::string &chunk, const std::string &prompt) {
        return fakes::ordinalOf(prompt) == 2 ? std::string() : chunk;
    });
    EngineOptions options = quickOptions();
    options.maxChunkChars = 11;
    options.chunkRetryCount = 2;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    std::string id = upload("first line\nsecond line\nthird line");
    try {
        engine.sanitize(id, "default");
        FAIL() << "expected PartialSanitizationFailureError";
    } catch (const PartialSanitizationFailureError &ex) {
        EXPECT_EQ(ex.ordinal(), (size_t)2);
        EXPECT_EQ(ex.chunkCount(), (size_t)3);
        EXPECT_NE(std::string(ex.what()).find("empty completion"), std::string::npos);
    }

    size_t secondChunkCalls = 0;
    for (const auto &prompt : backend.prompts()) {
        if (fakes::ordinalOf(prompt) == 2) {
            ++secondChunkCalls;
        }
    }
    EXPECT_EQ(secondChunkCalls, (size_t)3);
    // Nothing is deleted when the request fails.
    EXPECT_TRUE(store.contains(id));
}

TEST_F(EngineScenarioTest, MalformedRepliesAreRetriedAsBadOutput) {
    std::atomic<size_t> malformed{0};
    fakes::FunctionBackend recovering([&malformed](const std::string &chunk, const std::string &) {
        if (malformed++ < 2) {
            throw InvalidCompletionError("reply has no \"response\" field");
        }
        return chunk;
    });
    EngineOptions options = quickOptions();
    options.chunkRetryCount = 2;
    options.deleteAfterSanitize = false;
    SanitizationEngine engine(store, resolver, recovering, options, noSleep);

    std::string id = upload("Hello there");
    EXPECT_EQ(engine.sanitize(id, "default").text, "Hello there");
    EXPECT_EQ(recovering.calls(), (size_t)3);
    // Chunk retries, not transport backoff.
    EXPECT_TRUE(noSleep->delays().empty());

    fakes::FunctionBackend broken([](const std::string &, const std::string &) -> std::string {
        throw InvalidCompletionError("malformed reply: unterminated string");
    });
    SanitizationEngine failing(store, resolver, broken, options, noSleep);
    try {
        failing.sanitize(id, "default");
        FAIL() << "expected PartialSanitizationFailureError";
    } catch (const PartialSanitizationFailureError &ex) {
        EXPECT_EQ(ex.ordinal(), (size_t)1);
        EXPECT_NE(std::string(ex.what()).find("malformed reply"), std::string::npos);
    }
    EXPECT_EQ(broken.calls(), (size_t)3);
    EXPECT_TRUE(noSleep->delays().empty());
}

TEST_F(EngineScenarioTest, OutputKeepsDocumentOrderWhenChunksFinishOutOfOrder) {
    fakes::ReorderingBackend backend(5, std::chrono::milliseconds(20));
    EngineOptions options = quickOptions();
    options.maxChunkChars = 6;
    options.chunkFanOut = 5;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    std::string id = upload("one\ntwo\nthree\nfour\nfive");
    SanitizationResult result = engine.sanitize(id, "default");
    EXPECT_EQ(result.chunkCount, (size_t)5);
    EXPECT_EQ(result.text, "<one>\n<two>\n<three>\n<four>\n<five>");
}

TEST_F(EngineScenarioTest, RepeatedRunsGiveTheSameTally) {
    fakes::ReplacingBackend backend({{"555-0100", "[PHONE_REMOVED]"}, {"Jane", "[NAME_REMOVED]"}});
    EngineOptions options = quickOptions();
    options.deleteAfterSanitize = false;
    options.maxChunkChars = 40;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    std::string id = upload("Jane called from 555-0100.\nCall Jane back on 555-0100.\n[PHONE_REMOVED] was already there.");
    SanitizationResult first = engine.sanitize(id, "default");
    SanitizationResult second = engine.sanitize(id, "default");

    EXPECT_TRUE(store.contains(id));
    EXPECT_EQ(first.text, second.text);
    EXPECT_EQ(first.actionCounts, second.actionCounts);
    EXPECT_EQ(first.countFor(PiiCategory::Phone), (size_t)2);
    EXPECT_EQ(first.countFor(PiiCategory::PersonName), (size_t)2);
    EXPECT_GT(first.chunkCount, (size_t)1);
}

TEST_F(EngineScenarioTest, TransientBackendFailuresAreRetriedWithBackoff) {
    fakes::FlakyBackend backend(2);
    EngineOptions options = quickOptions();
    options.backoff.maxRetries = 3;
    options.backoff.initialDelay = std::chrono::milliseconds(100);
    options.backoff.multiplier = 2.0;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    std::string id = upload("Hello there");
    SanitizationResult result = engine.sanitize(id, "default");
    EXPECT_EQ(result.text, "Hello there");
    EXPECT_EQ(backend.calls(), (size_t)3);

    auto delays = noSleep->delays();
    ASSERT_EQ(delays.size(), (size_t)2);
    EXPECT_EQ(delays[0], std::chrono::milliseconds(100));
    EXPECT_EQ(delays[1], std::chrono::milliseconds(200));
}

TEST_F(EngineScenarioTest, UnreachableBackendIsReportedAfterRetries) {
    fakes::UnavailableBackend backend;
    EngineOptions options = quickOptions();
    options.backoff.maxRetries = 2;
    options.chunkFanOut = 1;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    std::string id = upload("Hello there");
    EXPECT_THROW(engine.sanitize(id, "default"), BackendUnavailableError);
    EXPECT_EQ(backend.calls(), (size_t)3);
    EXPECT_TRUE(store.contains(id));
}

TEST_F(EngineScenarioTest, SlowBackendTimesOutAndIsCancelled) {
    fakes::HangingBackend backend;
    EngineOptions options = quickOptions();
    options.requestTimeout = std::chrono::milliseconds(100);
    options.backoff.maxRetries = 0;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    std::string id = upload("Hello there");
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(engine.sanitize(id, "default"), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (backend.cancellations() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(backend.cancellations(), (size_t)1);
}

// Plain text extraction that takes its time.
class SlowTextStrategy : public docsanitizer::extract::PlainTextExtractor
{
public:
    explicit SlowTextStrategy(std::chrono::milliseconds pause)
        : pause_(pause)
    {
    }

    docsanitizer::extract::ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override
    {
        std::this_thread::sleep_for(pause_);
        return PlainTextExtractor::extract(bytes);
    }

private:
    std::chrono::milliseconds pause_;
};

TEST_F(EngineScenarioTest, SlowExtractionCountsAgainstTheTimeout) {
    fakes::EchoBackend backend;
    EngineOptions options = quickOptions();
    options.requestTimeout = std::chrono::milliseconds(50);
    SanitizationEngine engine(store, resolver, backend, options, noSleep);
    engine.extractor().registerStrategy(std::make_unique<SlowTextStrategy>(std::chrono::milliseconds(600)));

    std::string id = upload("Jane Doe");
    auto started = std::chrono::steady_clock::now();
    try {
        engine.sanitize(id, "default");
        FAIL() << "expected TimeoutError";
    } catch (const TimeoutError &ex) {
        EXPECT_EQ(ex.stage(), docsanitizer::core::FailureStage::Timeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    EXPECT_EQ(backend.calls(), (size_t)0);
    EXPECT_TRUE(store.contains(id));
}

TEST_F(EngineScenarioTest, EmptyDocumentNeedsNoModelCalls) {
    fakes::EchoBackend backend;
    SanitizationEngine engine(store, resolver, backend, quickOptions(), noSleep);

    std::string id = upload("\n\n");
    SanitizationResult result = engine.sanitize(id, "default");
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.chunkCount, (size_t)0);
    EXPECT_EQ(result.totalActions(), (size_t)0);
    EXPECT_EQ(backend.calls(), (size_t)0);
}

TEST_F(EngineScenarioTest, UnreadableDocumentIsAnExtractionFailure) {
    fakes::EchoBackend backend;
    SanitizationEngine engine(store, resolver, backend, quickOptions(), noSleep);

    std::string csv = upload("a,b\n1,2,3\n", MediaKind::DelimitedText);
    EXPECT_THROW(engine.sanitize(csv, "default"), ExtractionFailedError);

    std::string docx = upload("definitely not a zip", MediaKind::Word);
    EXPECT_THROW(engine.sanitize(docx, "default"), ExtractionFailedError);
    EXPECT_EQ(backend.calls(), (size_t)0);
}

TEST_F(EngineScenarioTest, FencedAndRefusedCompletionsAreHandled) {
    std::atomic<int> calls{0};
    fakes::FunctionBackend backend([&calls](const std::string &chunk, const std::string &) {
        if (calls++ == 0) {
            return std::string("I'm sorry, but I can't help with that.");
        }
        return "```markdown\n" + chunk + "\n```";
    });
    SanitizationEngine engine(store, resolver, backend, quickOptions(), noSleep);

    std::string id = upload("name,phone\nJane,555-0100\n", MediaKind::DelimitedText);
    SanitizationResult result = engine.sanitize(id, "default");
    EXPECT_EQ(result.text, "| name | phone |\n|---|---|\n| Jane | 555-0100 |");
    EXPECT_EQ(backend.calls(), (size_t)2);
    EXPECT_EQ(result.mediaKind, MediaKind::DelimitedText);
}

TEST_F(EngineScenarioTest, ConcurrentRequestsAreIndependent) {
    fakes::ReplacingBackend backend(std::vector<std::pair<std::string, std::string>>{{"Jane", "[NAME_REMOVED]"}});
    EngineOptions options = quickOptions();
    options.maxChunkChars = 20;
    options.chunkFanOut = 2;
    SanitizationEngine engine(store, resolver, backend, options, noSleep);

    const int requests = 4;
    std::vector<std::string> ids;
    for (int i = 0; i < requests; ++i) {
        ids.push_back(upload("Doc " + std::to_string(i) + "\nJane wrote this.\nJane signed it."));
    }

    std::vector<std::string> texts(requests);
    std::vector<std::thread> callers;
    for (int i = 0; i < requests; ++i) {
        callers.emplace_back([&, i] { texts[i] = engine.sanitize(ids[i], "default").text; });
    }
    for (auto &t : callers) {
        t.join();
    }
    for (int i = 0; i < requests; ++i) {
        EXPECT_EQ(texts[i], "Doc " + std::to_string(i) + "\n[NAME_REMOVED] wrote this.\n[NAME_REMOVED] signed it.");
    }
    EXPECT_EQ(store.size(), (size_t)0);
}

TEST(SanitizationEngineSetupTest, ZeroFanOutIsRejected) {
    ProfileStore profiles(":memory:");
    PolicyResolver resolver(profiles);
    ObjectStore store(std::chrono::seconds(60), std::chrono::seconds(1));
    fakes::EchoBackend backend;
    EngineOptions options;
    options.chunkFanOut = 0;
    EXPECT_THROW((SanitizationEngine{store, resolver, backend, options}), std::invalid_argument);
}

} // anonymous namespace

#endif // DOCSANITIZER_TEST_INTEGRATION_TEST_SANITIZATION_ENGINE_HPP

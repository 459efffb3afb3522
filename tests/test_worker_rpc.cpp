/**
 * Tests for the worker RPC layer: message channel semantics, progress
 * routing through callback tokens, error marshalling, cooperative
 * interleaving of calls and shutdown behavior.
 */

#include <gtest/gtest.h>
#include "worker_rpc.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace snpmatch;
using namespace snpmatch::test_support;

namespace {

template <typename T>
ErrorKind rejection_kind(std::future<T>& future) {
    try {
        future.get();
    } catch (const SNPMatcherError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected the call to be rejected";
    return ErrorKind::INTERNAL_ERROR;
}

std::shared_ptr<FakeTransport> transport_with(int snp_count) {
    return std::make_shared<FakeTransport>(build_image(numbered_snps(snp_count)), 2048);
}

/**
 * Pop the next reply, failing the test instead of hanging forever
 */
Reply next_reply(MessageChannel<Reply>& replies) {
    for (int i = 0; i < 500; ++i) {
        if (auto reply = replies.try_pop()) return std::move(*reply);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    throw std::runtime_error("timed out waiting for a reply");
}

} // anonymous namespace

// ============================================================================
// MessageChannel
// ============================================================================

TEST(MessageChannel, DeliversInOrder) {
    MessageChannel<int> channel;
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    EXPECT_TRUE(channel.push(3));
    EXPECT_EQ(channel.size(), 3u);

    EXPECT_EQ(channel.pop().value_or(0), 1);
    EXPECT_EQ(channel.try_pop().value_or(0), 2);
    EXPECT_EQ(channel.pop().value_or(0), 3);
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(MessageChannel, CloseDrainsThenEnds) {
    MessageChannel<std::string> channel;
    channel.push("last");
    channel.close();

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.push("rejected"));
    EXPECT_EQ(channel.pop().value_or(""), "last");
    EXPECT_FALSE(channel.pop().has_value());
}

TEST(MessageChannel, CloseWakesBlockedReader) {
    MessageChannel<int> channel;
    std::optional<int> result = 42;

    std::thread reader([&] { result = channel.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    reader.join();

    EXPECT_FALSE(result.has_value());
}

TEST(RemoteError, RebuildsExceptionWithKind) {
    SNPMatcherError error = to_exception(RemoteError{ErrorKind::STREAM_UNREADABLE, "cut off"});
    EXPECT_EQ(error.kind(), ErrorKind::STREAM_UNREADABLE);
    EXPECT_STREQ(error.what(), "cut off");
}

// ============================================================================
// MatcherClient
// ============================================================================

TEST(MatcherClient, LoadReportsProgressThenResolves) {
    auto transport = transport_with(200);
    MatcherClient client(EngineConfig(), transport);

    std::vector<double> progress;
    client.load_database("https://example.org/snps.db",
                         [&](double p) { progress.push_back(p); }).get();

    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.front(), 0.0);
    EXPECT_DOUBLE_EQ(progress.back(), 100.0);
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GT(progress[i], progress[i - 1]);
    }

    EXPECT_EQ(client.pending_calls(), 0u);
    EXPECT_EQ(client.registered_callbacks(), 0u);
}

TEST(MatcherClient, MatchProgressArrivesBeforeResult) {
    EngineConfig config;
    config.batch_size = 500;
    MatcherClient client(config, transport_with(1200));
    client.load_database("db").get();

    std::vector<std::pair<size_t, size_t>> progress;
    auto matches = client.match_snps(numbered_genotypes(1200),
        [&](size_t processed, size_t total) { progress.emplace_back(processed, total); }).get();

    EXPECT_EQ(matches.size(), 1200u);
    std::vector<std::pair<size_t, size_t>> expected = {{500, 1200}, {1000, 1200}, {1200, 1200}};
    EXPECT_EQ(progress, expected);
    EXPECT_EQ(client.registered_callbacks(), 0u);
}

TEST(MatcherClient, SearchAndStats) {
    MatcherClient client(EngineConfig(), transport_with(30));
    client.load_database("db").get();

    FilterCriteria criteria;
    criteria.search_term = "rs2";
    criteria.limit = 5;
    SearchResult result = client.search_snps(criteria).get();
    EXPECT_EQ(result.total, 11);  // rs2, rs20..rs29
    EXPECT_EQ(result.results.size(), 5u);

    EXPECT_EQ(client.get_database_stats().get().total_snps, 30);
}

TEST(MatcherClient, ErrorsKeepTheirKind) {
    auto transport = transport_with(5);
    MatcherClient client(EngineConfig(), transport);

    auto search = client.search_snps(FilterCriteria());
    EXPECT_EQ(rejection_kind(search), ErrorKind::STORE_NOT_LOADED);

    auto match = client.match_snps(numbered_genotypes(2));
    EXPECT_EQ(rejection_kind(match), ErrorKind::STORE_NOT_LOADED);

    transport->fail_with(ErrorKind::SOURCE_UNAVAILABLE, 1);
    std::vector<double> progress;
    auto load = client.load_database("db", [&](double p) { progress.push_back(p); });
    EXPECT_EQ(rejection_kind(load), ErrorKind::SOURCE_UNAVAILABLE);
    EXPECT_EQ(client.registered_callbacks(), 0u);

    // The failure did not install anything; a retry succeeds
    client.load_database("db").get();
    EXPECT_EQ(client.get_database_stats().get().total_snps, 5);
}

TEST(MatcherClient, ThrowingCallbackDoesNotBreakTheCall) {
    MatcherClient client(EngineConfig(), transport_with(10));

    auto load = client.load_database("db", [](double) {
        throw std::runtime_error("callback failure");
    });
    EXPECT_NO_THROW(load.get());
    EXPECT_EQ(client.get_database_stats().get().total_snps, 10);
}

TEST(MatcherClient, ConcurrentCallsAllComplete) {
    MatcherClient client(EngineConfig(), transport_with(100));
    client.load_database("db").get();

    std::vector<std::future<DatabaseStats>> stats;
    std::vector<std::future<std::vector<MatchedSNP>>> matches;
    for (int i = 0; i < 10; ++i) {
        stats.push_back(client.get_database_stats());
        matches.push_back(client.match_snps(numbered_genotypes(10, i * 10 + 1)));
    }

    for (auto& f : stats) EXPECT_EQ(f.get().total_snps, 100);
    for (auto& f : matches) EXPECT_EQ(f.get().size(), 10u);
    EXPECT_EQ(client.pending_calls(), 0u);
}

TEST(MatcherClient, ShutdownFinishesQueuedWorkThenRejects) {
    EngineConfig config;
    config.batch_size = 1;
    MatcherClient client(config, transport_with(50));
    client.load_database("db").get();

    auto queued = client.match_snps(numbered_genotypes(50));
    client.shutdown();

    EXPECT_EQ(queued.get().size(), 50u);

    auto late = client.get_database_stats();
    EXPECT_EQ(rejection_kind(late), ErrorKind::WORKER_UNAVAILABLE);

    std::vector<double> progress;
    auto late_load = client.load_database("db", [&](double p) { progress.push_back(p); });
    EXPECT_EQ(rejection_kind(late_load), ErrorKind::WORKER_UNAVAILABLE);
    EXPECT_TRUE(progress.empty());
    EXPECT_EQ(client.registered_callbacks(), 0u);

    // Idempotent
    client.shutdown();
}

TEST(MatcherClient, DestructorWaitsForWork) {
    std::future<std::vector<MatchedSNP>> result;
    {
        EngineConfig config;
        config.batch_size = 3;
        MatcherClient client(config, transport_with(20));
        client.load_database("db").get();
        result = client.match_snps(numbered_genotypes(20));
    }
    EXPECT_EQ(result.get().size(), 20u);
}

// ============================================================================
// MatcherWorker
// ============================================================================

TEST(MatcherWorker, LoadYieldsWhileDownloading) {
    std::promise<void> gate;
    auto transport = transport_with(20);
    transport->set_gate(gate.get_future().share());
    MatcherWorker worker(EngineConfig(), transport);

    worker.requests().push(Request{1, LoadDatabaseRequest{"db", CallbackToken(4)}});
    worker.requests().push(Request{2, DatabaseStatsRequest{}});

    // The held download does not keep the stats call waiting
    std::vector<double> load_progress;
    while (true) {
        Reply reply = next_reply(worker.replies());
        if (auto* progress = std::get_if<ProgressReply>(&reply)) {
            EXPECT_EQ(progress->token, 4u);
            load_progress.push_back(std::get<LoadProgressArgs>(progress->args).percent);
            continue;
        }
        const auto& completion = std::get<CompletionReply>(reply);
        ASSERT_EQ(completion.id, 2u);
        ASSERT_TRUE(completion.error.has_value());
        EXPECT_EQ(completion.error->kind, ErrorKind::STORE_NOT_LOADED);
        break;
    }
    EXPECT_EQ(load_progress, (std::vector<double>{0.0, 10.0, 30.0}));

    gate.set_value();
    while (true) {
        Reply reply = next_reply(worker.replies());
        if (auto* progress = std::get_if<ProgressReply>(&reply)) {
            load_progress.push_back(std::get<LoadProgressArgs>(progress->args).percent);
            continue;
        }
        const auto& completion = std::get<CompletionReply>(reply);
        EXPECT_EQ(completion.id, 1u);
        EXPECT_FALSE(completion.error.has_value());
        break;
    }
    EXPECT_DOUBLE_EQ(load_progress.back(), 100.0);
    for (size_t i = 1; i < load_progress.size(); ++i) {
        EXPECT_GT(load_progress[i], load_progress[i - 1]);
    }

    worker.stop();
    EXPECT_TRUE(worker.replies().closed());
}

TEST(MatcherWorker, MatchYieldsBetweenBatches) {
    const size_t keys = 2000;
    EngineConfig config;
    config.batch_size = 1;
    MatcherWorker worker(config, transport_with(static_cast<int>(keys)));

    worker.requests().push(Request{1, LoadDatabaseRequest{"db", std::nullopt}});
    Reply reply = next_reply(worker.replies());
    ASSERT_TRUE(std::holds_alternative<CompletionReply>(reply));
    ASSERT_FALSE(std::get<CompletionReply>(reply).error.has_value());

    worker.requests().push(Request{2, MatchSNPsRequest{numbered_genotypes(static_cast<int>(keys)), CallbackToken(7)}});
    worker.requests().push(Request{3, DatabaseStatsRequest{}});

    // The match takes the first slice; the stats call runs between two batches
    reply = next_reply(worker.replies());
    ASSERT_TRUE(std::holds_alternative<ProgressReply>(reply));
    EXPECT_EQ(std::get<ProgressReply>(reply).token, 7u);
    auto args = std::get<MatchProgressArgs>(std::get<ProgressReply>(reply).args);
    EXPECT_EQ(args.processed, 1u);
    EXPECT_EQ(args.total, keys);

    size_t last_processed = 1;
    bool stats_done = false;
    while (true) {
        reply = next_reply(worker.replies());
        if (auto* progress = std::get_if<ProgressReply>(&reply)) {
            size_t processed = std::get<MatchProgressArgs>(progress->args).processed;
            EXPECT_EQ(processed, last_processed + 1);
            last_processed = processed;
            continue;
        }
        const auto& completion = std::get<CompletionReply>(reply);
        if (completion.id == 3) {
            EXPECT_EQ(std::get<DatabaseStats>(completion.value).total_snps, static_cast<int64_t>(keys));
            stats_done = true;
            continue;
        }
        ASSERT_EQ(completion.id, 2u);
        EXPECT_EQ(std::get<std::vector<MatchedSNP>>(completion.value).size(), keys);
        break;
    }

    EXPECT_TRUE(stats_done);
    EXPECT_EQ(last_processed, keys);

    worker.stop();
    EXPECT_TRUE(worker.replies().closed());
}

TEST(MatcherWorker, FailuresBecomeErrorReplies) {
    MatcherWorker worker(EngineConfig(), transport_with(5));

    worker.requests().push(Request{9, SearchSNPsRequest{FilterCriteria()}});
    Reply reply = next_reply(worker.replies());

    ASSERT_TRUE(std::holds_alternative<CompletionReply>(reply));
    const auto& completion = std::get<CompletionReply>(reply);
    EXPECT_EQ(completion.id, 9u);
    ASSERT_TRUE(completion.error.has_value());
    EXPECT_EQ(completion.error->kind, ErrorKind::STORE_NOT_LOADED);
}

TEST(MatcherWorker, StopRefusesNewRequests) {
    MatcherWorker worker(EngineConfig(), transport_with(5));
    worker.stop();
    EXPECT_FALSE(worker.requests().push(Request{1, DatabaseStatsRequest{}}));
    EXPECT_FALSE(worker.replies().pop().has_value());
}

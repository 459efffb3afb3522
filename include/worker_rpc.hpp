/**
 * Worker RPC
 *
 * Runs a SNPMatcherEngine on a dedicated worker thread and exposes it to the
 * calling thread as asynchronous calls returning std::future.
 *
 * Requests and replies cross the boundary as messages on two FIFO channels.
 * A progress callback never crosses: the client keeps it in a table under a
 * token and sends the token; the worker answers with {token, args} messages
 * which the client's dispatcher thread routes back to the callback. A call's
 * progress messages always precede its completion message.
 *
 * The worker is a single cooperative executor. Calls are queued in arrival
 * order; a load yields back to the queue as its download arrives and a match
 * after every batch, so other calls run in between.
 */

#ifndef WORKER_RPC_HPP
#define WORKER_RPC_HPP

#include "snp_matcher.hpp"
#include "message_channel.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace snpmatch {

// ============================================================================
// Wire messages
// ============================================================================

using CallId = uint64_t;
using CallbackToken = uint64_t;

struct LoadDatabaseRequest {
    std::string location;
    std::optional<CallbackToken> progress;
};

struct MatchSNPsRequest {
    std::vector<UserGenotype> genotypes;
    std::optional<CallbackToken> progress;
};

struct SearchSNPsRequest {
    FilterCriteria criteria;
};

struct DatabaseStatsRequest {};

using RequestBody = std::variant<LoadDatabaseRequest, MatchSNPsRequest,
                                 SearchSNPsRequest, DatabaseStatsRequest>;

struct Request {
    CallId id = 0;
    RequestBody body;
};

struct LoadProgressArgs {
    double percent = 0.0;
};

struct MatchProgressArgs {
    size_t processed = 0;
    size_t total = 0;
};

using ProgressArgs = std::variant<LoadProgressArgs, MatchProgressArgs>;

/**
 * Marshalled form of a failure
 */
struct RemoteError {
    ErrorKind kind = ErrorKind::INTERNAL_ERROR;
    std::string message;
};

using ReplyValue = std::variant<std::monostate, std::vector<MatchedSNP>,
                                SearchResult, DatabaseStats>;

struct ProgressReply {
    CallbackToken token = 0;
    ProgressArgs args;
};

struct CompletionReply {
    CallId id = 0;
    std::optional<RemoteError> error;
    ReplyValue value;
};

using Reply = std::variant<ProgressReply, CompletionReply>;

/**
 * Rebuild the exception for a marshalled failure
 */
SNPMatcherError to_exception(const RemoteError& error);

// ============================================================================
// Worker (execution context)
// ============================================================================

/**
 * Owns the engine and services requests on its own thread
 */
class MatcherWorker {
public:
    MatcherWorker(EngineConfig config, std::shared_ptr<Transport> transport = nullptr);

    /**
     * Closes the request channel and joins the worker thread
     */
    ~MatcherWorker();

    MatcherWorker(const MatcherWorker&) = delete;
    MatcherWorker& operator=(const MatcherWorker&) = delete;

    MessageChannel<Request>& requests() { return requests_; }
    MessageChannel<Reply>& replies() { return replies_; }

    /**
     * Stop accepting requests, finish queued work, and join.
     * The reply channel is closed once the last reply is sent.
     */
    void stop();

private:
    class Task;
    class SingleStepTask;
    class LoadTask;
    class MatchTask;

    void run();
    std::unique_ptr<Task> make_task(Request request);

    SNPMatcherEngine engine_;
    MessageChannel<Request> requests_;
    MessageChannel<Reply> replies_;
    std::thread thread_;
    std::mutex stop_mutex_;
};

// ============================================================================
// Client (calling context)
// ============================================================================

/**
 * Asynchronous proxy for a MatcherWorker
 *
 * Every call resolves or rejects exactly once. Rejections rethrow an
 * SNPMatcherError with the worker-side kind and message. Callbacks run on
 * the client's dispatcher thread; they must not destroy the client.
 */
class MatcherClient {
public:
    explicit MatcherClient(EngineConfig config = EngineConfig(),
                           std::shared_ptr<Transport> transport = nullptr);
    ~MatcherClient();

    MatcherClient(const MatcherClient&) = delete;
    MatcherClient& operator=(const MatcherClient&) = delete;

    /**
     * Stream and materialize the database in the worker
     */
    std::future<void> load_database(const std::string& location,
                                    LoadProgressCallback on_progress = nullptr);

    /**
     * Match genotypes; on_progress receives (processed, total) after each batch
     */
    std::future<std::vector<MatchedSNP>> match_snps(std::vector<UserGenotype> genotypes,
                                                    MatchProgressCallback on_progress = nullptr);

    std::future<SearchResult> search_snps(FilterCriteria criteria);

    std::future<DatabaseStats> get_database_stats();

    /**
     * Number of calls sent but not yet completed
     */
    size_t pending_calls() const;

    /**
     * Number of registered progress callbacks
     */
    size_t registered_callbacks() const;

    /**
     * Let queued calls finish, then stop both threads. Later calls reject
     * with WORKER_UNAVAILABLE.
     */
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace snpmatch

#endif // WORKER_RPC_HPP

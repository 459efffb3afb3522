/**
 * Worker RPC
 */

#include "worker_rpc.hpp"
#include "batch_matcher.hpp"
#include "database_loader.hpp"

#include <atomic>
#include <deque>
#include <map>

namespace snpmatch {

SNPMatcherError to_exception(const RemoteError& error) {
    return SNPMatcherError(error.kind, error.message);
}

// ============================================================================
// Worker tasks
// ============================================================================

/**
 * One queued call. advance() does one slice of work and returns true once
 * the call is finished; step() turns a thrown error into the completion.
 */
class MatcherWorker::Task {
public:
    Task(MatcherWorker& worker, CallId id) : worker_(worker), id_(id) {}
    virtual ~Task() = default;

    bool step() {
        try {
            return advance();
        } catch (const SNPMatcherError& e) {
            fail(RemoteError{e.kind(), e.what()});
        } catch (const std::exception& e) {
            fail(RemoteError{ErrorKind::INTERNAL_ERROR, e.what()});
        }
        return true;
    }

protected:
    virtual bool advance() = 0;

    void complete(ReplyValue value) {
        CompletionReply reply;
        reply.id = id_;
        reply.value = std::move(value);
        worker_.replies_.push(std::move(reply));
    }

    void fail(RemoteError error) {
        log(LogLevel::DEBUG, "Call " + std::to_string(id_) + " failed: " +
                             error_kind_to_string(error.kind) + ": " + error.message);
        CompletionReply reply;
        reply.id = id_;
        reply.error = std::move(error);
        worker_.replies_.push(std::move(reply));
    }

    void progress(CallbackToken token, ProgressArgs args) {
        worker_.replies_.push(ProgressReply{token, std::move(args)});
    }

    MatcherWorker& worker_;
    CallId id_;
};

/**
 * Runs to completion in a single slice
 */
class MatcherWorker::SingleStepTask : public MatcherWorker::Task {
public:
    using Body = std::function<ReplyValue()>;

    SingleStepTask(MatcherWorker& worker, CallId id, Body body)
        : Task(worker, id), body_(std::move(body)) {}

protected:
    bool advance() override {
        complete(body_());
        return true;
    }

private:
    Body body_;
};

/**
 * Runs one batch per slice
 */
class MatcherWorker::MatchTask : public MatcherWorker::Task {
public:
    MatchTask(MatcherWorker& worker, CallId id, MatchSNPsRequest request)
        : Task(worker, id), request_(std::move(request)) {}

protected:
    bool advance() override {
        if (!job_) {
            MatchProgressCallback on_progress;
            if (request_.progress) {
                CallbackToken token = *request_.progress;
                on_progress = [this, token](size_t processed, size_t total) {
                    progress(token, MatchProgressArgs{processed, total});
                };
            }
            job_ = worker_.engine_.start_match(std::move(request_.genotypes), std::move(on_progress));
        }

        if (!job_->done()) {
            job_->step();
        }

        if (job_->done()) {
            complete(job_->take_results());
            return true;
        }
        return false;
    }

private:
    MatchSNPsRequest request_;
    std::unique_ptr<BatchMatchJob> job_;
};

/**
 * Consumes the download as it arrives, one slice per step
 */
class MatcherWorker::LoadTask : public MatcherWorker::Task {
public:
    LoadTask(MatcherWorker& worker, CallId id, LoadDatabaseRequest request)
        : Task(worker, id), request_(std::move(request)) {}

protected:
    bool advance() override {
        if (!started_) {
            started_ = true;
            LoadProgressCallback on_progress;
            if (request_.progress) {
                CallbackToken token = *request_.progress;
                on_progress = [this, token](double percent) {
                    progress(token, LoadProgressArgs{percent});
                };
            }
            job_ = worker_.engine_.start_load(request_.location, std::move(on_progress));
            if (!job_) {
                complete(std::monostate());
                return true;
            }
        }

        job_->step();

        if (job_->done()) {
            worker_.engine_.finish_load(*job_);
            complete(std::monostate());
            return true;
        }
        return false;
    }

private:
    LoadDatabaseRequest request_;
    bool started_ = false;
    std::unique_ptr<DatabaseLoadJob> job_;
};

// ============================================================================
// MatcherWorker
// ============================================================================

MatcherWorker::MatcherWorker(EngineConfig config, std::shared_ptr<Transport> transport)
    : engine_(std::move(config), std::move(transport)) {
    thread_ = std::thread(&MatcherWorker::run, this);
}

MatcherWorker::~MatcherWorker() {
    stop();
}

void MatcherWorker::stop() {
    requests_.close();
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::unique_ptr<MatcherWorker::Task> MatcherWorker::make_task(Request request) {
    CallId id = request.id;

    if (auto* load = std::get_if<LoadDatabaseRequest>(&request.body)) {
        return std::make_unique<LoadTask>(*this, id, std::move(*load));
    }

    if (auto* match = std::get_if<MatchSNPsRequest>(&request.body)) {
        return std::make_unique<MatchTask>(*this, id, std::move(*match));
    }

    if (auto* search = std::get_if<SearchSNPsRequest>(&request.body)) {
        FilterCriteria criteria = std::move(search->criteria);
        return std::make_unique<SingleStepTask>(*this, id,
            [this, criteria]() -> ReplyValue {
                return engine_.search_snps(criteria);
            });
    }

    return std::make_unique<SingleStepTask>(*this, id,
        [this]() -> ReplyValue {
            return engine_.get_database_stats();
        });
}

void MatcherWorker::run() {
    std::deque<std::unique_ptr<Task>> ready;

    while (true) {
        if (ready.empty()) {
            auto request = requests_.pop();
            if (!request) break;
            ready.push_back(make_task(std::move(*request)));
        }

        // Newly arrived calls queue behind the ones already running
        while (auto request = requests_.try_pop()) {
            ready.push_back(make_task(std::move(*request)));
        }

        std::unique_ptr<Task> task = std::move(ready.front());
        ready.pop_front();
        if (!task->step()) {
            ready.push_back(std::move(task));
        }
    }

    log(LogLevel::DEBUG, "Matcher worker stopped");
    replies_.close();
}

// ============================================================================
// MatcherClient
// ============================================================================

namespace {

template <typename T>
void settle(std::promise<T>& promise, CompletionReply& reply) {
    if (reply.error) {
        promise.set_exception(std::make_exception_ptr(to_exception(*reply.error)));
        return;
    }
    if (auto* value = std::get_if<T>(&reply.value)) {
        promise.set_value(std::move(*value));
        return;
    }
    promise.set_exception(std::make_exception_ptr(
        SNPMatcherError(ErrorKind::INTERNAL_ERROR, "Unexpected reply type")));
}

void settle(std::promise<void>& promise, CompletionReply& reply) {
    if (reply.error) {
        promise.set_exception(std::make_exception_ptr(to_exception(*reply.error)));
        return;
    }
    promise.set_value();
}

} // anonymous namespace

struct MatcherClient::Impl {
    using Completion = std::function<void(CompletionReply&)>;
    using ProgressHandler = std::function<void(const ProgressArgs&)>;

    struct PendingCall {
        std::optional<CallbackToken> token;
        Completion complete;
    };

    MatcherWorker worker;
    std::thread dispatcher;

    mutable std::mutex mutex;
    std::map<CallId, PendingCall> pending;
    std::map<CallbackToken, ProgressHandler> callbacks;
    bool stopped = false;

    std::atomic<CallId> next_id{1};
    std::atomic<CallbackToken> next_token{1};

    Impl(EngineConfig config, std::shared_ptr<Transport> transport)
        : worker(std::move(config), std::move(transport)) {
        dispatcher = std::thread(&Impl::dispatch, this);
    }

    CallbackToken register_callback(ProgressHandler handler) {
        CallbackToken token = next_token++;
        std::lock_guard<std::mutex> lock(mutex);
        callbacks[token] = std::move(handler);
        return token;
    }

    static CompletionReply unavailable(CallId id) {
        CompletionReply reply;
        reply.id = id;
        reply.error = RemoteError{ErrorKind::WORKER_UNAVAILABLE, "Matcher worker is not running"};
        return reply;
    }

    void submit(RequestBody body, std::optional<CallbackToken> token, Completion complete) {
        CallId id = next_id++;
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!stopped) {
                pending[id] = PendingCall{token, complete};
                accepted = true;
            } else if (token) {
                callbacks.erase(*token);
            }
        }

        if (accepted && worker.requests().push(Request{id, std::move(body)})) {
            return;
        }

        if (accepted) {
            std::lock_guard<std::mutex> lock(mutex);
            if (token) callbacks.erase(*token);
            // Already rejected by the dispatcher if the worker closed meanwhile
            if (pending.erase(id) == 0) return;
        }
        CompletionReply reply = unavailable(id);
        complete(reply);
    }

    void on_progress(const ProgressReply& reply) {
        ProgressHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = callbacks.find(reply.token);
            if (it == callbacks.end()) {
                log(LogLevel::DEBUG, "Dropping progress for unknown token " + std::to_string(reply.token));
                return;
            }
            handler = it->second;
        }

        try {
            handler(reply.args);
        } catch (const std::exception& e) {
            log(LogLevel::ERROR, "Progress callback failed: " + std::string(e.what()));
        }
    }

    void on_completion(CompletionReply& reply) {
        Completion complete;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = pending.find(reply.id);
            if (it == pending.end()) {
                log(LogLevel::WARNING, "Completion for unknown call " + std::to_string(reply.id));
                return;
            }
            if (it->second.token) callbacks.erase(*it->second.token);
            complete = std::move(it->second.complete);
            pending.erase(it);
        }
        complete(reply);
    }

    void dispatch() {
        while (auto reply = worker.replies().pop()) {
            if (auto* progress = std::get_if<ProgressReply>(&*reply)) {
                on_progress(*progress);
            } else if (auto* completion = std::get_if<CompletionReply>(&*reply)) {
                on_completion(*completion);
            }
        }

        // Worker is gone; nothing left can complete
        std::map<CallId, PendingCall> orphaned;
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopped = true;
            orphaned.swap(pending);
            callbacks.clear();
        }
        for (auto& entry : orphaned) {
            CompletionReply reply = unavailable(entry.first);
            entry.second.complete(reply);
        }
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopped = true;
        }
        worker.stop();
        if (dispatcher.joinable() && dispatcher.get_id() != std::this_thread::get_id()) {
            dispatcher.join();
        }
    }
};

MatcherClient::MatcherClient(EngineConfig config, std::shared_ptr<Transport> transport)
    : pimpl_(std::make_unique<Impl>(std::move(config), std::move(transport))) {}

MatcherClient::~MatcherClient() {
    pimpl_->shutdown();
}

std::future<void> MatcherClient::load_database(const std::string& location,
                                               LoadProgressCallback on_progress) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::optional<CallbackToken> token;
    if (on_progress) {
        token = pimpl_->register_callback([on_progress](const ProgressArgs& args) {
            if (auto* load = std::get_if<LoadProgressArgs>(&args)) {
                on_progress(load->percent);
            }
        });
    }

    pimpl_->submit(LoadDatabaseRequest{location, token}, token,
                   [promise](CompletionReply& reply) { settle(*promise, reply); });
    return future;
}

std::future<std::vector<MatchedSNP>> MatcherClient::match_snps(std::vector<UserGenotype> genotypes,
                                                               MatchProgressCallback on_progress) {
    auto promise = std::make_shared<std::promise<std::vector<MatchedSNP>>>();
    auto future = promise->get_future();

    std::optional<CallbackToken> token;
    if (on_progress) {
        token = pimpl_->register_callback([on_progress](const ProgressArgs& args) {
            if (auto* match = std::get_if<MatchProgressArgs>(&args)) {
                on_progress(match->processed, match->total);
            }
        });
    }

    pimpl_->submit(MatchSNPsRequest{std::move(genotypes), token}, token,
                   [promise](CompletionReply& reply) { settle(*promise, reply); });
    return future;
}

std::future<SearchResult> MatcherClient::search_snps(FilterCriteria criteria) {
    auto promise = std::make_shared<std::promise<SearchResult>>();
    auto future = promise->get_future();
    pimpl_->submit(SearchSNPsRequest{std::move(criteria)}, std::nullopt,
                   [promise](CompletionReply& reply) { settle(*promise, reply); });
    return future;
}

std::future<DatabaseStats> MatcherClient::get_database_stats() {
    auto promise = std::make_shared<std::promise<DatabaseStats>>();
    auto future = promise->get_future();
    pimpl_->submit(DatabaseStatsRequest{}, std::nullopt,
                   [promise](CompletionReply& reply) { settle(*promise, reply); });
    return future;
}

size_t MatcherClient::pending_calls() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->pending.size();
}

size_t MatcherClient::registered_callbacks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->callbacks.size();
}

void MatcherClient::shutdown() {
    pimpl_->shutdown();
}

} // namespace snpmatch

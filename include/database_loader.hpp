/**
 * Streaming Database Loader
 *
 * Fetches the SNP database image as a byte stream (libcurl for URLs, plain
 * file reads for local paths), reports progress while it arrives, and
 * materializes it into a DatasetStore.
 *
 * Progress phases:
 *   [0, 30)   initialization
 *   [30, 80]  download (only when the expected size is known)
 *   85        download complete
 *   90        image assembled
 *   100       database ready
 */

#ifndef DATABASE_LOADER_HPP
#define DATABASE_LOADER_HPP

#include "snp_matcher.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snpmatch {

// Progress checkpoints
constexpr double PROGRESS_START = 0.0;
constexpr double PROGRESS_ENGINE_READY = 10.0;
constexpr double PROGRESS_DOWNLOAD_START = 30.0;
constexpr double PROGRESS_DOWNLOAD_END = 80.0;
constexpr double PROGRESS_DOWNLOADED = 85.0;
constexpr double PROGRESS_ASSEMBLED = 90.0;
constexpr double PROGRESS_COMPLETE = 100.0;

/**
 * Receives a transfer as it arrives
 */
struct TransferHandler {
    // Called once before the first chunk with the announced body size, if any
    std::function<void(std::optional<uint64_t> expected_size)> on_start;
    // Called for every chunk in arrival order
    std::function<void(const char* data, size_t size)> on_chunk;
};

/**
 * Abstract byte-stream transport
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Get the transport name (e.g., "curl", "file")
     */
    virtual std::string name() const = 0;

    /**
     * Fetch a resource, streaming the body into the handler
     * @throws SNPMatcherError SOURCE_UNAVAILABLE if the fetch does not succeed,
     *         STREAM_UNREADABLE if the body cannot be consumed
     */
    virtual void fetch(const std::string& location, const TransferHandler& handler) = 0;
};

/**
 * libcurl transport for http://, https:// and file:// URLs
 */
class CurlTransport : public Transport {
public:
    /**
     * @param connect_timeout_ms Connection timeout (0 = libcurl default)
     * @param transfer_timeout_ms Whole-transfer timeout (0 = none)
     * @param user_agent User-Agent header value
     */
    CurlTransport(long connect_timeout_ms = 30000,
                  long transfer_timeout_ms = 0,
                  std::string user_agent = "snpmatch/1.0");

    std::string name() const override { return "curl"; }

    void fetch(const std::string& location, const TransferHandler& handler) override;

private:
    long connect_timeout_ms_;
    long transfer_timeout_ms_;
    std::string user_agent_;
};

/**
 * Local file transport; reads in fixed-size chunks
 */
class FileTransport : public Transport {
public:
    explicit FileTransport(size_t chunk_size = 64 * 1024);

    std::string name() const override { return "file"; }

    void fetch(const std::string& location, const TransferHandler& handler) override;

private:
    size_t chunk_size_;
};

/**
 * Check whether a location is a URL (has a scheme)
 */
bool is_url(const std::string& location);

/**
 * Create the transport suited to a location
 */
std::shared_ptr<Transport> create_transport(const std::string& location, const EngineConfig& config);

/**
 * Monotonic progress reporter
 *
 * Values are clamped to [last reported, 100]; repeated values are not re-sent.
 */
class LoadProgress {
public:
    explicit LoadProgress(LoadProgressCallback callback);

    void report(double percent);

    /**
     * Map received/expected bytes into the download range
     */
    void report_download(uint64_t received, std::optional<uint64_t> expected);

    double last() const { return last_; }

private:
    LoadProgressCallback callback_;
    double last_ = -1.0;
};

/**
 * Check for the gzip magic bytes
 */
bool is_gzip(const std::vector<unsigned char>& data);

/**
 * Inflate a gzip file, concatenating every member (bgzip output and
 * `cat a.gz b.gz` both decode to the joined payload)
 * @throws SNPMatcherError (INVALID_DATABASE_IMAGE) on corrupt or truncated
 *         data, or on trailing bytes that do not start another member
 */
std::vector<unsigned char> gunzip(const std::vector<unsigned char>& data);

// How long one DatabaseLoadJob::step() waits for the next chunk
constexpr std::chrono::milliseconds LOAD_POLL_INTERVAL(50);

/**
 * Resumable load of a database image
 *
 * The transfer runs on a helper thread and hands its chunks over a channel.
 * Each step() consumes whatever has arrived (waiting at most
 * LOAD_POLL_INTERVAL), reports download progress, and returns, so the
 * caller can interleave other work. The last step assembles and
 * materializes the image. Progress is reported on the stepping thread.
 *
 * Destroying an unfinished job aborts the transfer at its next chunk.
 */
class DatabaseLoadJob {
public:
    DatabaseLoadJob(std::shared_ptr<Transport> transport,
                    std::string location,
                    std::string table_name,
                    LoadProgressCallback on_progress);
    ~DatabaseLoadJob();

    DatabaseLoadJob(const DatabaseLoadJob&) = delete;
    DatabaseLoadJob& operator=(const DatabaseLoadJob&) = delete;

    bool done() const;

    /**
     * Advance the load by one slice
     * @throws SNPMatcherError from the transport, gzip or materialization
     */
    void step();

    /**
     * Step until done and return the store
     */
    std::shared_ptr<const DatasetStore> run();

    uint64_t received() const;
    const std::string& location() const;

    /**
     * Move the materialized store out of a finished job
     */
    std::shared_ptr<const DatasetStore> take_store();

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * Stream a database image and materialize it
 * @param transport Transport to fetch with
 * @param location URL or path passed to the transport
 * @param table_name Table the image must contain
 * @param on_progress Progress callback (may be empty)
 * @return The materialized, read-only store
 */
std::shared_ptr<const DatasetStore> load_database(
    std::shared_ptr<Transport> transport,
    const std::string& location,
    const std::string& table_name,
    const LoadProgressCallback& on_progress);

} // namespace snpmatch

#endif // DATABASE_LOADER_HPP

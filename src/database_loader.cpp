/**
 * Streaming Database Loader
 */

#include "database_loader.hpp"
#include "dataset_store.hpp"
#include "message_channel.hpp"

#include <curl/curl.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <thread>

namespace snpmatch {

// ============================================================================
// CurlTransport
// ============================================================================

namespace {

std::once_flag g_curl_init_flag;

/**
 * State shared with the libcurl write callback
 */
struct CurlTransfer {
    CURL* curl = nullptr;
    const TransferHandler* handler = nullptr;
    bool started = false;
    std::exception_ptr error;
};

std::optional<uint64_t> announced_length(CURL* curl) {
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK) {
        return std::nullopt;
    }
    if (length <= 0) return std::nullopt;
    return static_cast<uint64_t>(length);
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<CurlTransfer*>(userdata);
    size_t bytes = size * nmemb;

    try {
        if (!transfer->started) {
            transfer->started = true;
            if (transfer->handler->on_start) {
                transfer->handler->on_start(announced_length(transfer->curl));
            }
        }
        if (transfer->handler->on_chunk) {
            transfer->handler->on_chunk(ptr, bytes);
        }
    } catch (...) {
        // Rethrown after curl_easy_perform returns; returning 0 aborts the transfer
        transfer->error = std::current_exception();
        return 0;
    }

    return bytes;
}

ErrorKind classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_WRITE_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_FILESIZE_EXCEEDED:
            return ErrorKind::STREAM_UNREADABLE;
        default:
            return ErrorKind::SOURCE_UNAVAILABLE;
    }
}

/**
 * Rethrow a handler failure captured inside a transfer
 */
[[noreturn]] void rethrow_handler_error(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const SNPMatcherError&) {
        throw;
    } catch (const std::exception& e) {
        throw SNPMatcherError(ErrorKind::STREAM_UNREADABLE,
            "Response body could not be consumed: " + std::string(e.what()));
    }
}

} // anonymous namespace

CurlTransport::CurlTransport(long connect_timeout_ms, long transfer_timeout_ms, std::string user_agent)
    : connect_timeout_ms_(connect_timeout_ms),
      transfer_timeout_ms_(transfer_timeout_ms),
      user_agent_(std::move(user_agent)) {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

void CurlTransport::fetch(const std::string& location, const TransferHandler& handler) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw SNPMatcherError(ErrorKind::SOURCE_UNAVAILABLE, "Failed to initialize CURL");
    }

    CurlTransfer transfer;
    transfer.curl = curl;
    transfer.handler = &handler;

    curl_easy_setopt(curl, CURLOPT_URL, location.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    if (connect_timeout_ms_ > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    }
    if (transfer_timeout_ms_ > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, transfer_timeout_ms_);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    std::optional<uint64_t> expected = announced_length(curl);

    curl_easy_cleanup(curl);

    if (transfer.error) {
        rethrow_handler_error(transfer.error);
    }

    if (res != CURLE_OK) {
        std::string message = "Failed to load database from " + location + ": " +
                              curl_easy_strerror(res);
        if (res == CURLE_HTTP_RETURNED_ERROR && http_code > 0) {
            message += " (HTTP " + std::to_string(http_code) + ")";
        }
        throw SNPMatcherError(classify_curl_error(res), message);
    }

    // Empty bodies never reach the write callback
    if (!transfer.started && handler.on_start) {
        handler.on_start(expected);
    }
}

// ============================================================================
// FileTransport
// ============================================================================

FileTransport::FileTransport(size_t chunk_size)
    : chunk_size_(chunk_size > 0 ? chunk_size : 64 * 1024) {}

void FileTransport::fetch(const std::string& location, const TransferHandler& handler) {
    std::ifstream file(location, std::ios::binary);
    if (!file.is_open()) {
        throw SNPMatcherError(ErrorKind::SOURCE_UNAVAILABLE,
            "Cannot open database file: " + location);
    }

    std::optional<uint64_t> expected;
    std::error_code ec;
    auto size = std::filesystem::file_size(location, ec);
    if (!ec) {
        expected = static_cast<uint64_t>(size);
    }

    if (handler.on_start) handler.on_start(expected);

    std::vector<char> buffer(chunk_size_);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && handler.on_chunk) {
            handler.on_chunk(buffer.data(), static_cast<size_t>(got));
        }
    }

    if (file.bad()) {
        throw SNPMatcherError(ErrorKind::STREAM_UNREADABLE,
            "Error reading database file: " + location);
    }
}

// ============================================================================
// Transport selection
// ============================================================================

bool is_url(const std::string& location) {
    size_t scheme_end = location.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return false;
    return std::all_of(location.begin(), location.begin() + scheme_end, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

std::shared_ptr<Transport> create_transport(const std::string& location, const EngineConfig& config) {
    if (is_url(location)) {
        return std::make_shared<CurlTransport>(config.connect_timeout_ms,
                                               config.transfer_timeout_ms,
                                               config.user_agent);
    }
    return std::make_shared<FileTransport>();
}

// ============================================================================
// Progress
// ============================================================================

LoadProgress::LoadProgress(LoadProgressCallback callback)
    : callback_(std::move(callback)) {}

void LoadProgress::report(double percent) {
    percent = std::min(percent, PROGRESS_COMPLETE);
    if (percent <= last_) return;
    last_ = percent;
    if (callback_) callback_(percent);
}

void LoadProgress::report_download(uint64_t received, std::optional<uint64_t> expected) {
    if (!expected || *expected == 0) return;

    double fraction = static_cast<double>(received) / static_cast<double>(*expected);
    fraction = std::min(fraction, 1.0);
    report(PROGRESS_DOWNLOAD_START + fraction * (PROGRESS_DOWNLOAD_END - PROGRESS_DOWNLOAD_START));
}

// ============================================================================
// gzip
// ============================================================================

bool is_gzip(const std::vector<unsigned char>& data) {
    return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

std::vector<unsigned char> gunzip(const std::vector<unsigned char>& data) {
    // zlib counts input in uInt; larger images are fed in slices
    constexpr size_t MAX_SLICE = std::numeric_limits<uInt>::max();

    z_stream strm{};
    // 16 + MAX_WBITS: expect a gzip header
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR, "Cannot initialize zlib inflate");
    }

    auto fail = [&strm](const std::string& reason) {
        inflateEnd(&strm);
        throw SNPMatcherError(ErrorKind::INVALID_DATABASE_IMAGE,
            "Cannot decompress database image: " + reason);
    };

    std::vector<unsigned char> out;
    out.reserve(data.size() * 4);
    unsigned char buffer[65536];

    size_t fed = 0;      // bytes handed to zlib so far
    size_t members = 0;
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = 0;

    while (true) {
        if (strm.avail_in == 0 && fed < data.size()) {
            size_t slice = std::min(data.size() - fed, MAX_SLICE);
            strm.next_in = const_cast<Bytef*>(data.data() + fed);
            strm.avail_in = static_cast<uInt>(slice);
            fed += slice;
        }

        strm.next_out = buffer;
        strm.avail_out = sizeof(buffer);
        int rc = inflate(&strm, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR) {
            fail("truncated gzip stream");
        }
        if (rc != Z_OK && rc != Z_STREAM_END) {
            fail(strm.msg ? strm.msg : ("zlib error " + std::to_string(rc)));
        }
        out.insert(out.end(), buffer, buffer + (sizeof(buffer) - strm.avail_out));

        if (rc == Z_STREAM_END) {
            ++members;
            size_t consumed = fed - strm.avail_in;
            if (consumed == data.size()) break;

            // Anything after a member must be another member
            if (data.size() - consumed < 2 || data[consumed] != 0x1f || data[consumed + 1] != 0x8b) {
                fail(std::to_string(data.size() - consumed) + " trailing bytes after gzip member " +
                     std::to_string(members));
            }
            inflateReset(&strm);
            continue;
        }

        if (strm.avail_in == 0 && fed == data.size() && strm.avail_out != 0) {
            fail("truncated gzip stream");
        }
    }

    inflateEnd(&strm);
    if (members > 1) {
        log(LogLevel::DEBUG, "Inflated " + std::to_string(members) + " gzip members");
    }
    return out;
}

// ============================================================================
// Loader
// ============================================================================

namespace {

/**
 * What the transfer thread hands to the loader
 */
struct TransferEvent {
    bool started = false;                     // on_start, with expected_size
    std::optional<uint64_t> expected_size;
    std::vector<unsigned char> chunk;
};

} // anonymous namespace

struct DatabaseLoadJob::Impl {
    enum class Phase { START, TRANSFER, MATERIALIZE, DONE };

    std::shared_ptr<Transport> transport;
    std::string location;
    std::string table_name;
    LoadProgress progress;

    Phase phase = Phase::START;
    MessageChannel<TransferEvent> events;
    std::thread transfer_thread;
    std::exception_ptr transfer_error;   // written before events is closed

    std::vector<std::vector<unsigned char>> chunks;
    uint64_t received = 0;
    std::optional<uint64_t> expected;
    std::shared_ptr<const DatasetStore> store;

    Impl(std::shared_ptr<Transport> t, std::string loc, std::string table, LoadProgressCallback cb)
        : transport(std::move(t)), location(std::move(loc)),
          table_name(std::move(table)), progress(std::move(cb)) {}

    void start() {
        progress.report(PROGRESS_START);
        log(LogLevel::INFO, "Loading SNP database from: " + location + " (" + transport->name() + ")");

        SQLiteDatabase::initialize_library();
        progress.report(PROGRESS_ENGINE_READY);
        progress.report(PROGRESS_DOWNLOAD_START);

        transfer_thread = std::thread([this]() {
            TransferHandler handler;
            handler.on_start = [this](std::optional<uint64_t> size) {
                TransferEvent event;
                event.started = true;
                event.expected_size = size;
                events.push(std::move(event));
            };
            handler.on_chunk = [this](const char* data, size_t size) {
                TransferEvent event;
                event.chunk.assign(data, data + size);
                if (!events.push(std::move(event))) {
                    throw SNPMatcherError(ErrorKind::STREAM_UNREADABLE, "Load abandoned: " + location);
                }
            };

            try {
                transport->fetch(location, handler);
            } catch (...) {
                // Rethrown on the stepping thread
                transfer_error = std::current_exception();
            }
            events.close();
        });

        phase = Phase::TRANSFER;
    }

    void consume(TransferEvent& event) {
        if (event.started) {
            expected = event.expected_size;
            log(LogLevel::DEBUG, expected ? "Expecting " + std::to_string(*expected) + " bytes"
                                          : std::string("Content length unknown"));
            return;
        }
        received += event.chunk.size();
        chunks.push_back(std::move(event.chunk));
        progress.report_download(received, expected);
    }

    void transfer() {
        if (auto event = events.pop_for(LOAD_POLL_INTERVAL)) {
            consume(*event);
            while (auto more = events.try_pop()) {
                consume(*more);
            }
        }
        if (!events.drained()) return;

        transfer_thread.join();
        if (transfer_error) {
            std::rethrow_exception(transfer_error);
        }

        progress.report(PROGRESS_DOWNLOADED);
        log(LogLevel::INFO, "Downloaded " + std::to_string(received) + " bytes in " +
                            std::to_string(chunks.size()) + " chunks");
        phase = Phase::MATERIALIZE;
    }

    void materialize() {
        std::vector<unsigned char> image;
        image.reserve(static_cast<size_t>(received));
        for (auto& chunk : chunks) {
            image.insert(image.end(), chunk.begin(), chunk.end());
            std::vector<unsigned char>().swap(chunk);
        }
        chunks.clear();

        if (is_gzip(image)) {
            image = gunzip(image);
            log(LogLevel::INFO, "Decompressed database image to " + std::to_string(image.size()) + " bytes");
        }
        progress.report(PROGRESS_ASSEMBLED);

        auto database = std::make_shared<SQLiteDatabase>(image, table_name);
        log(LogLevel::INFO, "Database ready: " + database->description());
        store = std::move(database);

        progress.report(PROGRESS_COMPLETE);
        phase = Phase::DONE;
    }
};

DatabaseLoadJob::DatabaseLoadJob(std::shared_ptr<Transport> transport,
                                 std::string location,
                                 std::string table_name,
                                 LoadProgressCallback on_progress)
    : pimpl_(std::make_unique<Impl>(std::move(transport), std::move(location),
                                    std::move(table_name), std::move(on_progress))) {
    if (!pimpl_->transport) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR, "Load job needs a transport");
    }
}

DatabaseLoadJob::~DatabaseLoadJob() {
    // Refuse further chunks so an unfinished transfer stops early
    pimpl_->events.close();
    if (pimpl_->transfer_thread.joinable()) {
        pimpl_->transfer_thread.join();
    }
}

bool DatabaseLoadJob::done() const {
    return pimpl_->phase == Impl::Phase::DONE;
}

void DatabaseLoadJob::step() {
    switch (pimpl_->phase) {
        case Impl::Phase::START:       pimpl_->start(); break;
        case Impl::Phase::TRANSFER:    pimpl_->transfer(); break;
        case Impl::Phase::MATERIALIZE: pimpl_->materialize(); break;
        case Impl::Phase::DONE:        break;
    }
}

std::shared_ptr<const DatasetStore> DatabaseLoadJob::run() {
    while (!done()) {
        step();
    }
    return take_store();
}

uint64_t DatabaseLoadJob::received() const {
    return pimpl_->received;
}

const std::string& DatabaseLoadJob::location() const {
    return pimpl_->location;
}

std::shared_ptr<const DatasetStore> DatabaseLoadJob::take_store() {
    return std::move(pimpl_->store);
}

std::shared_ptr<const DatasetStore> load_database(
    std::shared_ptr<Transport> transport,
    const std::string& location,
    const std::string& table_name,
    const LoadProgressCallback& on_progress) {

    DatabaseLoadJob job(std::move(transport), location, table_name, on_progress);
    return job.run();
}

} // namespace snpmatch

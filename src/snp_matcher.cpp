/**
 * SNP Matcher - Embedded Query Engine
 */

#include "snp_matcher.hpp"
#include "batch_matcher.hpp"
#include "database_loader.hpp"
#include "dataset_store.hpp"
#include "filter_query.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace snpmatch {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_level = level;
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// Errors
// ============================================================================

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SOURCE_UNAVAILABLE: return "SourceUnavailable";
        case ErrorKind::STREAM_UNREADABLE: return "StreamUnreadable";
        case ErrorKind::STORE_NOT_LOADED: return "StoreNotLoaded";
        case ErrorKind::QUERY_EXECUTION_FAILED: return "QueryExecutionFailed";
        case ErrorKind::INVALID_DATABASE_IMAGE: return "InvalidDatabaseImage";
        case ErrorKind::WORKER_UNAVAILABLE: return "WorkerUnavailable";
        case ErrorKind::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
    }
}

// ============================================================================
// Records
// ============================================================================

const std::vector<std::string>& snp_columns() {
    static const std::vector<std::string> columns = {
        "rsid", "content", "chromosome", "position", "gene", "gene_s",
        "orientation", "assembly", "genome_build", "dbsnp_build", "stabilized_orientation",
        "geno1", "geno2", "geno3",
        "clin_chromosome", "clin_rsid", "clin_sig", "clin_disease", "clin_dbn", "clin_hgvs",
        "clin_origin", "clin_accession", "clin_reversed", "clin_fwd_ref", "clin_fwd_alt",
        "clin_ref", "clin_alt", "clin_rspos", "clin_dbsnp_build_id", "clin_ssr", "clin_sao",
        "clin_vp", "clin_geneinfo", "clin_gene_name", "clin_gene_id", "clin_wgt", "clin_vc",
        "clin_clnalle", "clin_tags", "clin_clndsdb", "clin_clndsdbid", "clin_clnrevstat",
        "clin_clnsrc", "clin_clnsrcid", "pmid", "pmid_title"
    };
    return columns;
}

std::string snp_select_list() {
    static const std::string list = [] {
        std::string joined;
        for (const auto& column : snp_columns()) {
            if (!joined.empty()) joined += ", ";
            joined += column;
        }
        return joined;
    }();
    return list;
}

std::map<std::string, std::string> SNPRecord::get_summary() const {
    std::map<std::string, std::string> summary;

    auto put = [&summary](const char* key, const std::optional<std::string>& value) {
        if (value && !value->empty()) summary[key] = *value;
    };
    auto put_int = [&summary](const char* key, const std::optional<int64_t>& value) {
        if (value) summary[key] = std::to_string(*value);
    };

    summary["rsid"] = rsid;
    if (!content.empty()) summary["content"] = content;

    put("chromosome", chromosome);
    put_int("position", position);
    put("gene", gene);
    put("gene_s", gene_s);
    put("orientation", orientation);
    put("assembly", assembly);
    put("genome_build", genome_build);
    put_int("dbsnp_build", dbsnp_build);
    put("stabilized_orientation", stabilized_orientation);
    put("geno1", geno1);
    put("geno2", geno2);
    put("geno3", geno3);
    put("clin_chromosome", clin_chromosome);
    put("clin_rsid", clin_rsid);
    put("clin_sig", clin_sig);
    put("clin_disease", clin_disease);
    put("clin_dbn", clin_dbn);
    put("clin_hgvs", clin_hgvs);
    put("clin_origin", clin_origin);
    put("clin_accession", clin_accession);
    put_int("clin_reversed", clin_reversed);
    put("clin_fwd_ref", clin_fwd_ref);
    put("clin_fwd_alt", clin_fwd_alt);
    put("clin_ref", clin_ref);
    put("clin_alt", clin_alt);
    put_int("clin_rspos", clin_rspos);
    put_int("clin_dbsnp_build_id", clin_dbsnp_build_id);
    put_int("clin_ssr", clin_ssr);
    put_int("clin_sao", clin_sao);
    put("clin_vp", clin_vp);
    put("clin_geneinfo", clin_geneinfo);
    put("clin_gene_name", clin_gene_name);
    put_int("clin_gene_id", clin_gene_id);
    put_int("clin_wgt", clin_wgt);
    put("clin_vc", clin_vc);
    put("clin_clnalle", clin_clnalle);
    put("clin_tags", clin_tags);
    put("clin_clndsdb", clin_clndsdb);
    put("clin_clndsdbid", clin_clndsdbid);
    put("clin_clnrevstat", clin_clnrevstat);
    put("clin_clnsrc", clin_clnsrc);
    put("clin_clnsrcid", clin_clnsrcid);
    put_int("pmid", pmid);
    put("pmid_title", pmid_title);

    return summary;
}

bool FilterCriteria::has_any_filter() const {
    return !trim(search_term).empty() ||
           !trim(chromosome).empty() ||
           !trim(gene).empty() ||
           !trim(clinical_significance).empty() ||
           !trim(disease).empty();
}

std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string normalize_rsid(const std::string& rsid) {
    std::string normalized = trim(rsid);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

// ============================================================================
// EngineContext
// ============================================================================

const DatasetStore& EngineContext::store() const {
    if (!store_) {
        throw SNPMatcherError(ErrorKind::STORE_NOT_LOADED,
                              "Database not loaded. Call load_database first.");
    }
    return *store_;
}

void EngineContext::install(std::shared_ptr<const DatasetStore> store) {
    store_ = std::move(store);
}

// ============================================================================
// SNPMatcherEngine
// ============================================================================

SNPMatcherEngine::SNPMatcherEngine(EngineConfig config, std::shared_ptr<Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

SNPMatcherEngine::~SNPMatcherEngine() = default;

void SNPMatcherEngine::load_database(const std::string& location,
                                     const LoadProgressCallback& on_progress) {
    auto job = start_load(location, on_progress);
    if (!job) return;
    job->run();
    finish_load(*job);
}

std::unique_ptr<DatabaseLoadJob> SNPMatcherEngine::start_load(const std::string& location,
                                                              LoadProgressCallback on_progress) {
    if (context_.is_loaded()) {
        log(LogLevel::WARNING, "Database already loaded; ignoring load of " + location);
        if (on_progress) on_progress(PROGRESS_COMPLETE);
        return nullptr;
    }

    std::shared_ptr<Transport> transport = transport_ ? transport_ : create_transport(location, config_);
    return std::make_unique<DatabaseLoadJob>(std::move(transport), location, config_.table_name,
                                             std::move(on_progress));
}

void SNPMatcherEngine::finish_load(DatabaseLoadJob& job) {
    auto store = job.take_store();
    if (!store) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR, "Load of " + job.location() + " has not finished");
    }
    if (context_.is_loaded()) {
        log(LogLevel::WARNING, "Database already loaded; discarding " + job.location());
        return;
    }
    check_match_index(*store);
    // Installed only after full materialization; failures leave the context empty
    context_.install(std::move(store));
}

void SNPMatcherEngine::check_match_index(const DatasetStore& store) const {
    try {
        if (!match_query_uses_index(store, config_.table_name)) {
            log(LogLevel::WARNING, "No COLLATE NOCASE index on " + config_.table_name +
                                   ".rsid; every match batch scans the table");
        }
    } catch (const SNPMatcherError& e) {
        if (e.kind() != ErrorKind::QUERY_EXECUTION_FAILED) throw;
        log(LogLevel::DEBUG, "Cannot read the match query plan: " + std::string(e.what()));
    }
}

void SNPMatcherEngine::attach_store(std::shared_ptr<const DatasetStore> store) {
    if (!store) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR, "Cannot attach an empty store");
    }
    context_.install(std::move(store));
}

std::vector<MatchedSNP> SNPMatcherEngine::match_snps(const std::vector<UserGenotype>& genotypes,
                                                     const MatchProgressCallback& on_progress) const {
    const DatasetStore& store = context_.store();

    log(LogLevel::INFO, "Matching " + std::to_string(genotypes.size()) + " genotypes");
    auto matches = match_all(store, genotypes, on_progress, config_.batch_size, config_.table_name);
    log(LogLevel::INFO, "Found " + std::to_string(matches.size()) + " matches");
    return matches;
}

std::unique_ptr<BatchMatchJob> SNPMatcherEngine::start_match(std::vector<UserGenotype> genotypes,
                                                             MatchProgressCallback on_progress) const {
    const DatasetStore& store = context_.store();
    return std::make_unique<BatchMatchJob>(store, std::move(genotypes), config_.batch_size,
                                           config_.table_name, std::move(on_progress));
}

SearchResult SNPMatcherEngine::search_snps(const FilterCriteria& criteria) const {
    const DatasetStore& store = context_.store();
    return execute_search(store, criteria, config_.table_name, config_.default_limit);
}

DatabaseStats SNPMatcherEngine::get_database_stats() const {
    const DatasetStore& store = context_.store();

    DatabaseStats stats;
    try {
        auto rows = store.query("SELECT COUNT(*) AS count FROM " + config_.table_name, {});
        if (!rows.empty()) {
            auto it = rows.front().find("count");
            if (it != rows.front().end()) {
                stats.total_snps = sql_value_int(it->second).value_or(0);
            }
        }
    } catch (const SNPMatcherError& e) {
        if (e.kind() != ErrorKind::QUERY_EXECUTION_FAILED) throw;
        log(LogLevel::ERROR, "Error getting database stats: " + std::string(e.what()));
    }
    return stats;
}

} // namespace snpmatch

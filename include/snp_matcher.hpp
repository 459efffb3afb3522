/**
 * SNP Matcher - Embedded Query Engine
 *
 * Holds a SNP database (SNPedia/ClinVar annotations keyed by rsid) entirely
 * in memory and answers two kinds of queries against it:
 * - bulk rsid matching of a consumer genotype file
 * - filtered, paginated browsing
 *
 * The database image is streamed in once from a URL or local path.
 */

#ifndef SNP_MATCHER_HPP
#define SNP_MATCHER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace snpmatch {

// Forward declarations
class DatasetStore;
class Transport;
class BatchMatchJob;
class DatabaseLoadJob;

/**
 * Failure categories reported by the engine
 */
enum class ErrorKind {
    SOURCE_UNAVAILABLE,         // Transport fetch failed
    STREAM_UNREADABLE,          // Response body could not be consumed
    STORE_NOT_LOADED,           // Operation attempted before a successful load
    QUERY_EXECUTION_FAILED,     // Engine error while preparing or running a query
    INVALID_DATABASE_IMAGE,     // Downloaded bytes are not a usable SNP database
    WORKER_UNAVAILABLE,         // Call issued after the worker stopped
    INTERNAL_ERROR
};

/**
 * Get string representation of an error kind
 */
std::string error_kind_to_string(ErrorKind kind);

/**
 * Exception type for every engine failure
 */
class SNPMatcherError : public std::runtime_error {
public:
    SNPMatcherError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * One row of the snps table
 */
struct SNPRecord {
    // Core identifiers
    std::string rsid;
    std::string content;

    // Genomic location
    std::optional<std::string> chromosome;
    std::optional<int64_t> position;
    std::optional<std::string> gene;
    std::optional<std::string> gene_s;

    // Orientation and assembly
    std::optional<std::string> orientation;
    std::optional<std::string> assembly;
    std::optional<std::string> genome_build;
    std::optional<int64_t> dbsnp_build;
    std::optional<std::string> stabilized_orientation;

    // Genotypes
    std::optional<std::string> geno1;
    std::optional<std::string> geno2;
    std::optional<std::string> geno3;

    // ClinVar
    std::optional<std::string> clin_chromosome;
    std::optional<std::string> clin_rsid;
    std::optional<std::string> clin_sig;
    std::optional<std::string> clin_disease;
    std::optional<std::string> clin_dbn;
    std::optional<std::string> clin_hgvs;
    std::optional<std::string> clin_origin;
    std::optional<std::string> clin_accession;
    std::optional<int64_t> clin_reversed;
    std::optional<std::string> clin_fwd_ref;
    std::optional<std::string> clin_fwd_alt;
    std::optional<std::string> clin_ref;
    std::optional<std::string> clin_alt;
    std::optional<int64_t> clin_rspos;
    std::optional<int64_t> clin_dbsnp_build_id;
    std::optional<int64_t> clin_ssr;
    std::optional<int64_t> clin_sao;
    std::optional<std::string> clin_vp;
    std::optional<std::string> clin_geneinfo;
    std::optional<std::string> clin_gene_name;
    std::optional<int64_t> clin_gene_id;
    std::optional<int64_t> clin_wgt;
    std::optional<std::string> clin_vc;
    std::optional<std::string> clin_clnalle;
    std::optional<std::string> clin_tags;
    std::optional<std::string> clin_clndsdb;
    std::optional<std::string> clin_clndsdbid;
    std::optional<std::string> clin_clnrevstat;
    std::optional<std::string> clin_clnsrc;
    std::optional<std::string> clin_clnsrcid;

    // Publication reference
    std::optional<int64_t> pmid;
    std::optional<std::string> pmid_title;

    /**
     * Get summary map of all non-null columns (column name -> value)
     */
    std::map<std::string, std::string> get_summary() const;
};

/**
 * Column names of the snps table, in select order
 */
const std::vector<std::string>& snp_columns();

/**
 * Comma-separated select list built from snp_columns()
 */
std::string snp_select_list();

/**
 * A genotype call supplied by the caller (e.g. one line of a 23andMe file)
 */
struct UserGenotype {
    std::string rsid;           // Lowercased by the parser
    std::string chromosome;
    std::string position;
    std::string genotype;       // e.g. "AG", "--"
};

/**
 * A user genotype paired with the database record sharing its rsid
 */
struct MatchedSNP {
    UserGenotype genotype;
    SNPRecord snp;
};

/**
 * Optional browse filters. Empty strings mean "no filter".
 */
struct FilterCriteria {
    std::string search_term;            // Substring across id, gene, content, disease
    std::string chromosome;             // Exact match
    std::string gene;                   // Substring across gene name columns
    std::string clinical_significance;  // Substring of clin_sig
    std::string disease;                // Substring of clin_disease
    int limit = 50;
    int offset = 0;

    bool has_any_filter() const;
};

/**
 * One page of search results plus the size of the whole filtered set
 */
struct SearchResult {
    std::vector<SNPRecord> results;
    int64_t total = 0;
};

/**
 * Database statistics
 */
struct DatabaseStats {
    int64_t total_snps = 0;
};

/**
 * Progress callbacks
 */
using LoadProgressCallback = std::function<void(double percent)>;
using MatchProgressCallback = std::function<void(size_t processed, size_t total)>;

/**
 * Engine configuration
 */
struct EngineConfig {
    size_t batch_size = 500;            // Keys per IN query (kept below the parameter ceiling)
    int default_limit = 50;             // Page size when FilterCriteria::limit <= 0
    std::string table_name = "snps";
    long connect_timeout_ms = 30000;
    long transfer_timeout_ms = 0;       // 0 = no transfer timeout
    std::string user_agent = "snpmatch/1.0";
};

/**
 * Normalize an rsid for comparison (trimmed, lowercase)
 */
std::string normalize_rsid(const std::string& rsid);

/**
 * Trim leading/trailing whitespace
 */
std::string trim(const std::string& value);

/**
 * Holds the resident store, if any
 */
class EngineContext {
public:
    bool is_loaded() const { return store_ != nullptr; }

    /**
     * Get the resident store
     * @throws SNPMatcherError (STORE_NOT_LOADED) if nothing has been loaded
     */
    const DatasetStore& store() const;

    /**
     * Shared handle to the resident store (empty if not loaded)
     */
    std::shared_ptr<const DatasetStore> store_handle() const { return store_; }

    /**
     * Make a fully materialized store resident
     */
    void install(std::shared_ptr<const DatasetStore> store);

private:
    std::shared_ptr<const DatasetStore> store_;
};

/**
 * Main engine class
 *
 * Not thread-safe for loading; once loaded, the query methods only read the
 * store. MatcherWorker runs one engine on its own thread.
 */
class SNPMatcherEngine {
public:
    /**
     * @param config Engine configuration
     * @param transport Transport used for loading (default: chosen per location)
     */
    explicit SNPMatcherEngine(EngineConfig config = EngineConfig(),
                              std::shared_ptr<Transport> transport = nullptr);
    ~SNPMatcherEngine();

    // Prevent copying
    SNPMatcherEngine(const SNPMatcherEngine&) = delete;
    SNPMatcherEngine& operator=(const SNPMatcherEngine&) = delete;

    /**
     * Stream the database image from a URL or local path and make it resident
     * @param location http(s)/file URL or filesystem path
     * @param on_progress Receives non-decreasing values in [0, 100]
     *
     * A second call after a successful load is ignored.
     */
    void load_database(const std::string& location,
                       const LoadProgressCallback& on_progress = nullptr);

    /**
     * Create a resumable load job for a location
     * @return nullptr if a database is already resident (the load is ignored
     *         and on_progress receives 100)
     */
    std::unique_ptr<DatabaseLoadJob> start_load(const std::string& location,
                                                LoadProgressCallback on_progress = nullptr);

    /**
     * Make the store of a finished load job resident. If another load
     * finished first, the new store is discarded.
     */
    void finish_load(DatabaseLoadJob& job);

    /**
     * Make an already materialized store resident (embedding and tests)
     */
    void attach_store(std::shared_ptr<const DatasetStore> store);

    bool is_loaded() const { return context_.is_loaded(); }

    /**
     * Match user genotypes against the database
     * @param genotypes Keys to look up (duplicates yield duplicate matches)
     * @param on_progress Called after each batch with (processed, total)
     */
    std::vector<MatchedSNP> match_snps(const std::vector<UserGenotype>& genotypes,
                                       const MatchProgressCallback& on_progress = nullptr) const;

    /**
     * Create a resumable match job (one batch per step)
     */
    std::unique_ptr<BatchMatchJob> start_match(std::vector<UserGenotype> genotypes,
                                               MatchProgressCallback on_progress = nullptr) const;

    /**
     * Search/browse SNPs with filtering and pagination
     */
    SearchResult search_snps(const FilterCriteria& criteria) const;

    /**
     * Get database statistics
     */
    DatabaseStats get_database_stats() const;

    const EngineConfig& config() const { return config_; }

private:
    // Warns when match queries would scan the whole table
    void check_match_index(const DatasetStore& store) const;

    EngineConfig config_;
    std::shared_ptr<Transport> transport_;
    EngineContext context_;
};

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace snpmatch

#endif // SNP_MATCHER_HPP

/**
 * Dataset Store
 *
 * Read-only relational store holding the materialized SNP database.
 * The engine only needs parameterized queries returning rows as attribute
 * maps, so the store is reached through the abstract DatasetStore interface;
 * SQLiteDatabase is the in-memory SQLite implementation.
 */

#ifndef DATASET_STORE_HPP
#define DATASET_STORE_HPP

#include "snp_matcher.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace snpmatch {

/**
 * A bound parameter or a column value (NULL, integer, real, text)
 */
using SqlValue = std::variant<std::monostate, int64_t, double, std::string>;

/**
 * One result row: column name -> value
 */
using Row = std::map<std::string, SqlValue>;

/**
 * Get value as text (nullopt for NULL)
 */
std::optional<std::string> sql_value_text(const SqlValue& value);

/**
 * Get value as integer (nullopt for NULL or non-numeric text)
 */
std::optional<int64_t> sql_value_int(const SqlValue& value);

/**
 * Build an SNPRecord from a row of the snps table. Missing columns read as NULL.
 */
SNPRecord snp_record_from_row(const Row& row);

/**
 * Abstract read-only query interface
 */
class DatasetStore {
public:
    virtual ~DatasetStore() = default;

    /**
     * Execute a statement with positional ('?') parameters
     * @param sql Statement text
     * @param params Values bound to parameters 1..N in order
     * @return Rows in result order
     * @throws SNPMatcherError (QUERY_EXECUTION_FAILED) on any engine error
     */
    virtual std::vector<Row> query(const std::string& sql,
                                   const std::vector<SqlValue>& params) const = 0;

    /**
     * Maximum number of parameters a single statement may bind
     */
    virtual int max_bound_parameters() const = 0;

    /**
     * Get a description of the store (for stats/debugging)
     */
    virtual std::string description() const { return ""; }
};

/**
 * In-memory SQLite database materialized from a serialized image
 */
class SQLiteDatabase : public DatasetStore {
public:
    /**
     * Materialize a database image
     * @param image Complete SQLite database file contents
     * @param required_table Table that must exist in the image
     * @throws SNPMatcherError (INVALID_DATABASE_IMAGE) if the image is unusable
     */
    SQLiteDatabase(const std::vector<unsigned char>& image, const std::string& required_table);
    ~SQLiteDatabase() override;

    // Prevent copying
    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    std::vector<Row> query(const std::string& sql,
                           const std::vector<SqlValue>& params) const override;

    int max_bound_parameters() const override;

    std::string description() const override;

    /**
     * Size of the materialized image in bytes
     */
    size_t image_size() const;

    /**
     * Initialize the SQLite library (idempotent)
     * @throws SNPMatcherError (INTERNAL_ERROR) if initialization fails
     */
    static void initialize_library();

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace snpmatch

#endif // DATASET_STORE_HPP

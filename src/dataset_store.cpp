/**
 * Dataset Store - in-memory SQLite implementation
 */

#include "dataset_store.hpp"

#include <sqlite3.h>

#include <cstring>
#include <sstream>
#include <type_traits>

namespace snpmatch {

// ============================================================================
// SqlValue helpers
// ============================================================================

std::optional<std::string> sql_value_text(const SqlValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    return std::nullopt;
}

std::optional<int64_t> sql_value_int(const SqlValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return static_cast<int64_t>(*d);
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (s->empty()) return std::nullopt;
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(*s, &consumed);
            if (consumed != s->size()) return std::nullopt;
            return static_cast<int64_t>(parsed);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Row -> SNPRecord
// ============================================================================

namespace {

std::optional<std::string> text_column(const Row& row, const char* column) {
    auto it = row.find(column);
    if (it == row.end()) return std::nullopt;
    return sql_value_text(it->second);
}

std::optional<int64_t> int_column(const Row& row, const char* column) {
    auto it = row.find(column);
    if (it == row.end()) return std::nullopt;
    return sql_value_int(it->second);
}

} // anonymous namespace

SNPRecord snp_record_from_row(const Row& row) {
    SNPRecord r;
    r.rsid = text_column(row, "rsid").value_or("");
    r.content = text_column(row, "content").value_or("");

    r.chromosome = text_column(row, "chromosome");
    r.position = int_column(row, "position");
    r.gene = text_column(row, "gene");
    r.gene_s = text_column(row, "gene_s");

    r.orientation = text_column(row, "orientation");
    r.assembly = text_column(row, "assembly");
    r.genome_build = text_column(row, "genome_build");
    r.dbsnp_build = int_column(row, "dbsnp_build");
    r.stabilized_orientation = text_column(row, "stabilized_orientation");

    r.geno1 = text_column(row, "geno1");
    r.geno2 = text_column(row, "geno2");
    r.geno3 = text_column(row, "geno3");

    r.clin_chromosome = text_column(row, "clin_chromosome");
    r.clin_rsid = text_column(row, "clin_rsid");
    r.clin_sig = text_column(row, "clin_sig");
    r.clin_disease = text_column(row, "clin_disease");
    r.clin_dbn = text_column(row, "clin_dbn");
    r.clin_hgvs = text_column(row, "clin_hgvs");
    r.clin_origin = text_column(row, "clin_origin");
    r.clin_accession = text_column(row, "clin_accession");
    r.clin_reversed = int_column(row, "clin_reversed");
    r.clin_fwd_ref = text_column(row, "clin_fwd_ref");
    r.clin_fwd_alt = text_column(row, "clin_fwd_alt");
    r.clin_ref = text_column(row, "clin_ref");
    r.clin_alt = text_column(row, "clin_alt");
    r.clin_rspos = int_column(row, "clin_rspos");
    r.clin_dbsnp_build_id = int_column(row, "clin_dbsnp_build_id");
    r.clin_ssr = int_column(row, "clin_ssr");
    r.clin_sao = int_column(row, "clin_sao");
    r.clin_vp = text_column(row, "clin_vp");
    r.clin_geneinfo = text_column(row, "clin_geneinfo");
    r.clin_gene_name = text_column(row, "clin_gene_name");
    r.clin_gene_id = int_column(row, "clin_gene_id");
    r.clin_wgt = int_column(row, "clin_wgt");
    r.clin_vc = text_column(row, "clin_vc");
    r.clin_clnalle = text_column(row, "clin_clnalle");
    r.clin_tags = text_column(row, "clin_tags");
    r.clin_clndsdb = text_column(row, "clin_clndsdb");
    r.clin_clndsdbid = text_column(row, "clin_clndsdbid");
    r.clin_clnrevstat = text_column(row, "clin_clnrevstat");
    r.clin_clnsrc = text_column(row, "clin_clnsrc");
    r.clin_clnsrcid = text_column(row, "clin_clnsrcid");

    r.pmid = int_column(row, "pmid");
    r.pmid_title = text_column(row, "pmid_title");
    return r;
}

// ============================================================================
// Prepared statement wrapper
// ============================================================================

namespace {

/**
 * Owns one sqlite3_stmt; finalized on destruction
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = "Cannot prepare statement: " + std::string(sqlite3_errmsg(db_));
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw SNPMatcherError(ErrorKind::QUERY_EXECUTION_FAILED, message);
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    int parameter_count() const {
        return sqlite3_bind_parameter_count(stmt_);
    }

    void bind(int index, const SqlValue& value) {
        int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(v));
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, index, v);
            } else {
                return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, value);

        if (rc != SQLITE_OK) {
            throw SNPMatcherError(ErrorKind::QUERY_EXECUTION_FAILED,
                "Cannot bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db_));
        }
    }

    /**
     * Step to the next row
     * @return true if a row is available, false when done
     */
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw SNPMatcherError(ErrorKind::QUERY_EXECUTION_FAILED,
            "Query failed: " + std::string(sqlite3_errmsg(db_)));
    }

    int column_count() const {
        return sqlite3_column_count(stmt_);
    }

    std::string column_name(int col) const {
        const char* name = sqlite3_column_name(stmt_, col);
        return name ? name : "";
    }

    SqlValue column_value(int col) const {
        switch (sqlite3_column_type(stmt_, col)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, col);
            case SQLITE_NULL:
                return std::monostate{};
            default: {
                // TEXT and BLOB both come back as bytes
                const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, col));
                int size = sqlite3_column_bytes(stmt_, col);
                return std::string(data ? data : "", data ? static_cast<size_t>(size) : 0);
            }
        }
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // anonymous namespace

// ============================================================================
// SQLiteDatabase
// ============================================================================

struct SQLiteDatabase::Impl {
    sqlite3* db = nullptr;
    int max_parameters = 0;
    size_t image_size = 0;
    std::string table;

    ~Impl() {
        if (db) {
            sqlite3_close_v2(db);
        }
    }
};

void SQLiteDatabase::initialize_library() {
    int rc = sqlite3_initialize();
    if (rc != SQLITE_OK) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR,
            "Cannot initialize SQLite: " + std::string(sqlite3_errstr(rc)));
    }
}

SQLiteDatabase::SQLiteDatabase(const std::vector<unsigned char>& image,
                               const std::string& required_table)
    : pimpl_(std::make_unique<Impl>()) {

    if (image.empty()) {
        throw SNPMatcherError(ErrorKind::INVALID_DATABASE_IMAGE, "Database image is empty");
    }

    initialize_library();

    int rc = sqlite3_open_v2(":memory:", &pimpl_->db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = pimpl_->db ? sqlite3_errmsg(pimpl_->db) : sqlite3_errstr(rc);
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR, "Cannot open in-memory database: " + message);
    }

    // SQLite takes ownership of the buffer (freed on close, or on failure)
    auto* buffer = static_cast<unsigned char*>(sqlite3_malloc64(image.size()));
    if (!buffer) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR,
            "Out of memory materializing " + std::to_string(image.size()) + " byte database image");
    }
    std::memcpy(buffer, image.data(), image.size());

    rc = sqlite3_deserialize(pimpl_->db, "main", buffer,
                             static_cast<sqlite3_int64>(image.size()),
                             static_cast<sqlite3_int64>(image.size()),
                             SQLITE_DESERIALIZE_FREEONCLOSE | SQLITE_DESERIALIZE_READONLY);
    if (rc != SQLITE_OK) {
        throw SNPMatcherError(ErrorKind::INVALID_DATABASE_IMAGE,
            "Cannot materialize database image: " + std::string(sqlite3_errmsg(pimpl_->db)));
    }

    pimpl_->max_parameters = sqlite3_limit(pimpl_->db, SQLITE_LIMIT_VARIABLE_NUMBER, -1);
    pimpl_->image_size = image.size();
    pimpl_->table = required_table;

    // The image is only parsed lazily; touch the schema now so a bad image
    // fails the load instead of the first query.
    int64_t tables = 0;
    try {
        auto rows = query("SELECT COUNT(*) AS count FROM sqlite_master "
                          "WHERE type IN ('table', 'view') AND name = ?",
                          {SqlValue(required_table)});
        if (!rows.empty()) {
            tables = sql_value_int(rows.front().at("count")).value_or(0);
        }
    } catch (const SNPMatcherError& e) {
        throw SNPMatcherError(ErrorKind::INVALID_DATABASE_IMAGE,
            "Database image is not a readable SQLite database: " + std::string(e.what()));
    }

    if (tables == 0) {
        throw SNPMatcherError(ErrorKind::INVALID_DATABASE_IMAGE,
            "Database image has no '" + required_table + "' table");
    }
}

SQLiteDatabase::~SQLiteDatabase() = default;

std::vector<Row> SQLiteDatabase::query(const std::string& sql,
                                       const std::vector<SqlValue>& params) const {
    Statement stmt(pimpl_->db, sql);

    if (stmt.parameter_count() != static_cast<int>(params.size())) {
        throw SNPMatcherError(ErrorKind::QUERY_EXECUTION_FAILED,
            "Statement expects " + std::to_string(stmt.parameter_count()) +
            " parameters, got " + std::to_string(params.size()));
    }

    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }

    std::vector<Row> rows;
    std::vector<std::string> names;
    while (stmt.step()) {
        if (names.empty()) {
            int columns = stmt.column_count();
            names.reserve(columns);
            for (int c = 0; c < columns; ++c) {
                names.push_back(stmt.column_name(c));
            }
        }

        Row row;
        for (size_t c = 0; c < names.size(); ++c) {
            row.emplace(names[c], stmt.column_value(static_cast<int>(c)));
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

int SQLiteDatabase::max_bound_parameters() const {
    return pimpl_->max_parameters;
}

size_t SQLiteDatabase::image_size() const {
    return pimpl_->image_size;
}

std::string SQLiteDatabase::description() const {
    std::ostringstream oss;
    oss << "SQLite " << sqlite3_libversion()
        << " in-memory database (" << pimpl_->image_size << " bytes, table '"
        << pimpl_->table << "', max " << pimpl_->max_parameters << " parameters)";
    return oss.str();
}

} // namespace snpmatch

/**
 * Batch Matcher
 */

#include "batch_matcher.hpp"

#include <algorithm>
#include <sstream>

namespace snpmatch {

size_t effective_batch_size(size_t configured, int max_bound_parameters) {
    size_t size = configured > 0 ? configured : DEFAULT_BATCH_SIZE;

    if (max_bound_parameters > 1 && size >= static_cast<size_t>(max_bound_parameters)) {
        size_t clamped = static_cast<size_t>(max_bound_parameters) - 1;
        log(LogLevel::WARNING, "Batch size " + std::to_string(size) +
                               " reaches the store limit of " + std::to_string(max_bound_parameters) +
                               " parameters; using " + std::to_string(clamped));
        size = clamped;
    }
    return size;
}

std::string build_match_query(const std::string& table, size_t key_count) {
    std::ostringstream sql;
    sql << "SELECT " << snp_select_list() << " FROM " << table
        << " WHERE rsid COLLATE NOCASE IN (";
    for (size_t i = 0; i < key_count; ++i) {
        if (i > 0) sql << ",";
        sql << "?";
    }
    sql << ")";
    return sql.str();
}

bool match_query_uses_index(const DatasetStore& store, const std::string& table) {
    auto rows = store.query("EXPLAIN QUERY PLAN " + build_match_query(table, 2),
                            {SqlValue(std::string("rs1")), SqlValue(std::string("rs2"))});
    for (const auto& row : rows) {
        auto it = row.find("detail");
        if (it == row.end()) continue;
        std::string detail = sql_value_text(it->second).value_or("");
        if (detail.find("SEARCH") != std::string::npos && detail.find("INDEX") != std::string::npos) {
            return true;
        }
    }
    return false;
}

BatchMatchJob::BatchMatchJob(const DatasetStore& store,
                             std::vector<UserGenotype> genotypes,
                             size_t batch_size,
                             std::string table,
                             MatchProgressCallback on_progress)
    : store_(store),
      genotypes_(std::move(genotypes)),
      batch_size_(effective_batch_size(batch_size, store.max_bound_parameters())),
      table_(std::move(table)),
      on_progress_(std::move(on_progress)) {

    normalized_.reserve(genotypes_.size());
    for (const auto& g : genotypes_) {
        normalized_.push_back(normalize_rsid(g.rsid));
    }
}

void BatchMatchJob::step() {
    if (done()) return;

    size_t begin = next_;
    size_t end = std::min(begin + batch_size_, genotypes_.size());

    std::vector<SqlValue> params;
    params.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        params.emplace_back(normalized_[i]);
    }

    try {
        auto rows = store_.query(build_match_query(table_, end - begin), params);

        for (const auto& row : rows) {
            SNPRecord record = snp_record_from_row(row);
            std::string key = normalize_rsid(record.rsid);

            // Every occurrence of the key in this group gets its own match
            for (size_t i = begin; i < end; ++i) {
                if (normalized_[i] == key) {
                    results_.push_back(MatchedSNP{genotypes_[i], record});
                }
            }
        }
    } catch (const SNPMatcherError& e) {
        if (e.kind() != ErrorKind::QUERY_EXECUTION_FAILED) throw;
        ++failed_batches_;
        log(LogLevel::WARNING, "Error querying batch [" + std::to_string(begin) + ", " +
                               std::to_string(end) + "): " + e.what());
    }

    next_ = end;
    ++batches_run_;

    log(LogLevel::DEBUG, "Matched " + std::to_string(next_) + "/" +
                         std::to_string(genotypes_.size()) + " genotypes (" +
                         std::to_string(results_.size()) + " hits)");

    if (on_progress_) {
        on_progress_(next_, genotypes_.size());
    }
}

void BatchMatchJob::run() {
    while (!done()) {
        step();
    }
}

std::vector<MatchedSNP> BatchMatchJob::take_results() {
    return std::move(results_);
}

std::vector<MatchedSNP> match_all(const DatasetStore& store,
                                  const std::vector<UserGenotype>& genotypes,
                                  const MatchProgressCallback& on_progress,
                                  size_t batch_size,
                                  const std::string& table) {
    BatchMatchJob job(store, genotypes, batch_size, table, on_progress);
    job.run();
    return job.take_results();
}

} // namespace snpmatch

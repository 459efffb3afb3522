/**
 * Batch Matcher
 *
 * Matches user genotypes against the store in groups small enough to stay
 * under the store's bound-parameter ceiling (SQLite defaults to 999 or
 * 32766 depending on version).
 *
 * Keys are compared with COLLATE NOCASE. SQLite serves that comparison from
 * an index only if the index uses the same collation, so datasets should
 * carry `CREATE INDEX ... ON snps(rsid COLLATE NOCASE)` (or declare the
 * column COLLATE NOCASE). Without one every group scans the table.
 */

#ifndef BATCH_MATCHER_HPP
#define BATCH_MATCHER_HPP

#include "snp_matcher.hpp"
#include "dataset_store.hpp"

#include <string>
#include <vector>

namespace snpmatch {

constexpr size_t DEFAULT_BATCH_SIZE = 500;

/**
 * Clamp a configured batch size so one IN query stays strictly below the
 * parameter ceiling
 * @param configured Requested keys per query (0 = DEFAULT_BATCH_SIZE)
 * @param max_bound_parameters Store ceiling (<= 0 = unknown)
 */
size_t effective_batch_size(size_t configured, int max_bound_parameters);

/**
 * Build the select for one group of keys
 */
std::string build_match_query(const std::string& table, size_t key_count);

/**
 * Ask the store's query planner whether match queries can use an index
 * @throws SNPMatcherError (QUERY_EXECUTION_FAILED) if the plan cannot be read
 */
bool match_query_uses_index(const DatasetStore& store, const std::string& table);

/**
 * Resumable match over a list of genotypes, one group per step()
 *
 * The store must outlive the job.
 */
class BatchMatchJob {
public:
    BatchMatchJob(const DatasetStore& store,
                  std::vector<UserGenotype> genotypes,
                  size_t batch_size,
                  std::string table,
                  MatchProgressCallback on_progress);

    /**
     * Check whether every group has been processed
     */
    bool done() const { return next_ >= genotypes_.size(); }

    /**
     * Query the next group and collect its matches, then report progress.
     * A QUERY_EXECUTION_FAILED for the group is logged and counts as no matches.
     */
    void step();

    /**
     * Run all remaining groups
     */
    void run();

    size_t processed() const { return next_; }
    size_t total() const { return genotypes_.size(); }
    size_t batch_size() const { return batch_size_; }
    size_t batches_run() const { return batches_run_; }
    size_t failed_batches() const { return failed_batches_; }

    /**
     * Move the collected matches out of the job
     */
    std::vector<MatchedSNP> take_results();

private:
    const DatasetStore& store_;
    std::vector<UserGenotype> genotypes_;
    std::vector<std::string> normalized_;   // normalize_rsid() of each genotype
    size_t batch_size_;
    std::string table_;
    MatchProgressCallback on_progress_;

    size_t next_ = 0;
    size_t batches_run_ = 0;
    size_t failed_batches_ = 0;
    std::vector<MatchedSNP> results_;
};

/**
 * Match all genotypes in one call
 * @return Matches in input-group order; unmatched keys are dropped
 */
std::vector<MatchedSNP> match_all(const DatasetStore& store,
                                  const std::vector<UserGenotype>& genotypes,
                                  const MatchProgressCallback& on_progress,
                                  size_t batch_size = DEFAULT_BATCH_SIZE,
                                  const std::string& table = "snps");

} // namespace snpmatch

#endif // BATCH_MATCHER_HPP

/**
 * Filter Query Builder
 *
 * Turns sparse FilterCriteria into one parameterized WHERE predicate and runs
 * the count query and the paginated select against the store.
 *
 * Each criterion contributes one clause descriptor (predicate text with '?'
 * placeholders plus the values for those placeholders). Clauses are joined
 * with AND in a fixed order, so placeholders and parameters stay aligned.
 */

#ifndef FILTER_QUERY_HPP
#define FILTER_QUERY_HPP

#include "snp_matcher.hpp"
#include "dataset_store.hpp"

#include <string>
#include <vector>

namespace snpmatch {

/**
 * One predicate and its bound values
 */
struct QueryClause {
    std::string predicate;
    std::vector<SqlValue> params;

    QueryClause() = default;
    QueryClause(std::string p, std::vector<SqlValue> v)
        : predicate(std::move(p)), params(std::move(v)) {}
};

/**
 * Ordered conjunction of clauses
 */
class FilterQuery {
public:
    /**
     * Append a clause; its placeholder count must equal params.size()
     */
    void add_clause(std::string predicate, std::vector<SqlValue> params);

    bool empty() const { return clauses_.empty(); }
    const std::vector<QueryClause>& clauses() const { return clauses_; }

    /**
     * "WHERE a AND b ..." or "" when there are no clauses
     */
    std::string where_clause() const;

    /**
     * Filter parameters in clause order
     */
    std::vector<SqlValue> parameters() const;

    /**
     * SELECT COUNT(*) AS count FROM <table> <where>
     */
    std::string count_sql(const std::string& table) const;

    /**
     * Paginated select in storage order, ending in "LIMIT ? OFFSET ?"
     */
    std::string page_sql(const std::string& table) const;

    /**
     * Filter parameters followed by limit, then offset
     */
    std::vector<SqlValue> page_parameters(int64_t limit, int64_t offset) const;

private:
    std::vector<QueryClause> clauses_;
};

/**
 * Wrap a term as a LIKE substring pattern ("%term%"), escaping %, _ and \
 * for use with ESCAPE '\'
 */
std::string like_pattern(const std::string& term);

/**
 * Build the predicate for a set of criteria
 *
 * Clause order: search term, chromosome, gene, clinical significance, disease.
 * Criteria that are empty after trimming contribute nothing.
 */
FilterQuery build_filter_query(const FilterCriteria& criteria);

/**
 * Resolve the page size and offset actually used for a search
 */
int64_t effective_limit(const FilterCriteria& criteria, int default_limit);
int64_t effective_offset(const FilterCriteria& criteria);

/**
 * Run the count and page queries
 * @throws SNPMatcherError (QUERY_EXECUTION_FAILED) if either query fails
 */
SearchResult execute_search(const DatasetStore& store,
                            const FilterCriteria& criteria,
                            const std::string& table = "snps",
                            int default_limit = 50);

} // namespace snpmatch

#endif // FILTER_QUERY_HPP

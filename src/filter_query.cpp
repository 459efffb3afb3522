/**
 * Filter Query Builder
 */

#include "filter_query.hpp"

#include <algorithm>
#include <sstream>

namespace snpmatch {

namespace {

const char* const LIKE = " LIKE ? ESCAPE '\\'";

std::string like(const std::string& column) {
    return column + LIKE;
}

std::string any_like(const std::vector<std::string>& columns) {
    std::string predicate = "(";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) predicate += " OR ";
        predicate += like(columns[i]);
    }
    predicate += ")";
    return predicate;
}

// Columns searched by the free-text term
const std::vector<std::string> SEARCH_TERM_COLUMNS = {
    "rsid", "gene", "gene_s", "content", "clin_disease", "clin_gene_name"
};

// Gene name variants
const std::vector<std::string> GENE_COLUMNS = {
    "gene", "gene_s", "clin_gene_name"
};

} // anonymous namespace

// ============================================================================
// FilterQuery
// ============================================================================

void FilterQuery::add_clause(std::string predicate, std::vector<SqlValue> params) {
    size_t placeholders = static_cast<size_t>(std::count(predicate.begin(), predicate.end(), '?'));
    if (placeholders != params.size()) {
        throw SNPMatcherError(ErrorKind::INTERNAL_ERROR,
            "Clause '" + predicate + "' has " + std::to_string(placeholders) +
            " placeholders but " + std::to_string(params.size()) + " values");
    }
    clauses_.emplace_back(std::move(predicate), std::move(params));
}

std::string FilterQuery::where_clause() const {
    if (clauses_.empty()) return "";

    std::string where = "WHERE ";
    for (size_t i = 0; i < clauses_.size(); ++i) {
        if (i > 0) where += " AND ";
        where += clauses_[i].predicate;
    }
    return where;
}

std::vector<SqlValue> FilterQuery::parameters() const {
    std::vector<SqlValue> params;
    for (const auto& clause : clauses_) {
        params.insert(params.end(), clause.params.begin(), clause.params.end());
    }
    return params;
}

std::string FilterQuery::count_sql(const std::string& table) const {
    std::string sql = "SELECT COUNT(*) AS count FROM " + table;
    if (!clauses_.empty()) sql += " " + where_clause();
    return sql;
}

std::string FilterQuery::page_sql(const std::string& table) const {
    std::string sql = "SELECT " + snp_select_list() + " FROM " + table;
    if (!clauses_.empty()) sql += " " + where_clause();
    sql += " ORDER BY rowid LIMIT ? OFFSET ?";
    return sql;
}

std::vector<SqlValue> FilterQuery::page_parameters(int64_t limit, int64_t offset) const {
    std::vector<SqlValue> params = parameters();
    params.emplace_back(limit);
    params.emplace_back(offset);
    return params;
}

// ============================================================================
// Builder
// ============================================================================

std::string like_pattern(const std::string& term) {
    std::string pattern = "%";
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') pattern += '\\';
        pattern += c;
    }
    pattern += "%";
    return pattern;
}

FilterQuery build_filter_query(const FilterCriteria& criteria) {
    FilterQuery query;

    std::string term = trim(criteria.search_term);
    if (!term.empty()) {
        std::vector<SqlValue> params(SEARCH_TERM_COLUMNS.size(), SqlValue(like_pattern(term)));
        query.add_clause(any_like(SEARCH_TERM_COLUMNS), std::move(params));
    }

    std::string chromosome = trim(criteria.chromosome);
    if (!chromosome.empty()) {
        query.add_clause("chromosome = ?", {SqlValue(chromosome)});
    }

    std::string gene = trim(criteria.gene);
    if (!gene.empty()) {
        std::vector<SqlValue> params(GENE_COLUMNS.size(), SqlValue(like_pattern(gene)));
        query.add_clause(any_like(GENE_COLUMNS), std::move(params));
    }

    // Containment: clin_sig values carry qualifiers ("Pathogenic/Likely pathogenic")
    std::string significance = trim(criteria.clinical_significance);
    if (!significance.empty()) {
        query.add_clause(like("clin_sig"), {SqlValue(like_pattern(significance))});
    }

    std::string disease = trim(criteria.disease);
    if (!disease.empty()) {
        query.add_clause(like("clin_disease"), {SqlValue(like_pattern(disease))});
    }

    return query;
}

int64_t effective_limit(const FilterCriteria& criteria, int default_limit) {
    if (criteria.limit > 0) return criteria.limit;
    return default_limit > 0 ? default_limit : 50;
}

int64_t effective_offset(const FilterCriteria& criteria) {
    return criteria.offset > 0 ? criteria.offset : 0;
}

// ============================================================================
// Execution
// ============================================================================

SearchResult execute_search(const DatasetStore& store,
                            const FilterCriteria& criteria,
                            const std::string& table,
                            int default_limit) {
    FilterQuery query = build_filter_query(criteria);
    int64_t limit = effective_limit(criteria, default_limit);
    int64_t offset = effective_offset(criteria);

    log(LogLevel::DEBUG, "Search: " + (query.empty() ? std::string("<no filter>") : query.where_clause()) +
                         " LIMIT " + std::to_string(limit) + " OFFSET " + std::to_string(offset));

    SearchResult result;

    auto count_rows = store.query(query.count_sql(table), query.parameters());
    if (!count_rows.empty()) {
        auto it = count_rows.front().find("count");
        if (it != count_rows.front().end()) {
            result.total = sql_value_int(it->second).value_or(0);
        }
    }

    auto rows = store.query(query.page_sql(table), query.page_parameters(limit, offset));
    result.results.reserve(rows.size());
    for (const auto& row : rows) {
        result.results.push_back(snp_record_from_row(row));
    }

    return result;
}

} // namespace snpmatch

/**
 * Tests for the filter query builder: clause composition, parameter
 * alignment, LIKE escaping, pagination and execution against a store.
 */

#include <gtest/gtest.h>
#include "filter_query.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace snpmatch;
using namespace snpmatch::test_support;

namespace {

std::vector<std::string> rsids_of(const SearchResult& result) {
    std::vector<std::string> rsids;
    for (const auto& r : result.results) rsids.push_back(r.rsid);
    return rsids;
}

size_t placeholders(const std::string& sql) {
    return static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
}

std::shared_ptr<SQLiteDatabase> clinical_store() {
    return make_store({
        make_snp("rs100", {
            {"chromosome", SqlValue("17")},
            {"gene", SqlValue("BRCA1")},
            {"clin_sig", SqlValue("Pathogenic")},
            {"clin_disease", SqlValue("Hereditary breast and ovarian cancer")},
        }),
        make_snp("rs200", {
            {"chromosome", SqlValue("13")},
            {"gene_s", SqlValue("BRCA2")},
            {"clin_sig", SqlValue("Likely pathogenic")},
            {"clin_disease", SqlValue("Breast cancer")},
        }),
        make_snp("rs300", {
            {"chromosome", SqlValue("19")},
            {"clin_gene_name", SqlValue("APOE")},
            {"clin_sig", SqlValue("risk factor")},
            {"clin_disease", SqlValue("Alzheimer disease")},
        }),
        make_snp("rs400", {
            {"chromosome", SqlValue("17")},
            {"gene", SqlValue("TP53")},
            {"clin_sig", SqlValue("Benign")},
            {"content", SqlValue("Frequency 50%_of carriers")},
        }),
    });
}

} // anonymous namespace

// ============================================================================
// Building
// ============================================================================

TEST(BuildFilterQuery, NoCriteriaMeansNoWhere) {
    FilterQuery query = build_filter_query(FilterCriteria());
    EXPECT_TRUE(query.empty());
    EXPECT_EQ(query.where_clause(), "");
    EXPECT_EQ(query.count_sql("snps"), "SELECT COUNT(*) AS count FROM snps");
    EXPECT_TRUE(query.parameters().empty());
}

TEST(BuildFilterQuery, WhitespaceCriteriaAreIgnored) {
    FilterCriteria criteria;
    criteria.search_term = "   ";
    criteria.chromosome = "\t";
    EXPECT_TRUE(build_filter_query(criteria).empty());
    EXPECT_FALSE(criteria.has_any_filter());
}

TEST(BuildFilterQuery, SearchTermSpansSixColumns) {
    FilterCriteria criteria;
    criteria.search_term = "BRCA";
    FilterQuery query = build_filter_query(criteria);

    ASSERT_EQ(query.clauses().size(), 1u);
    auto params = query.parameters();
    ASSERT_EQ(params.size(), 6u);
    for (const auto& p : params) {
        EXPECT_EQ(std::get<std::string>(p), "%BRCA%");
    }
    for (const char* column : {"rsid", "gene", "gene_s", "content", "clin_disease", "clin_gene_name"}) {
        EXPECT_NE(query.where_clause().find(std::string(column) + " LIKE ?"), std::string::npos) << column;
    }
}

TEST(BuildFilterQuery, ClausesFollowFixedOrderWithAlignedParameters) {
    FilterCriteria criteria;
    criteria.disease = "cancer";
    criteria.gene = "BRCA1";
    criteria.chromosome = " 17 ";
    criteria.clinical_significance = "pathogenic";
    criteria.search_term = "x";

    FilterQuery query = build_filter_query(criteria);
    ASSERT_EQ(query.clauses().size(), 5u);

    auto params = query.parameters();
    EXPECT_EQ(params.size(), 6u + 1u + 3u + 1u + 1u);
    EXPECT_EQ(placeholders(query.where_clause()), params.size());

    EXPECT_EQ(std::get<std::string>(params[0]), "%x%");
    EXPECT_EQ(std::get<std::string>(params[6]), "17");
    EXPECT_EQ(std::get<std::string>(params[7]), "%BRCA1%");
    EXPECT_EQ(std::get<std::string>(params[10]), "%pathogenic%");
    EXPECT_EQ(std::get<std::string>(params[11]), "%cancer%");

    std::string where = query.where_clause();
    size_t search_at = where.find("(rsid LIKE");
    size_t chromosome_at = where.find("chromosome = ?");
    size_t gene_at = where.find("(gene LIKE");
    size_t significance_at = where.find("clin_sig LIKE");
    size_t disease_at = where.rfind("clin_disease LIKE");
    ASSERT_NE(search_at, std::string::npos);
    EXPECT_LT(search_at, chromosome_at);
    EXPECT_LT(chromosome_at, gene_at);
    EXPECT_LT(gene_at, significance_at);
    EXPECT_LT(significance_at, disease_at);
    EXPECT_NE(disease_at, std::string::npos);
}

TEST(BuildFilterQuery, PageSqlEndsWithLimitOffset) {
    FilterCriteria criteria;
    criteria.chromosome = "1";
    FilterQuery query = build_filter_query(criteria);

    std::string sql = query.page_sql("snps");
    EXPECT_EQ(sql.rfind(" LIMIT ? OFFSET ?"), sql.size() - std::string(" LIMIT ? OFFSET ?").size());
    auto params = query.page_parameters(10, 20);
    ASSERT_EQ(params.size(), 3u);
    EXPECT_EQ(placeholders(sql), params.size());
    EXPECT_EQ(std::get<int64_t>(params[1]), 10);
    EXPECT_EQ(std::get<int64_t>(params[2]), 20);
}

TEST(FilterQuery, MismatchedClauseIsRejected) {
    FilterQuery query;
    try {
        query.add_clause("a = ? AND b = ?", {SqlValue("x")});
        FAIL() << "expected INTERNAL_ERROR";
    } catch (const SNPMatcherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INTERNAL_ERROR);
    }
    EXPECT_TRUE(query.empty());
}

TEST(LikePattern, EscapesWildcards) {
    EXPECT_EQ(like_pattern("abc"), "%abc%");
    EXPECT_EQ(like_pattern("50%"), "%50\\%%");
    EXPECT_EQ(like_pattern("a_b"), "%a\\_b%");
    EXPECT_EQ(like_pattern("c\\d"), "%c\\\\d%");
}

TEST(Pagination, EffectiveLimitAndOffset) {
    FilterCriteria criteria;
    criteria.limit = 0;
    criteria.offset = -5;
    EXPECT_EQ(effective_limit(criteria, 50), 50);
    EXPECT_EQ(effective_limit(criteria, 0), 50);
    EXPECT_EQ(effective_offset(criteria), 0);

    criteria.limit = -1;
    EXPECT_EQ(effective_limit(criteria, 25), 25);

    criteria.limit = 10;
    criteria.offset = 30;
    EXPECT_EQ(effective_limit(criteria, 50), 10);
    EXPECT_EQ(effective_offset(criteria), 30);
}

// ============================================================================
// Execution
// ============================================================================

TEST(ExecuteSearch, PagesThroughChromosome) {
    auto rows = numbered_snps(25, "1");
    auto more = numbered_snps(5, "2", 26);
    rows.insert(rows.end(), more.begin(), more.end());
    auto store = make_store(rows);

    FilterCriteria criteria;
    criteria.chromosome = "1";
    criteria.limit = 10;

    SearchResult first = execute_search(*store, criteria);
    EXPECT_EQ(first.total, 25);
    ASSERT_EQ(first.results.size(), 10u);
    EXPECT_EQ(first.results.front().rsid, "rs1");
    EXPECT_EQ(first.results.back().rsid, "rs10");

    criteria.offset = 20;
    SearchResult last = execute_search(*store, criteria);
    EXPECT_EQ(last.total, 25);
    ASSERT_EQ(last.results.size(), 5u);
    EXPECT_EQ(last.results.front().rsid, "rs21");

    criteria.offset = 100;
    SearchResult beyond = execute_search(*store, criteria);
    EXPECT_EQ(beyond.total, 25);
    EXPECT_TRUE(beyond.results.empty());
}

TEST(ExecuteSearch, NoFilterReturnsEverythingPaged) {
    auto store = make_store(numbered_snps(60));

    FilterCriteria criteria;
    criteria.limit = 0;
    SearchResult result = execute_search(*store, criteria);
    EXPECT_EQ(result.total, 60);
    EXPECT_EQ(result.results.size(), 50u);

    criteria.offset = -3;
    criteria.limit = 5;
    EXPECT_EQ(rsids_of(execute_search(*store, criteria)),
              (std::vector<std::string>{"rs1", "rs2", "rs3", "rs4", "rs5"}));
}

TEST(ExecuteSearch, SearchTermIsCaseInsensitiveSubstring) {
    auto store = clinical_store();

    FilterCriteria criteria;
    criteria.search_term = "brca";
    SearchResult result = execute_search(*store, criteria);
    EXPECT_EQ(result.total, 2);
    EXPECT_EQ(rsids_of(result), (std::vector<std::string>{"rs100", "rs200"}));
}

TEST(ExecuteSearch, GeneMatchesAnyGeneColumn) {
    auto store = clinical_store();

    FilterCriteria criteria;
    criteria.gene = "APOE";
    EXPECT_EQ(rsids_of(execute_search(*store, criteria)), std::vector<std::string>{"rs300"});

    criteria.gene = "BRCA2";
    EXPECT_EQ(rsids_of(execute_search(*store, criteria)), std::vector<std::string>{"rs200"});
}

TEST(ExecuteSearch, ClinicalSignificanceIsSubstring) {
    auto store = clinical_store();

    FilterCriteria criteria;
    criteria.clinical_significance = "pathogenic";
    EXPECT_EQ(rsids_of(execute_search(*store, criteria)),
              (std::vector<std::string>{"rs100", "rs200"}));
}

TEST(ExecuteSearch, CriteriaCombineWithAnd) {
    auto store = clinical_store();

    FilterCriteria criteria;
    criteria.chromosome = "17";
    criteria.clinical_significance = "pathogenic";
    criteria.disease = "breast";
    SearchResult result = execute_search(*store, criteria);
    EXPECT_EQ(result.total, 1);
    EXPECT_EQ(rsids_of(result), std::vector<std::string>{"rs100"});

    criteria.chromosome = "13";
    criteria.disease = "alzheimer";
    EXPECT_EQ(execute_search(*store, criteria).total, 0);
}

TEST(ExecuteSearch, WildcardCharactersMatchLiterally) {
    auto store = clinical_store();

    FilterCriteria criteria;
    criteria.search_term = "%_";
    EXPECT_EQ(rsids_of(execute_search(*store, criteria)), std::vector<std::string>{"rs400"});

    criteria.search_term = "_";
    EXPECT_EQ(rsids_of(execute_search(*store, criteria)), std::vector<std::string>{"rs400"});
}

TEST(ExecuteSearch, RepeatedSearchIsStable) {
    auto store = clinical_store();

    FilterCriteria criteria;
    criteria.chromosome = "17";
    SearchResult a = execute_search(*store, criteria);
    SearchResult b = execute_search(*store, criteria);
    EXPECT_EQ(a.total, b.total);
    EXPECT_EQ(rsids_of(a), rsids_of(b));
}

TEST(ExecuteSearch, QueryFailurePropagates) {
    FailingStore store;
    FilterCriteria criteria;
    criteria.gene = "BRCA1";
    try {
        execute_search(store, criteria);
        FAIL() << "expected QUERY_EXECUTION_FAILED";
    } catch (const SNPMatcherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::QUERY_EXECUTION_FAILED);
    }
}

TEST(ExecuteSearch, CountAndPageShareTheFilter) {
    auto counting = std::make_shared<CountingStore>(clinical_store());
    FilterCriteria criteria;
    criteria.gene = "BRCA";
    criteria.limit = 1;
    criteria.offset = 1;

    SearchResult result = execute_search(*counting, criteria);
    EXPECT_EQ(result.total, 2);
    EXPECT_EQ(rsids_of(result), std::vector<std::string>{"rs200"});

    ASSERT_EQ(counting->sqls.size(), 2u);
    EXPECT_EQ(counting->param_counts[0], 3u);
    EXPECT_EQ(counting->param_counts[1], 5u);
}

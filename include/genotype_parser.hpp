/**
 * Genotype File Parser
 *
 * Reads consumer genotype exports in the 23andMe raw data layout:
 * '#' header lines, then whitespace-separated rsid, chromosome, position,
 * genotype. Files may be gzip-compressed.
 */

#ifndef GENOTYPE_PARSER_HPP
#define GENOTYPE_PARSER_HPP

#include "snp_matcher.hpp"

#include <string>
#include <vector>

namespace snpmatch {

/**
 * Parsed genotypes plus per-line diagnostics
 */
struct GenotypeParseResult {
    std::vector<UserGenotype> genotypes;
    size_t total_lines = 0;
    size_t skipped_lines = 0;             // Blank, comment and rejected lines
    std::vector<std::string> errors;      // "Line N: ..."
};

struct GenotypeValidation {
    bool valid = false;
    std::string reason;                   // Empty when valid
};

/**
 * Check whether an identifier looks like an rsid or 23andMe internal id
 * ("rs123", "i5000123"; case-insensitive)
 */
bool is_genotype_id(const std::string& id);

/**
 * Parse genotype text. Lines with fewer than 4 columns or an unrecognized
 * id are skipped and reported; rsids are lowercased.
 */
GenotypeParseResult parse_genotype_text(const std::string& content);

/**
 * Read and parse a genotype file (plain or gzip)
 * @throws std::runtime_error if the file cannot be opened or read
 */
GenotypeParseResult parse_genotype_file(const std::string& path);

/**
 * Quick format check on the first 100 lines: needs '#' header lines and at
 * least one data line starting with an id
 */
GenotypeValidation validate_genotype_text(const std::string& content);

/**
 * @throws std::runtime_error if the file cannot be opened or read
 */
GenotypeValidation validate_genotype_file(const std::string& path);

} // namespace snpmatch

#endif // GENOTYPE_PARSER_HPP

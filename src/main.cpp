/**
 * SNP Matcher - Main Entry Point
 *
 * Loads a SNP annotation database (local file or URL) into memory and either
 * matches a 23andMe genotype file against it or browses it with filters.
 */

#include "snp_matcher.hpp"
#include "cli_options.hpp"
#include "genotype_parser.hpp"
#include "worker_rpc.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "SNP Matcher - In-Memory SNP Annotation Lookup\n"
              << "=============================================\n\n"
              << "Usage: " << program_name << " --db LOCATION [OPTIONS]\n\n"
              << "Database:\n"
              << "  --db LOCATION           SQLite database file or http(s) URL\n"
              << "                          (gzip-compressed images are accepted)\n"
              << "  --table NAME            Table holding the SNP records (default: snps)\n\n"
              << "Matching:\n"
              << "  --genotypes FILE        23andMe raw data file (.txt or .txt.gz)\n"
              << "  --batch-size N          Identifiers per lookup query (default: 500)\n\n"
              << "Browsing (any of these runs a search):\n"
              << "  --search TEXT           Substring of rsid, gene, content or disease\n"
              << "  --chromosome CHR        Exact chromosome\n"
              << "  --gene NAME             Substring of gene names\n"
              << "  --clin-sig TEXT         Substring of clinical significance\n"
              << "  --disease TEXT          Substring of disease name\n"
              << "  --limit N               Page size (default: 50)\n"
              << "  --offset N              Rows to skip (default: 0)\n"
              << "  --details               Print every known field of each result\n\n"
              << "Other Options:\n"
              << "  --stats                 Print the number of SNPs in the database\n"
              << "  --config FILE           Read options from FILE (key = value per line)\n"
              << "  --connect-timeout MS    Download connect timeout (default: 30000)\n"
              << "  --transfer-timeout MS   Download transfer timeout (default: none)\n"
              << "  --user-agent TEXT       HTTP User-Agent for downloads\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n\n"
              << "Examples:\n"
              << "  # Match a 23andMe export\n"
              << "  " << program_name << " --db snps.db --genotypes genome.txt > matches.tsv\n\n"
              << "  # Browse pathogenic variants on chromosome 7\n"
              << "  " << program_name << " --db https://example.org/snps.db.gz \\\n"
              << "      --chromosome 7 --clin-sig pathogenic --limit 20\n"
              << std::endl;
}

// Tabs and line breaks inside values would break the TSV layout
static std::string tsv_field(const std::optional<std::string>& value) {
    if (!value) return "";
    std::string field = *value;
    for (char& c : field) {
        if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    return field;
}

static std::string tsv_field(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : "";
}

static void print_record_row(const snpmatch::SNPRecord& snp) {
    std::cout << snp.rsid << "\t"
              << tsv_field(snp.chromosome) << "\t"
              << tsv_field(snp.position) << "\t"
              << tsv_field(snp.gene) << "\t"
              << tsv_field(snp.clin_sig) << "\t"
              << tsv_field(snp.clin_disease) << "\t"
              << tsv_field(std::optional<std::string>(snp.content)) << "\n";
}

static void print_record_details(const snpmatch::SNPRecord& snp) {
    std::cout << "\n=== " << snp.rsid << " ===" << std::endl;

    auto summary = snp.get_summary();
    for (const auto& [key, value] : summary) {
        std::cout << key << ": " << value << std::endl;
    }
}

int main(int argc, char* argv[]) {
    snpmatch::CliOptions options;
    try {
        options = snpmatch::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const snpmatch::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    // Set log level
    if (options.debug) {
        snpmatch::set_log_level(snpmatch::LogLevel::DEBUG);
    }

    // Validate required arguments
    if (options.db_location.empty()) {
        std::cerr << "Error: --db is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (options.genotypes_path.empty() && !options.search && !options.stats) {
        std::cerr << "Error: One of --genotypes, a search option, or --stats is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Read genotypes before downloading anything
        snpmatch::GenotypeParseResult parsed;
        if (!options.genotypes_path.empty()) {
            auto validation = snpmatch::validate_genotype_file(options.genotypes_path);
            if (!validation.valid) {
                throw std::runtime_error(validation.reason);
            }
            parsed = snpmatch::parse_genotype_file(options.genotypes_path);
            for (const auto& error : parsed.errors) {
                snpmatch::log(snpmatch::LogLevel::DEBUG, error);
            }
            if (!parsed.errors.empty()) {
                snpmatch::log(snpmatch::LogLevel::WARNING,
                              std::to_string(parsed.errors.size()) + " malformed genotype lines skipped");
            }
        }

        snpmatch::MatcherClient client(options.engine);

        int last_percent = -1;
        client.load_database(options.db_location, [&last_percent](double percent) {
            int rounded = static_cast<int>(percent);
            if (rounded != last_percent) {
                last_percent = rounded;
                std::cerr << "\rLoading database: " << rounded << "%" << std::flush;
            }
        }).get();
        std::cerr << std::endl;

        if (options.stats) {
            auto stats = client.get_database_stats().get();
            std::cout << "Total SNPs: " << stats.total_snps << std::endl;
        }

        if (!options.genotypes_path.empty()) {
            auto matches = client.match_snps(parsed.genotypes, [](size_t processed, size_t total) {
                std::cerr << "\rMatching: " << processed << "/" << total << std::flush;
            }).get();
            std::cerr << std::endl;

            if (!options.details) {
                std::cout << "rsid\tgenotype\tchromosome\tposition\tgene\tclin_sig\tclin_disease\tcontent\n";
            }
            for (const auto& match : matches) {
                if (options.details) {
                    print_record_details(match.snp);
                    std::cout << "your genotype: " << match.genotype.genotype << std::endl;
                    continue;
                }
                std::cout << match.genotype.rsid << "\t" << match.genotype.genotype << "\t"
                          << match.genotype.chromosome << "\t" << match.genotype.position << "\t"
                          << tsv_field(match.snp.gene) << "\t"
                          << tsv_field(match.snp.clin_sig) << "\t"
                          << tsv_field(match.snp.clin_disease) << "\t"
                          << tsv_field(std::optional<std::string>(match.snp.content)) << "\n";
            }
            std::cerr << "Matched " << matches.size() << " of " << parsed.genotypes.size()
                      << " genotypes" << std::endl;
        }

        if (options.search) {
            if (!options.criteria.has_any_filter()) {
                snpmatch::log(snpmatch::LogLevel::INFO, "No filters given; listing all SNPs");
            }
            auto result = client.search_snps(options.criteria).get();

            if (options.details) {
                for (const auto& snp : result.results) {
                    print_record_details(snp);
                }
            } else {
                std::cout << "rsid\tchromosome\tposition\tgene\tclin_sig\tclin_disease\tcontent\n";
                for (const auto& snp : result.results) {
                    print_record_row(snp);
                }
            }

            int64_t first = result.results.empty() ? 0 : std::max(options.criteria.offset, 0) + 1;
            std::cerr << "Showing " << first << "-"
                      << (first == 0 ? 0 : first + static_cast<int64_t>(result.results.size()) - 1)
                      << " of " << result.total << " SNPs" << std::endl;
        }

    } catch (const snpmatch::SNPMatcherError& e) {
        std::cerr << "\nError (" << snpmatch::error_kind_to_string(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

/**
 * Command-line options for the snpmatch front end
 */

#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include "snp_matcher.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace snpmatch {

/**
 * Bad flag, missing value or unreadable config file
 */
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message) : std::invalid_argument(message) {}
};

struct CliOptions {
    std::string db_location;        // --db (URL or path)
    std::string genotypes_path;     // --genotypes
    FilterCriteria criteria;        // --search, --chromosome, --gene, --clin-sig, --disease
    bool search = false;            // Any search flag given
    bool stats = false;
    bool details = false;           // Print records as field blocks instead of TSV
    bool debug = false;
    bool help = false;
    EngineConfig engine;
};

/**
 * Split one config file line into argument tokens
 *
 * "key = value" and "key value" forms; '#' starts a comment; keys get a
 * "--" prefix unless they already start with '-'.
 */
std::vector<std::string> parse_config_line(const std::string& raw_line);

/**
 * Read a config file into argument tokens
 * @throws UsageError if the file cannot be opened
 */
std::vector<std::string> read_config_file(const std::string& path);

/**
 * Parse arguments (without the program name). "--config FILE" is expanded
 * in place, so later flags override the file.
 * @throws UsageError on unknown options, missing or malformed values
 */
CliOptions parse_command_line(const std::vector<std::string>& args);

} // namespace snpmatch

#endif // CLI_OPTIONS_HPP

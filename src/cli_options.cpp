/**
 * Command-line options for the snpmatch front end
 */

#include "cli_options.hpp"

#include <cctype>
#include <cstddef>
#include <fstream>
#include <set>
#include <sstream>

namespace snpmatch {

namespace {

// Nested --config files beyond this depth are treated as a cycle
const int MAX_CONFIG_DEPTH = 8;

template <typename T>
T parse_number(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return static_cast<T>(parsed);
    } catch (const std::logic_error&) {
        throw UsageError("Invalid value for " + option + ": " + value);
    }
}

} // anonymous namespace

std::vector<std::string> parse_config_line(const std::string& raw_line) {
    std::vector<std::string> result;
    std::string cfg_line = raw_line;

    // Strip comments
    size_t hash = cfg_line.find('#');
    if (hash != std::string::npos) cfg_line = cfg_line.substr(0, hash);

    cfg_line = trim(cfg_line);
    if (cfg_line.empty()) return result;

    // Parse "key = value" or "key value" format
    size_t eq = cfg_line.find('=');
    if (eq != std::string::npos) {
        std::string key = trim(cfg_line.substr(0, eq));
        std::string val = trim(cfg_line.substr(eq + 1));
        if (!key.empty()) {
            if (key[0] != '-') key = "--" + key;
            result.push_back(key);
            if (!val.empty()) result.push_back(val);
        }
    } else {
        std::istringstream cfg_iss(cfg_line);
        std::string token;
        while (cfg_iss >> token) {
            result.push_back(token);
        }
        if (!result.empty() && result[0][0] != '-') result[0] = "--" + result[0];
    }

    return result;
}

std::vector<std::string> read_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw UsageError("Cannot open config file: " + path);
    }

    std::vector<std::string> args;
    std::string line;
    while (std::getline(file, line)) {
        auto tokens = parse_config_line(line);
        args.insert(args.end(), tokens.begin(), tokens.end());
    }
    log(LogLevel::DEBUG, "Read " + std::to_string(args.size()) + " config tokens from " + path);
    return args;
}

CliOptions parse_command_line(const std::vector<std::string>& input) {
    CliOptions options;
    std::vector<std::string> args = input;
    int config_depth = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string arg = args[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw UsageError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--db") {
            options.db_location = value();
        } else if (arg == "--genotypes") {
            options.genotypes_path = value();
        } else if (arg == "--search") {
            options.criteria.search_term = value();
            options.search = true;
        } else if (arg == "--chromosome") {
            options.criteria.chromosome = value();
            options.search = true;
        } else if (arg == "--gene") {
            options.criteria.gene = value();
            options.search = true;
        } else if (arg == "--clin-sig") {
            options.criteria.clinical_significance = value();
            options.search = true;
        } else if (arg == "--disease") {
            options.criteria.disease = value();
            options.search = true;
        } else if (arg == "--limit") {
            options.criteria.limit = parse_number<int>(arg, value());
            options.search = true;
        } else if (arg == "--offset") {
            options.criteria.offset = parse_number<int>(arg, value());
            options.search = true;
        } else if (arg == "--stats") {
            options.stats = true;
        } else if (arg == "--details") {
            options.details = true;
        } else if (arg == "--batch-size") {
            int size = parse_number<int>(arg, value());
            if (size <= 0) throw UsageError("--batch-size must be positive");
            options.engine.batch_size = static_cast<size_t>(size);
        } else if (arg == "--table") {
            options.engine.table_name = value();
        } else if (arg == "--connect-timeout") {
            options.engine.connect_timeout_ms = parse_number<long>(arg, value());
        } else if (arg == "--transfer-timeout") {
            options.engine.transfer_timeout_ms = parse_number<long>(arg, value());
        } else if (arg == "--user-agent") {
            options.engine.user_agent = value();
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--config") {
            std::string path = value();
            if (++config_depth > MAX_CONFIG_DEPTH) {
                throw UsageError("Too many nested config files at: " + path);
            }
            auto tokens = read_config_file(path);
            args.insert(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, tokens.begin(), tokens.end());
        } else {
            throw UsageError("Unknown option: " + arg);
        }
    }

    return options;
}

} // namespace snpmatch

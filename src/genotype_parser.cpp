/**
 * Genotype File Parser
 */

#include "genotype_parser.hpp"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace snpmatch {

namespace {

const size_t VALIDATION_LINES = 100;

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

// gzread passes uncompressed files through unchanged
std::string read_genotype_file(const std::string& path) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        throw std::runtime_error("Cannot open genotype file: " + path);
    }

    std::string content;
    char buffer[65536];
    int n;
    while ((n = gzread(gz, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(n));
    }

    int errnum = Z_OK;
    std::string error = n < 0 ? gzerror(gz, &errnum) : "";
    gzclose(gz);

    if (n < 0) {
        throw std::runtime_error("Error reading genotype file " + path + ": " + error);
    }
    return content;
}

} // anonymous namespace

bool is_genotype_id(const std::string& id) {
    static const std::regex id_regex(R"(^(rs|i)\d+)", std::regex::icase);
    return std::regex_search(id, id_regex);
}

GenotypeParseResult parse_genotype_text(const std::string& content) {
    GenotypeParseResult result;
    std::vector<std::string> lines = split_lines(content);
    result.total_lines = lines.size();

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);

        if (line.empty() || line[0] == '#') {
            result.skipped_lines++;
            continue;
        }

        std::vector<std::string> parts = split_whitespace(line);
        std::string prefix = "Line " + std::to_string(i + 1) + ": ";

        if (parts.size() < 4) {
            result.errors.push_back(prefix + "Invalid format - expected 4 columns, got " +
                                    std::to_string(parts.size()));
            result.skipped_lines++;
            continue;
        }

        if (!is_genotype_id(parts[0])) {
            result.errors.push_back(prefix + "Invalid rsid format: " + parts[0]);
            result.skipped_lines++;
            continue;
        }

        UserGenotype genotype;
        genotype.rsid = parts[0];
        std::transform(genotype.rsid.begin(), genotype.rsid.end(), genotype.rsid.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        genotype.chromosome = parts[1];
        genotype.position = parts[2];
        genotype.genotype = parts[3];
        result.genotypes.push_back(std::move(genotype));
    }

    return result;
}

GenotypeParseResult parse_genotype_file(const std::string& path) {
    log(LogLevel::INFO, "Reading genotypes from: " + path);
    GenotypeParseResult result = parse_genotype_text(read_genotype_file(path));
    log(LogLevel::INFO, "Parsed " + std::to_string(result.genotypes.size()) + " genotypes (" +
                        std::to_string(result.skipped_lines) + " lines skipped, " +
                        std::to_string(result.errors.size()) + " errors)");
    return result;
}

GenotypeValidation validate_genotype_text(const std::string& content) {
    std::vector<std::string> lines = split_lines(content);
    if (lines.size() > VALIDATION_LINES) lines.resize(VALIDATION_LINES);

    bool has_comments = false;
    bool has_ids = false;
    for (const auto& raw : lines) {
        std::string line = trim(raw);
        if (!line.empty() && line[0] == '#') {
            has_comments = true;
        } else if (is_genotype_id(line)) {
            has_ids = true;
        }
    }

    GenotypeValidation validation;
    if (!has_comments) {
        validation.reason = "File doesn't appear to have 23andMe format headers (no # comment lines)";
    } else if (!has_ids) {
        validation.reason = "File doesn't contain valid SNP data (no rsid entries found)";
    } else {
        validation.valid = true;
    }
    return validation;
}

GenotypeValidation validate_genotype_file(const std::string& path) {
    return validate_genotype_text(read_genotype_file(path));
}

} // namespace snpmatch

#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xrd_match::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
// <YYYYmmdd_HHMMSS>_[label_]<8 hex>; label is usually the input file stem.
std::string get_run_id(const std::string& label = "");

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
// Streams the file; throws IOError when it cannot be read.
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Parses the whole (trimmed) field as a double. Accepts the forms strtod
// accepts, including "nan" and "inf".
std::optional<double> parse_double(const std::string& field);

// Wildcard matching on file names ('*', '?'), case-insensitive
bool glob_match(const std::string& pattern, const std::string& str);
std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern);

// Population mean / standard deviation
double mean_of(const VectorXd& v);
double stddev_of(const VectorXd& v);

} // namespace xrd_match::core

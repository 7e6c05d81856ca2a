#pragma once

#include "xrd_match/core/types.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace xrd_match::io {

namespace fs = std::filesystem;

constexpr int kFormatScanLines = 50;
constexpr int kDefaultSkipRows = 20;

// Best-effort description of where the numeric table starts. Treat as a hint:
// readers retry with other delimiters when it does not parse.
struct FormatHint {
  int skip_rows = kDefaultSkipRows;
  std::array<int, 2> columns{0, 1};
  std::optional<char> delimiter;  // nullopt = runs of whitespace
  std::string encoding = "utf-8";
  bool detected = false;          // false when the default was used
};

struct ReadOptions {
  std::string label;              // e.g. "primary", "comma"
  int skip_rows = 0;
  std::array<int, 2> columns{0, 1};
  std::optional<char> delimiter;  // nullopt = runs of whitespace
  char comment = '#';
};

struct ReadResult {
  SeriesTable table;
  FormatHint hint;                 // detected before the chain ran
  ReadOptions options;             // the attempt that succeeded
  std::vector<std::string> failures;  // messages of earlier attempts
};

// Encodings tried by detect_format, in priority order.
const std::vector<std::string> &candidate_encodings();

// True if the bytes form valid text in the given encoding
// ("utf-8", "gbk", "latin1", "ascii").
bool is_valid_encoding(const std::string &bytes, const std::string &encoding);

// Blank lines and lines starting with '#', "PDF", "Ref:", "CELL:", "Strong",
// "Radiation" or '%'.
bool is_metadata_line(const std::string &trimmed_line);

FormatHint detect_format(const fs::path &path);

// Reads two columns. Missing cells become NaN; a present cell that is not a
// number, an unreadable file, or zero data rows throw IngestFormatError.
SeriesTable read_table(const fs::path &path, const ReadOptions &options);

// Guesses a single-character delimiter from the data-looking lines among the
// first max_lines. nullopt means whitespace.
std::optional<char> sniff_delimiter(const fs::path &path,
                                    int max_lines = kFormatScanLines);

ReadOptions primary_read_options(const FormatHint &hint);

// Primary hint, then whitespace / comma / tab / sniffed delimiter without
// header skip.
std::vector<ReadOptions> series_read_chain(const FormatHint &hint,
                                           const fs::path &path);

// Primary hint, then whitespace / comma / tab with the same skip, then
// whitespace with the skip reduced by 10.
std::vector<ReadOptions> reference_read_chain(const FormatHint &hint);

// Tries each option in order and returns the first table the predicate
// accepts. Throws IngestFormatError naming the last failure when none does.
ReadResult read_first_accepted(
    const fs::path &path, const std::vector<ReadOptions> &chain,
    const std::function<bool(const SeriesTable &)> &accept);

// detect_format + series_read_chain + read_first_accepted
ReadResult read_series(const fs::path &path);

std::string describe_read_options(const ReadOptions &options);

} // namespace xrd_match::io

#include "xrd_match/io/table_reader.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

namespace xrd_match::io {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

void strip_bom(std::string& line) {
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB &&
        static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
    }
}

std::vector<std::string> split_fields(const std::string& line, const std::optional<char>& delimiter) {
    if (delimiter) {
        return core::split(line, *delimiter);
    }
    return core::split_whitespace(line);
}

bool fields_numeric(const std::vector<std::string>& parts, int a, int b) {
    const int n = static_cast<int>(parts.size());
    if (a >= n || b >= n) return false;
    return core::parse_double(parts[static_cast<size_t>(a)]).has_value() &&
           core::parse_double(parts[static_cast<size_t>(b)]).has_value();
}

std::vector<std::string> read_head_lines(std::ifstream& file, int max_lines) {
    std::vector<std::string> lines;
    std::string line;
    while (static_cast<int>(lines.size()) < max_lines && std::getline(file, line)) {
        strip_cr(line);
        lines.push_back(line);
    }
    if (!lines.empty()) {
        strip_bom(lines.front());
    }
    return lines;
}

bool looks_like_data(const std::string& trimmed) {
    if (trimmed.empty()) return false;
    const char c = trimmed.front();
    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.';
}

} // namespace

const std::vector<std::string>& candidate_encodings() {
    static const std::vector<std::string> encodings = {"utf-8", "gbk", "latin1", "ascii"};
    return encodings;
}

bool is_valid_encoding(const std::string& bytes, const std::string& encoding) {
    const size_t n = bytes.size();

    if (encoding == "latin1") {
        return true;
    }

    if (encoding == "ascii") {
        return std::all_of(bytes.begin(), bytes.end(),
                           [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    }

    if (encoding == "gbk") {
        for (size_t i = 0; i < n; ++i) {
            const auto b = static_cast<unsigned char>(bytes[i]);
            if (b < 0x80) continue;
            if (b < 0x81 || b > 0xFE || i + 1 >= n) return false;
            const auto t = static_cast<unsigned char>(bytes[i + 1]);
            if (t < 0x40 || t > 0xFE || t == 0x7F) return false;
            ++i;
        }
        return true;
    }

    if (encoding == "utf-8") {
        for (size_t i = 0; i < n; ++i) {
            const auto b = static_cast<unsigned char>(bytes[i]);
            size_t follow = 0;
            if (b < 0x80) {
                continue;
            } else if (b >= 0xC2 && b <= 0xDF) {
                follow = 1;
            } else if (b >= 0xE0 && b <= 0xEF) {
                follow = 2;
            } else if (b >= 0xF0 && b <= 0xF4) {
                follow = 3;
            } else {
                return false;
            }
            if (i + follow >= n) return false;
            for (size_t k = 1; k <= follow; ++k) {
                if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80) return false;
            }
            i += follow;
        }
        return true;
    }

    return false;
}

bool is_metadata_line(const std::string& trimmed_line) {
    static const char* kPrefixes[] = {"#", "PDF", "Ref:", "CELL:", "Strong", "Radiation", "%"};
    if (trimmed_line.empty()) return true;
    for (const char* prefix : kPrefixes) {
        if (core::starts_with(trimmed_line, prefix)) return true;
    }
    return false;
}

FormatHint detect_format(const fs::path& path) {
    FormatHint fallback;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return fallback;
    }

    const std::vector<std::string> lines = read_head_lines(file, kFormatScanLines);
    const std::string sampled = core::join(lines, "\n");

    for (const auto& encoding : candidate_encodings()) {
        if (!is_valid_encoding(sampled, encoding)) {
            continue;
        }

        for (size_t i = 0; i < lines.size(); ++i) {
            const std::string line = core::trim(lines[i]);
            if (is_metadata_line(line)) {
                continue;
            }

            std::optional<char> delimiter;
            if (line.find('\t') != std::string::npos) {
                delimiter = '\t';
            } else if (line.find(',') != std::string::npos) {
                delimiter = ',';
            }
            const auto parts = split_fields(line, delimiter);

            FormatHint hint;
            hint.skip_rows = static_cast<int>(i);
            hint.delimiter = delimiter;
            hint.encoding = encoding;
            hint.detected = true;

            if (fields_numeric(parts, 0, 1)) {
                hint.columns = {0, 1};
                return hint;
            }
            // An intervening column, e.g. d-spacing or an hkl index
            if (fields_numeric(parts, 0, 2)) {
                hint.columns = {0, 2};
                return hint;
            }
        }

        FormatHint def;
        def.encoding = encoding;
        return def;
    }

    return fallback;
}

SeriesTable read_table(const fs::path& path, const ReadOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IngestFormatError("Cannot open file: " + path.string());
    }

    SeriesTable table;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        strip_cr(line);
        if (line_no == 1) strip_bom(line);
        if (line_no <= options.skip_rows) {
            continue;
        }

        const auto comment_pos = line.find(options.comment);
        if (comment_pos != std::string::npos) {
            line.erase(comment_pos);
        }
        if (core::trim(line).empty()) {
            continue;
        }

        const auto parts = split_fields(line, options.delimiter);
        double values[2] = {kNaN, kNaN};
        for (int c = 0; c < 2; ++c) {
            const int col = options.columns[static_cast<size_t>(c)];
            if (col < 0 || col >= static_cast<int>(parts.size())) {
                continue;
            }
            const std::string& field = parts[static_cast<size_t>(col)];
            if (core::trim(field).empty()) {
                continue;
            }
            const auto v = core::parse_double(field);
            if (!v) {
                throw IngestFormatError("non-numeric value '" + core::trim(field) + "' at line " +
                                        std::to_string(line_no) + ", column " + std::to_string(col) +
                                        " of " + path.string() + " (" +
                                        describe_read_options(options) + ")");
            }
            values[c] = *v;
        }

        table.x.push_back(values[0]);
        table.y.push_back(values[1]);
    }

    if (table.empty()) {
        throw IngestFormatError("no data rows in " + path.string() + " (" +
                                describe_read_options(options) + ")");
    }
    return table;
}

std::optional<char> sniff_delimiter(const fs::path& path, int max_lines) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    static const char kCandidates[] = {',', '\t', ';', '|'};
    std::map<char, std::vector<size_t>> counts;

    for (const auto& raw : read_head_lines(file, max_lines)) {
        const std::string line = core::trim(raw);
        if (!looks_like_data(line)) {
            continue;
        }
        for (char c : kCandidates) {
            counts[c].push_back(static_cast<size_t>(std::count(line.begin(), line.end(), c)));
        }
    }

    // A delimiter must appear the same, non-zero number of times on every data line.
    for (char c : kCandidates) {
        const auto it = counts.find(c);
        if (it == counts.end() || it->second.empty()) continue;
        const auto& v = it->second;
        if (v.front() > 0 && std::all_of(v.begin(), v.end(), [&](size_t k) { return k == v.front(); })) {
            return c;
        }
    }
    return std::nullopt;
}

ReadOptions primary_read_options(const FormatHint& hint) {
    ReadOptions opts;
    opts.label = "primary";
    opts.skip_rows = hint.skip_rows;
    opts.columns = hint.columns;
    opts.delimiter = hint.delimiter;
    return opts;
}

std::vector<ReadOptions> series_read_chain(const FormatHint& hint, const fs::path& path) {
    std::vector<ReadOptions> chain;
    chain.push_back(primary_read_options(hint));

    ReadOptions ws;
    ws.label = "whitespace";
    chain.push_back(ws);

    ReadOptions comma;
    comma.label = "comma";
    comma.delimiter = ',';
    chain.push_back(comma);

    ReadOptions tab;
    tab.label = "tab";
    tab.delimiter = '\t';
    chain.push_back(tab);

    const auto sniffed = sniff_delimiter(path);
    if (sniffed && *sniffed != ',' && *sniffed != '\t') {
        ReadOptions sn;
        sn.label = "sniffed";
        sn.delimiter = sniffed;
        chain.push_back(sn);
    }
    return chain;
}

std::vector<ReadOptions> reference_read_chain(const FormatHint& hint) {
    std::vector<ReadOptions> chain;
    chain.push_back(primary_read_options(hint));

    ReadOptions ws;
    ws.label = "whitespace";
    ws.skip_rows = hint.skip_rows;
    ws.columns = hint.columns;
    chain.push_back(ws);

    ReadOptions comma = ws;
    comma.label = "comma";
    comma.delimiter = ',';
    chain.push_back(comma);

    ReadOptions tab = ws;
    tab.label = "tab";
    tab.delimiter = '\t';
    chain.push_back(tab);

    ReadOptions reduced = ws;
    reduced.label = "whitespace_reduced_skip";
    reduced.skip_rows = std::max(0, hint.skip_rows - 10);
    chain.push_back(reduced);

    return chain;
}

ReadResult read_first_accepted(const fs::path& path, const std::vector<ReadOptions>& chain,
                               const std::function<bool(const SeriesTable&)>& accept) {
    ReadResult result;
    for (const auto& options : chain) {
        try {
            SeriesTable table = read_table(path, options);
            if (accept && !accept(table)) {
                result.failures.push_back(describe_read_options(options) + ": rejected table");
                continue;
            }
            result.table = std::move(table);
            result.options = options;
            return result;
        } catch (const IngestFormatError& e) {
            result.failures.push_back(e.what());
        }
    }

    std::string last = result.failures.empty() ? "no read strategy configured" : result.failures.back();
    throw IngestFormatError("all " + std::to_string(chain.size()) + " read strategies failed for " +
                            path.string() + "; last: " + last);
}

ReadResult read_series(const fs::path& path) {
    const FormatHint hint = detect_format(path);
    auto has_complete_row = [](const SeriesTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            if (!std::isnan(t.x[i]) && !std::isnan(t.y[i])) return true;
        }
        return false;
    };
    ReadResult result = read_first_accepted(path, series_read_chain(hint, path), has_complete_row);
    result.hint = hint;
    return result;
}

std::string describe_read_options(const ReadOptions& options) {
    std::ostringstream oss;
    oss << options.label << ": skip=" << options.skip_rows << " cols=[" << options.columns[0] << ","
        << options.columns[1] << "] sep=";
    if (!options.delimiter) {
        oss << "whitespace";
    } else if (*options.delimiter == '\t') {
        oss << "tab";
    } else {
        oss << "'" << *options.delimiter << "'";
    }
    return oss.str();
}

} // namespace xrd_match::io

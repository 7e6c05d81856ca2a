#include "xrd_match/reference/catalog.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/utils.hpp"
#include "xrd_match/io/table_reader.hpp"
#include "xrd_match/signal/cleaning.hpp"

#include <algorithm>
#include <fstream>
#include <numeric>

namespace xrd_match::reference {

namespace {

const std::string kReferencePrefix = "reference_";

void note_phase(CatalogBuildResult &result, const std::string &phase) {
    auto &phases = result.loaded_phases;
    if (std::find(phases.begin(), phases.end(), phase) == phases.end()) {
        phases.push_back(phase);
    }
}

// Returns the number of peaks appended.
size_t load_raw_file(const fs::path &path, const std::string &symbol, CatalogBuildResult &result) {
    const std::string phase = phase_id_from_path(path);
    const io::FormatHint hint = io::detect_format(path);

    io::ReadResult read;
    try {
        read = io::read_first_accepted(path, io::reference_read_chain(hint),
                                       [](const SeriesTable &t) {
                                           return !signal::drop_invalid_rows(t).empty();
                                       });
    } catch (const IngestFormatError &e) {
        result.issues.push_back({path, "error", e.what()});
        return 0;
    }

    const SeriesTable rows = signal::drop_invalid_rows(read.table);
    std::vector<size_t> order(rows.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return rows.x[a] < rows.x[b]; });

    for (size_t idx : order) {
        result.catalog.push_back({rows.x[idx], rows.y[idx], phase, symbol});
    }
    note_phase(result, phase);
    return order.size();
}

size_t load_extracted_file(const fs::path &path, CatalogBuildResult &result) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.issues.push_back({path, "error", "cannot open reference file: " + path.string()});
        return 0;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (lines.empty() && core::starts_with(line, "\xEF\xBB\xBF")) {
            line.erase(0, 3);
        }
        lines.push_back(core::trim(line));
    }

    const std::string stem = path.stem().string();
    std::string file_phase;
    std::string file_symbol;
    if (core::starts_with(stem, kReferencePrefix)) {
        file_phase = stem.substr(kReferencePrefix.size());
    }
    for (const auto &l : lines) {
        if (core::starts_with(l, "# Phase:") && file_phase.empty()) {
            file_phase = core::trim(l.substr(l.find(':') + 1));
        } else if (core::starts_with(l, "# Symbol:")) {
            file_symbol = core::trim(l.substr(l.find(':') + 1));
        }
    }
    if (file_phase.empty()) {
        file_phase = stem;
    }

    size_t added = 0;
    size_t out_of_range = 0;
    for (const auto &l : lines) {
        if (l.empty() || l[0] == '#') continue;
        const auto parts = core::split(l, ',');
        if (parts.size() < 3) continue;
        const auto angle = core::parse_double(parts[0]);
        if (!angle) continue;
        if (!signal::is_valid_row(*angle, 0.0)) {
            ++out_of_range;
            continue;
        }

        std::string phase = core::trim(parts[1]);
        std::string symbol = core::trim(parts[2]);
        if (phase.empty()) phase = file_phase;
        if (symbol.empty()) symbol = file_symbol;

        result.catalog.push_back({*angle, 0.0, phase, symbol});
        note_phase(result, phase);
        ++added;
    }

    if (out_of_range > 0) {
        result.issues.push_back({path, "warning",
                                 std::to_string(out_of_range) + " peak(s) outside (0,180) dropped"});
    }
    if (added == 0) {
        result.issues.push_back({path, "warning", "no reference peaks in " + path.string()});
    }
    return added;
}

[[noreturn]] void throw_no_reference_data(const std::vector<fs::path> &paths,
                                          const CatalogBuildResult &result) {
    std::string msg = "no usable peaks in " + std::to_string(paths.size()) + " reference file(s)";
    for (const auto &issue : result.issues) {
        if (issue.severity == "error") {
            msg += "; first error: " + issue.message;
            break;
        }
    }
    throw NoReferenceDataError(msg);
}

} // namespace

std::string reference_format_to_string(ReferenceFormat format) {
    switch (format) {
        case ReferenceFormat::AUTO: return "auto";
        case ReferenceFormat::RAW: return "raw";
        case ReferenceFormat::EXTRACTED: return "extracted";
        default: return "unknown";
    }
}

ReferenceFormat string_to_reference_format(const std::string &s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "auto") return ReferenceFormat::AUTO;
    if (norm == "raw") return ReferenceFormat::RAW;
    if (norm == "extracted") return ReferenceFormat::EXTRACTED;
    throw ValidationError("unknown reference format '" + s + "' (auto|raw|extracted)");
}

std::string phase_id_from_path(const fs::path &path) {
    const std::string name = path.filename().string();
    return name.substr(0, name.find('.'));
}

CatalogBuildResult build_catalog(const std::vector<fs::path> &paths,
                                 const std::vector<std::string> &symbol_pool) {
    CatalogBuildResult result;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i >= symbol_pool.size()) {
            result.issues.push_back({paths[i], "warning",
                                     "symbol pool exhausted (" + std::to_string(symbol_pool.size()) +
                                         "), file skipped"});
            continue;
        }
        load_raw_file(paths[i], symbol_pool[i], result);
    }

    if (result.catalog.empty()) {
        throw_no_reference_data(paths, result);
    }
    return result;
}

CatalogBuildResult load_extracted_references(const std::vector<fs::path> &paths) {
    CatalogBuildResult result;
    for (const auto &path : paths) {
        load_extracted_file(path, result);
    }

    if (result.catalog.empty()) {
        throw_no_reference_data(paths, result);
    }
    return result;
}

bool is_extracted_format(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;

    std::string line;
    while (std::getline(file, line)) {
        const std::string l = core::trim(line);
        if (l.empty() || l[0] == '#') continue;
        const auto parts = core::split(l, ',');
        if (parts.size() < 3) return false;
        const std::string phase = core::trim(parts[1]);
        return core::parse_double(parts[0]).has_value() && !phase.empty() &&
               !core::parse_double(phase).has_value();
    }
    return false;
}

CatalogBuildResult load_references(const std::vector<fs::path> &paths,
                                   ReferenceFormat format,
                                   const std::vector<std::string> &symbol_pool) {
    switch (format) {
        case ReferenceFormat::RAW: return build_catalog(paths, symbol_pool);
        case ReferenceFormat::EXTRACTED: return load_extracted_references(paths);
        default: break;
    }

    CatalogBuildResult result;
    size_t raw_index = 0;
    for (const auto &path : paths) {
        if (is_extracted_format(path)) {
            load_extracted_file(path, result);
            continue;
        }
        if (raw_index >= symbol_pool.size()) {
            result.issues.push_back({path, "warning",
                                     "symbol pool exhausted (" + std::to_string(symbol_pool.size()) +
                                         "), file skipped"});
            continue;
        }
        load_raw_file(path, symbol_pool[raw_index++], result);
    }

    if (result.catalog.empty()) {
        throw_no_reference_data(paths, result);
    }
    return result;
}

} // namespace xrd_match::reference

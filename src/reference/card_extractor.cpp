#include "xrd_match/reference/card_extractor.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>

#include <nlohmann/json.hpp>

namespace xrd_match::reference {

namespace {

std::vector<std::string> read_lines(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open card file: " + path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool is_placeholder_name(const std::string &name) {
    const std::string lower = core::to_lower(name);
    return lower == "untitled" || lower == "unnamed" || lower == "file";
}

} // namespace

std::vector<double> extract_card_peaks(const fs::path &path, double intensity_threshold) {
    static const std::regex kPeakRow(R"(^\s*(\d+\.\d+)\s+[\d.]+\s+([\d.]+))");

    std::vector<double> angles;
    for (const auto &line : read_lines(path)) {
        std::smatch m;
        if (!std::regex_search(line, m, kPeakRow)) continue;
        const auto angle = core::parse_double(m[1].str());
        const auto intensity = core::parse_double(m[2].str());
        if (!angle || !intensity) continue;
        if (*intensity >= intensity_threshold) {
            angles.push_back(*angle);
        }
    }
    return angles;
}

std::string clean_phase_name(const std::string &name) {
    const std::string stem = fs::path(core::trim(name)).filename().stem().string();

    std::string out;
    for (char c : stem) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalnum(u) || c == '_' || c == '-') {
            out.push_back(c);
        }
    }
    return out.empty() ? "UnknownPhase" : out;
}

std::string phase_name_for_card(const fs::path &path) {
    const std::string phase = clean_phase_name(path.filename().string());
    if (!is_placeholder_name(phase)) {
        return phase;
    }

    const auto lines = read_lines(path);
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (lines[i].find("PDF#") != std::string::npos) {
            return clean_phase_name(lines[i + 1]);
        }
    }
    return "UnknownPhase";
}

std::string format_angle(double value) {
    return nlohmann::json(value).dump();
}

fs::path write_extracted_reference(const fs::path &dir, const std::string &phase,
                                   const std::string &symbol, double intensity_threshold,
                                   const std::vector<double> &angles) {
    if (angles.empty()) {
        throw ValidationError("no peaks with relative intensity >= " +
                              format_angle(intensity_threshold) + " for phase " + phase);
    }

    std::string text;
    text += "# Phase: " + phase + "\n";
    text += "# Symbol: " + symbol + "\n";
    text += "# Intensity Threshold: >= " + format_angle(intensity_threshold) + "\n";
    text += "# Format: 2-Theta,PhaseName,Symbol\n";
    text += "# ----------------------------------\n";
    for (double a : angles) {
        text += format_angle(a) + "," + phase + "," + symbol + "\n";
    }

    const fs::path out = dir / ("reference_" + phase + ".txt");
    core::write_text(out, text);
    return out;
}

CardExtraction extract_card(const fs::path &card, const std::string &symbol,
                            double intensity_threshold, const fs::path &output_dir) {
    CardExtraction res;
    res.phase = phase_name_for_card(card);
    res.angles = extract_card_peaks(card, intensity_threshold);
    res.output = write_extracted_reference(output_dir, res.phase, symbol, intensity_threshold,
                                           res.angles);
    return res;
}

} // namespace xrd_match::reference

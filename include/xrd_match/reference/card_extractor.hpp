#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace xrd_match::reference {

namespace fs = std::filesystem;

constexpr double kDefaultCardIntensityThreshold = 40.0;

// Angles of the peak rows ("<2theta> <d> <I> ...") whose relative intensity
// is >= threshold, in file order. Throws IOError if the file cannot be read.
std::vector<double> extract_card_peaks(const fs::path &path,
                                       double intensity_threshold = kDefaultCardIntensityThreshold);

// Base name without extension, reduced to word characters, '-' and non-ASCII
// text. Returns "UnknownPhase" when nothing is left.
std::string clean_phase_name(const std::string &name);

// Phase name from the card's file name. Placeholder names (untitled, unnamed,
// file) fall back to the line following the first "PDF#" line.
std::string phase_name_for_card(const fs::path &path);

// Shortest decimal text that reads back as the same double, as nlohmann::json
// prints it; whole numbers keep a fractional part ("30.0").
std::string format_angle(double value);

// Writes <dir>/reference_<phase>.txt and returns its path. Throws
// ValidationError when angles is empty, IOError when the file cannot be written.
fs::path write_extracted_reference(const fs::path &dir, const std::string &phase,
                                   const std::string &symbol, double intensity_threshold,
                                   const std::vector<double> &angles);

struct CardExtraction {
  std::string phase;
  std::vector<double> angles;
  fs::path output;
};

// phase_name_for_card + extract_card_peaks + write_extracted_reference
CardExtraction extract_card(const fs::path &card, const std::string &symbol,
                            double intensity_threshold, const fs::path &output_dir);

} // namespace xrd_match::reference

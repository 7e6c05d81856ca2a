#pragma once

#include "xrd_match/core/types.hpp"

#include <vector>

namespace xrd_match::matching {

// Assigns detected peaks to catalog entries within +-tolerance degrees.
//
// PHASE_FIRST walks phases in first-appearance order and gives each reference
// peak the strongest detected peak in range that no earlier reference peak
// has claimed. PEAK_FIRST gives each detected peak its closest catalog entry
// (ties: higher catalog intensity, then catalog order); detected peaks may
// share a reference peak.
//
// Matches are ordered by detected angle. Throws InvalidToleranceError for a
// tolerance that is not a positive finite number, then NoReferenceDataError
// for an empty catalog.
MatchSet match_peaks(const std::vector<DetectedPeak> &peaks,
                     const ReferenceCatalog &catalog, double tolerance,
                     MatchPolicy policy);

} // namespace xrd_match::matching

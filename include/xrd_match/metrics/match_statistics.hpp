#pragma once

#include "xrd_match/core/types.hpp"

namespace xrd_match::metrics {

// Match rate and per-phase share of the matched peaks. Phases are ordered by
// descending count, ties by first appearance among the matches.
MatchReport compute_statistics(int total_detected, const MatchSet &match_set);

} // namespace xrd_match::metrics

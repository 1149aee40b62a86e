#include "ScoringPolicy.hpp"

#include <utility>

namespace seqdiff {

GapPenalty::GapPenalty(int32_t open, int32_t extend) : open(open), extend(extend) {
	if (open >= 0) {
		throw ConfigurationError("gap_open must be < 0, got " + std::to_string(open));
	}
	if (extend >= 0) {
		throw ConfigurationError("gap_extend must be < 0, got " + std::to_string(extend));
	}
}

int64_t GapPenalty::cost(size_t length) const {
	if (length == 0) {
		return 0;
	}
	return static_cast<int64_t>(open) + static_cast<int64_t>(extend) * static_cast<int64_t>(length);
}

ScoringPolicy::ScoringPolicy(MatchFunction match_fn, GapPenalty gap) : match_fn_(std::move(match_fn)), gap_(gap) {
	if (!match_fn_) {
		throw ConfigurationError("match function must be callable");
	}
}

ScoringPolicy::ScoringPolicy(int32_t match, int32_t mismatch, GapPenalty gap)
    : ScoringPolicy(MatchScore {match, mismatch}, gap) {
}

} // namespace seqdiff

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace seqdiff {

// Raised when a scoring configuration is rejected at construction time
class ConfigurationError : public std::invalid_argument {
public:
	explicit ConfigurationError(const std::string &msg) : std::invalid_argument(msg) {
	}
};

// Affine gap penalty. A gap of length L costs open + extend * L, so the first
// gap symbol pays open + extend and every further symbol pays extend.
// Both fields must be strictly negative. Costs are summed in 64 bits.
struct GapPenalty {
	int32_t open;
	int32_t extend;

	GapPenalty(int32_t open, int32_t extend);

	int64_t cost(size_t length) const;
};

// Substitution score between two symbols
using MatchFunction = std::function<int32_t(uint8_t, uint8_t)>;

// Constant match/mismatch scores, the common case for nucleotides
struct MatchScore {
	int32_t match;
	int32_t mismatch;

	int32_t operator()(uint8_t a, uint8_t b) const {
		return a == b ? match : mismatch;
	}
};

class ScoringPolicy {
public:
	ScoringPolicy(MatchFunction match_fn, GapPenalty gap);
	ScoringPolicy(int32_t match, int32_t mismatch, GapPenalty gap);

	int32_t score(uint8_t a, uint8_t b) const {
		return match_fn_(a, b);
	}

	const GapPenalty &gap() const noexcept {
		return gap_;
	}

	// Cost of the first symbol of a gap
	int64_t gap_first() const noexcept {
		return static_cast<int64_t>(gap_.open) + gap_.extend;
	}

private:
	MatchFunction match_fn_;
	GapPenalty gap_;
};

} // namespace seqdiff

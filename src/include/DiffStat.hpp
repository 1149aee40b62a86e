#pragma once

#include "AlignmentResult.hpp"
#include "PairwiseAligner.hpp"
#include "ScoringPolicy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace seqdiff {

// A reference/query pair together with the scoring used to compare them.
// Both sequences are borrowed and must outlive the DiffStat. The most recent
// alignment is kept so it can be rendered or reduced to MutationStats.
class DiffStat {
public:
	DiffStat(std::string_view reference, std::string_view query, ScoringPolicy scoring);

	std::string_view reference() const noexcept {
		return reference_;
	}
	std::string_view query() const noexcept {
		return query_;
	}

	uint64_t levenshtein() const;
	// Throws LengthMismatchError when the sequences differ in length
	uint64_t hamming_distance() const;

	// Each call replaces the current alignment
	const AlignmentResult &align(AlignmentMode mode);
	const AlignmentResult &global();
	const AlignmentResult &local();
	const AlignmentResult &semiglobal();

	const std::optional<AlignmentResult> &alignment() const noexcept {
		return alignment_;
	}

	// Throws NotAlignedError before the first alignment
	std::string pretty(size_t width) const;

private:
	std::string_view reference_;
	std::string_view query_;
	PairwiseAligner aligner_;
	std::optional<AlignmentResult> alignment_;
};

} // namespace seqdiff

#pragma once

#include "AlignmentResult.hpp"

#include <cstdint>

namespace seqdiff {

class DiffStat;

// Mutation event counts of one alignment. After any sequence of add() calls:
//   total == matches + mismatches
//   mismatches == substitutions + insertions + deletions
struct MutationStats {
	int64_t matches = 0;
	int64_t mismatches = 0;
	int64_t substitutions = 0;
	int64_t insertions = 0;
	int64_t deletions = 0;
	int64_t total = 0;
	int64_t gap_opens = 0; // Maximal runs of INS or of DEL

	bool operator==(const MutationStats &other) const = default;

	// Clips are ignored and do not interrupt a gap run
	void add(AlignmentOperation op);

	// matches / total, 0 for an empty trace
	double identity() const;

private:
	AlignmentOperation last_gap_ = AlignmentOperation::MATCH;
	bool in_gap_ = false;
};

// Folds the operation trace of a completed alignment into MutationStats.
// The alignment is borrowed and must outlive the reducer.
class MutationReducer {
public:
	explicit MutationReducer(const AlignmentResult &alignment);
	// Throws NotAlignedError when no alignment has been run on the pair
	explicit MutationReducer(const DiffStat &diff);

	MutationStats reduce() const;

private:
	const AlignmentResult *alignment_;
};

MutationStats ReduceMutations(const AlignmentResult &alignment);

} // namespace seqdiff

#pragma once

#include "AlignmentResult.hpp"
#include "ScoringPolicy.hpp"

#include <memory>
#include <string_view>

namespace seqdiff {

// Affine-gap dynamic programming aligner (three-matrix formulation) with full
// traceback. O(n*m) time; scores are kept in rolling rows and the traceback in
// one byte per cell.
//
// Thread-safety: PairwiseAligner instances are NOT thread-safe for concurrent calls.
// The traceback buffer is reused across calls, so keep one instance per thread.
class PairwiseAligner {
public:
	explicit PairwiseAligner(ScoringPolicy scoring);
	// Pre-sizes the working buffers for sequences of the given lengths
	PairwiseAligner(ScoringPolicy scoring, size_t x_capacity, size_t y_capacity);
	~PairwiseAligner();

	// Non-copyable, movable
	PairwiseAligner(const PairwiseAligner &) = delete;
	PairwiseAligner &operator=(const PairwiseAligner &) = delete;
	PairwiseAligner(PairwiseAligner &&) noexcept;
	PairwiseAligner &operator=(PairwiseAligner &&) noexcept;

	// Both sequences consumed end to end
	AlignmentResult global(std::string_view x, std::string_view y);
	// Best-scoring pair of substrings; unaligned ends are clipped
	AlignmentResult local(std::string_view x, std::string_view y);
	// x consumed end to end, free leading/trailing overhang in y
	AlignmentResult semiglobal(std::string_view x, std::string_view y);

	AlignmentResult align(std::string_view x, std::string_view y, AlignmentMode mode);

	const ScoringPolicy &scoring() const noexcept;

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;
};

} // namespace seqdiff

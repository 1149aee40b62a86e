#include "DiffStat.hpp"
#include "DistanceMetrics.hpp"

#include <utility>

namespace seqdiff {

DiffStat::DiffStat(std::string_view reference, std::string_view query, ScoringPolicy scoring)
    : reference_(reference), query_(query), aligner_(std::move(scoring), reference.size(), query.size()) {
}

uint64_t DiffStat::levenshtein() const {
	return Levenshtein(reference_, query_);
}

uint64_t DiffStat::hamming_distance() const {
	return Hamming(reference_, query_);
}

const AlignmentResult &DiffStat::align(AlignmentMode mode) {
	alignment_ = aligner_.align(reference_, query_, mode);
	return *alignment_;
}

const AlignmentResult &DiffStat::global() {
	return align(AlignmentMode::GLOBAL);
}

const AlignmentResult &DiffStat::local() {
	return align(AlignmentMode::LOCAL);
}

const AlignmentResult &DiffStat::semiglobal() {
	return align(AlignmentMode::SEMIGLOBAL);
}

std::string DiffStat::pretty(size_t width) const {
	if (!alignment_) {
		throw NotAlignedError("Nothing to render; run global, local or semiglobal first");
	}
	return alignment_->pretty(reference_, query_, width);
}

} // namespace seqdiff

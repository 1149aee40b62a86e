#include "MutationStats.hpp"
#include "DiffStat.hpp"

namespace seqdiff {

void MutationStats::add(AlignmentOperation op) {
	switch (op) {
	case AlignmentOperation::MATCH:
		matches++;
		total++;
		in_gap_ = false;
		break;
	case AlignmentOperation::SUBST:
		substitutions++;
		mismatches++;
		total++;
		in_gap_ = false;
		break;
	case AlignmentOperation::INS:
	case AlignmentOperation::DEL:
		if (op == AlignmentOperation::INS) {
			insertions++;
		} else {
			deletions++;
		}
		mismatches++;
		total++;
		// Consecutive operations of the same kind form one gap; INS next to DEL is two
		if (!in_gap_ || last_gap_ != op) {
			gap_opens++;
		}
		in_gap_ = true;
		last_gap_ = op;
		break;
	case AlignmentOperation::XCLIP:
	case AlignmentOperation::YCLIP:
		break;
	}
}

double MutationStats::identity() const {
	if (total == 0) {
		return 0.0;
	}
	return static_cast<double>(matches) / static_cast<double>(total);
}

MutationReducer::MutationReducer(const AlignmentResult &alignment) : alignment_(&alignment) {
}

MutationReducer::MutationReducer(const DiffStat &diff) : alignment_(nullptr) {
	const auto &alignment = diff.alignment();
	if (!alignment) {
		throw NotAlignedError("Mutation statistics need an alignment; run global, local or semiglobal first");
	}
	alignment_ = &*alignment;
}

MutationStats MutationReducer::reduce() const {
	MutationStats stats;
	for (auto op : alignment_->operations) {
		stats.add(op);
	}
	return stats;
}

MutationStats ReduceMutations(const AlignmentResult &alignment) {
	return MutationReducer(alignment).reduce();
}

} // namespace seqdiff

#include "PairwiseAligner.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

namespace seqdiff {

namespace {

// Far enough from INT64_MIN that adding a few 32-bit scores or penalties cannot wrap around
constexpr int64_t NEGATIVE_INFINITY = std::numeric_limits<int64_t>::min() / 4;

// Which matrix the optimal value of a cell came from. FROM_START marks the
// first cell of an alignment: the traceback stops after emitting it.
enum TraceSource : uint8_t { FROM_M = 0, FROM_X = 1, FROM_Y = 2, FROM_START = 3 };

// One traceback byte per cell: bits 0-1 M source, bits 2-3 X source, bits 4-5 Y source
inline uint8_t PackTrace(uint8_t m_src, uint8_t x_src, uint8_t y_src) {
	return static_cast<uint8_t>(m_src | (x_src << 2) | (y_src << 4));
}

inline uint8_t MSource(uint8_t cell) {
	return cell & 0x3;
}

inline uint8_t XSource(uint8_t cell) {
	return (cell >> 2) & 0x3;
}

inline uint8_t YSource(uint8_t cell) {
	return (cell >> 4) & 0x3;
}

inline int64_t Floor(int64_t value) {
	return std::max<int64_t>(value, NEGATIVE_INFINITY);
}

// Cost of a leading gap of the given length, saturated at NEGATIVE_INFINITY
inline int64_t LeadingGap(const GapPenalty &gap, size_t length) {
	return Floor(gap.cost(length));
}

struct EndCell {
	int64_t score = NEGATIVE_INFINITY;
	size_t i = 0;
	size_t j = 0;
	uint8_t state = FROM_START;
	bool found = false;

	// Keeps the first maximum; M is preferred over X over Y within a cell
	void consider(size_t row, size_t col, int64_t m, int64_t x, int64_t y) {
		offer(row, col, m, FROM_M);
		offer(row, col, x, FROM_X);
		offer(row, col, y, FROM_Y);
	}

	void offer(size_t row, size_t col, int64_t value, uint8_t source) {
		if (value > score) {
			score = value;
			i = row;
			j = col;
			state = source;
			found = true;
		}
	}
};

} // namespace

struct PairwiseAligner::Impl {
	ScoringPolicy scoring;
	std::vector<uint8_t> traceback;
	std::vector<int64_t> prev_m, prev_x, prev_y;
	std::vector<int64_t> cur_m, cur_x, cur_y;

	explicit Impl(ScoringPolicy scoring_p) : scoring(std::move(scoring_p)) {
	}

	void reserve(size_t n, size_t m) {
		traceback.reserve((n + 1) * (m + 1));
		for (auto *row : {&prev_m, &prev_x, &prev_y, &cur_m, &cur_x, &cur_y}) {
			row->reserve(m + 1);
		}
	}

	AlignmentResult run(std::string_view x, std::string_view y, AlignmentMode mode);
};

AlignmentResult PairwiseAligner::Impl::run(std::string_view x, std::string_view y, AlignmentMode mode) {
	const size_t n = x.size();
	const size_t m = y.size();
	const size_t width = m + 1;
	const bool is_local = mode == AlignmentMode::LOCAL;
	const bool is_global = mode == AlignmentMode::GLOBAL;
	const bool is_semiglobal = mode == AlignmentMode::SEMIGLOBAL;
	const int64_t gap_first = scoring.gap_first();
	const int64_t extend = scoring.gap().extend;

	// Cells where an alignment may begin with a zero score. Local alignments
	// begin anywhere instead, through the max(0, .) in the M recurrence.
	auto is_start = [&](size_t i, size_t j) {
		if (is_global) {
			return i == 0 && j == 0;
		}
		return is_semiglobal && i == 0;
	};

	traceback.assign((n + 1) * width, PackTrace(FROM_START, FROM_START, FROM_START));
	for (auto *row : {&prev_m, &prev_x, &prev_y, &cur_m, &cur_x, &cur_y}) {
		row->assign(width, NEGATIVE_INFINITY);
	}

	// Row 0: only y has been consumed
	prev_m[0] = 0;
	for (size_t j = 1; j < width; j++) {
		prev_m[j] = is_semiglobal ? 0 : NEGATIVE_INFINITY;
		if (is_global) {
			prev_y[j] = LeadingGap(scoring.gap(), j);
			traceback[j] = PackTrace(FROM_START, FROM_START, j == 1 ? FROM_START : FROM_Y);
		}
	}

	EndCell end;
	if (n == 0) {
		if (is_global) {
			end.consider(0, m, prev_m[m], prev_x[m], prev_y[m]);
		} else if (is_semiglobal) {
			for (size_t j = 0; j < width; j++) {
				end.consider(0, j, prev_m[j], prev_x[j], prev_y[j]);
			}
		}
	}

	for (size_t i = 1; i <= n; i++) {
		const auto xi = static_cast<uint8_t>(x[i - 1]);
		uint8_t *trace_row = &traceback[i * width];

		cur_m[0] = NEGATIVE_INFINITY;
		cur_y[0] = NEGATIVE_INFINITY;
		if (is_local) {
			cur_x[0] = NEGATIVE_INFINITY;
		} else {
			cur_x[0] = LeadingGap(scoring.gap(), i);
			trace_row[0] = PackTrace(FROM_START, i == 1 ? FROM_START : FROM_X, FROM_START);
		}

		for (size_t j = 1; j < width; j++) {
			// M: x[i-1] aligned to y[j-1]
			int64_t best = prev_m[j - 1];
			uint8_t m_src = FROM_M;
			if (prev_x[j - 1] > best) {
				best = prev_x[j - 1];
				m_src = FROM_X;
			}
			if (prev_y[j - 1] > best) {
				best = prev_y[j - 1];
				m_src = FROM_Y;
			}
			if (m_src == FROM_M && is_start(i - 1, j - 1)) {
				m_src = FROM_START;
			}
			if (is_local && best <= 0) {
				best = 0;
				m_src = FROM_START;
			}
			cur_m[j] = Floor(best + scoring.score(xi, static_cast<uint8_t>(y[j - 1])));

			// X: x[i-1] against a gap in y
			best = prev_m[j] + gap_first;
			uint8_t x_src = FROM_M;
			if (prev_x[j] + extend > best) {
				best = prev_x[j] + extend;
				x_src = FROM_X;
			}
			if (prev_y[j] + gap_first > best) {
				best = prev_y[j] + gap_first;
				x_src = FROM_Y;
			}
			if (x_src == FROM_M && is_start(i - 1, j)) {
				x_src = FROM_START;
			}
			cur_x[j] = Floor(best);

			// Y: y[j-1] against a gap in x
			best = cur_m[j - 1] + gap_first;
			uint8_t y_src = FROM_M;
			if (cur_y[j - 1] + extend > best) {
				best = cur_y[j - 1] + extend;
				y_src = FROM_Y;
			}
			if (cur_x[j - 1] + gap_first > best) {
				best = cur_x[j - 1] + gap_first;
				y_src = FROM_X;
			}
			if (y_src == FROM_M && is_start(i, j - 1)) {
				y_src = FROM_START;
			}
			cur_y[j] = Floor(best);

			trace_row[j] = PackTrace(m_src, x_src, y_src);
		}

		if (is_local) {
			// Local alignments end on a match/substitution; first maximum in row-major order wins
			for (size_t j = 1; j < width; j++) {
				if (cur_m[j] > 0) {
					end.offer(i, j, cur_m[j], FROM_M);
				}
			}
		} else if (i == n) {
			if (is_global) {
				end.consider(i, m, cur_m[m], cur_x[m], cur_y[m]);
			} else {
				for (size_t j = 0; j < width; j++) {
					end.consider(i, j, cur_m[j], cur_x[j], cur_y[j]);
				}
			}
		}

		std::swap(prev_m, cur_m);
		std::swap(prev_x, cur_x);
		std::swap(prev_y, cur_y);
	}

	AlignmentResult result;
	result.mode = mode;
	result.xlen = n;
	result.ylen = m;

	uint8_t state = FROM_START;
	if (end.found) {
		result.score = end.score;
		state = end.state;
		if (state == FROM_M && is_start(end.i, end.j)) {
			state = FROM_START;
		}
	} else {
		// Local alignment with no positive-scoring cell: everything is clipped
		result.score = 0;
		end.i = 0;
		end.j = 0;
	}

	std::vector<AlignmentOperation> body;
	size_t i = end.i;
	size_t j = end.j;
	while (state != FROM_START) {
		const uint8_t cell = traceback[i * width + j];
		switch (state) {
		case FROM_M:
			body.push_back(x[i - 1] == y[j - 1] ? AlignmentOperation::MATCH : AlignmentOperation::SUBST);
			state = MSource(cell);
			i--;
			j--;
			break;
		case FROM_X:
			body.push_back(AlignmentOperation::INS);
			state = XSource(cell);
			i--;
			break;
		case FROM_Y:
		default:
			body.push_back(AlignmentOperation::DEL);
			state = YSource(cell);
			j--;
			break;
		}
	}

	result.xstart = i;
	result.ystart = j;
	result.xend = end.i;
	result.yend = end.j;

	auto &ops = result.operations;
	ops.reserve(body.size() + (n - result.xend) + (m - result.yend) + i + j);
	ops.insert(ops.end(), result.xstart, AlignmentOperation::XCLIP);
	ops.insert(ops.end(), result.ystart, AlignmentOperation::YCLIP);
	ops.insert(ops.end(), body.rbegin(), body.rend());
	ops.insert(ops.end(), n - result.xend, AlignmentOperation::XCLIP);
	ops.insert(ops.end(), m - result.yend, AlignmentOperation::YCLIP);
	return result;
}

PairwiseAligner::PairwiseAligner(ScoringPolicy scoring) : impl_(std::make_unique<Impl>(std::move(scoring))) {
}

PairwiseAligner::PairwiseAligner(ScoringPolicy scoring, size_t x_capacity, size_t y_capacity)
    : PairwiseAligner(std::move(scoring)) {
	impl_->reserve(x_capacity, y_capacity);
}

PairwiseAligner::~PairwiseAligner() = default;
PairwiseAligner::PairwiseAligner(PairwiseAligner &&) noexcept = default;
PairwiseAligner &PairwiseAligner::operator=(PairwiseAligner &&) noexcept = default;

AlignmentResult PairwiseAligner::global(std::string_view x, std::string_view y) {
	return impl_->run(x, y, AlignmentMode::GLOBAL);
}

AlignmentResult PairwiseAligner::local(std::string_view x, std::string_view y) {
	return impl_->run(x, y, AlignmentMode::LOCAL);
}

AlignmentResult PairwiseAligner::semiglobal(std::string_view x, std::string_view y) {
	return impl_->run(x, y, AlignmentMode::SEMIGLOBAL);
}

AlignmentResult PairwiseAligner::align(std::string_view x, std::string_view y, AlignmentMode mode) {
	return impl_->run(x, y, mode);
}

const ScoringPolicy &PairwiseAligner::scoring() const noexcept {
	return impl_->scoring;
}

} // namespace seqdiff

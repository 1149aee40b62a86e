#include "PartialOrderAligner.hpp"

#include <algorithm>
#include <limits>

namespace seqdiff {

namespace {

constexpr int64_t NEGATIVE_INFINITY = std::numeric_limits<int64_t>::min() / 4;

inline int64_t Floor(int64_t value) {
	return std::max<int64_t>(value, NEGATIVE_INFINITY);
}

enum class Matrix : uint8_t { M, X, Y };

// Score matrices over rows = graph nodes in topological order (row 0 is the
// virtual start) and columns = query positions.
struct GraphMatrices {
	size_t width;
	std::vector<int64_t> m, x, y;

	GraphMatrices(size_t rows, size_t width_p)
	    : width(width_p), m(rows * width_p, NEGATIVE_INFINITY), x(rows * width_p, NEGATIVE_INFINITY),
	      y(rows * width_p, NEGATIVE_INFINITY) {
	}

	int64_t &at(Matrix matrix, size_t row, size_t col) {
		switch (matrix) {
		case Matrix::M:
			return m[row * width + col];
		case Matrix::X:
			return x[row * width + col];
		case Matrix::Y:
		default:
			return y[row * width + col];
		}
	}
};

} // namespace

PartialOrderAligner::PartialOrderAligner(ScoringPolicy scoring, std::string_view seed)
    : PartialOrderAligner(std::move(scoring), seed, PartialOrderLimits {}) {
}

PartialOrderAligner::PartialOrderAligner(ScoringPolicy scoring, std::string_view seed, PartialOrderLimits limits)
    : scoring_(std::move(scoring)), limits_(limits), graph_(seed) {
	if (limits_.max_cells == 0) {
		throw ConfigurationError("max_cells must be > 0");
	}
}

void PartialOrderAligner::check_size(size_t cells) const {
	if (cells > limits_.max_cells) {
		throw AlignmentSizeError(cells, limits_.max_cells);
	}
	if (cells > limits_.warn_cells && warning_handler_) {
		warning_handler_("Partial order alignment over " + std::to_string(cells) +
		                 " cells; expect long runtimes and high memory use");
	}
}

GraphAlignment PartialOrderAligner::align(std::string_view sequence) const {
	const auto &order = graph_.order();
	const size_t rows = order.size() + 1;
	const size_t n = sequence.size();
	const size_t width = n + 1;

	if (width > std::numeric_limits<size_t>::max() / rows) {
		throw AlignmentSizeError(std::numeric_limits<size_t>::max(), limits_.max_cells);
	}
	check_size(rows * width);

	const int64_t gap_first = scoring_.gap_first();
	const int64_t extend = scoring_.gap().extend;

	// Predecessor rows of every row; sources hang off the virtual row 0
	std::vector<size_t> rank(graph_.node_count());
	for (size_t r = 0; r < order.size(); r++) {
		rank[order[r]] = r + 1;
	}
	std::vector<std::vector<size_t>> predecessors(rows);
	for (size_t r = 1; r < rows; r++) {
		const auto &node = graph_.node(order[r - 1]);
		for (auto edge_id : node.in_edges) {
			predecessors[r].push_back(rank[graph_.edge(edge_id).begin]);
		}
		if (predecessors[r].empty()) {
			predecessors[r].push_back(0);
		}
	}

	GraphMatrices dp(rows, width);
	dp.at(Matrix::M, 0, 0) = 0;
	for (size_t j = 1; j < width; j++) {
		dp.at(Matrix::Y, 0, j) = Floor(gap_first + extend * static_cast<int64_t>(j - 1));
	}

	for (size_t r = 1; r < rows; r++) {
		const uint8_t symbol = graph_.node(order[r - 1]).symbol;
		for (size_t j = 0; j < width; j++) {
			if (j > 0) {
				int64_t best = NEGATIVE_INFINITY;
				for (auto p : predecessors[r]) {
					best = std::max<int64_t>(
					    {best, dp.at(Matrix::M, p, j - 1), dp.at(Matrix::X, p, j - 1), dp.at(Matrix::Y, p, j - 1)});
				}
				dp.at(Matrix::M, r, j) = Floor(best + scoring_.score(symbol, static_cast<uint8_t>(sequence[j - 1])));
			}

			int64_t best = NEGATIVE_INFINITY;
			for (auto p : predecessors[r]) {
				best = std::max<int64_t>({best, dp.at(Matrix::M, p, j) + gap_first, dp.at(Matrix::X, p, j) + extend,
				                          dp.at(Matrix::Y, p, j) + gap_first});
			}
			dp.at(Matrix::X, r, j) = Floor(best);

			if (j > 0) {
				dp.at(Matrix::Y, r, j) = Floor(std::max<int64_t>({dp.at(Matrix::M, r, j - 1) + gap_first,
				                                                  dp.at(Matrix::Y, r, j - 1) + extend,
				                                                  dp.at(Matrix::X, r, j - 1) + gap_first}));
			}
		}
	}

	// End on a sink node (or on row 0 for an empty graph), preferring M, X, Y
	int64_t best_score = NEGATIVE_INFINITY;
	size_t best_row = 0;
	Matrix state = n > 0 ? Matrix::Y : Matrix::M;
	if (order.empty()) {
		best_score = dp.at(state, 0, n);
	}
	for (size_t r = 1; r < rows; r++) {
		if (!graph_.node(order[r - 1]).out_edges.empty()) {
			continue;
		}
		for (auto matrix : {Matrix::M, Matrix::X, Matrix::Y}) {
			if (dp.at(matrix, r, n) > best_score) {
				best_score = dp.at(matrix, r, n);
				best_row = r;
				state = matrix;
			}
		}
	}

	GraphAlignment result;
	auto &ops = result.alignment.operations;
	size_t r = best_row;
	size_t j = n;
	while (r != 0 || j != 0) {
		const int64_t value = dp.at(state, r, j);
		bool found = false;
		if (state == Matrix::M) {
			const uint32_t node_id = order[r - 1];
			const uint8_t symbol = graph_.node(node_id).symbol;
			const auto query_symbol = static_cast<uint8_t>(sequence[j - 1]);
			const int64_t score = scoring_.score(symbol, query_symbol);
			ops.push_back(symbol == query_symbol ? AlignmentOperation::MATCH : AlignmentOperation::SUBST);
			result.nodes.push_back(node_id);
			for (auto p : predecessors[r]) {
				for (auto from : {Matrix::M, Matrix::X, Matrix::Y}) {
					if (!found && dp.at(from, p, j - 1) + score == value) {
						state = from;
						r = p;
						found = true;
					}
				}
				if (found) {
					break;
				}
			}
			j--;
		} else if (state == Matrix::X) {
			ops.push_back(AlignmentOperation::INS);
			result.nodes.push_back(order[r - 1]);
			for (auto p : predecessors[r]) {
				if (dp.at(Matrix::M, p, j) + gap_first == value) {
					state = Matrix::M;
				} else if (dp.at(Matrix::X, p, j) + extend == value) {
					state = Matrix::X;
				} else if (dp.at(Matrix::Y, p, j) + gap_first == value) {
					state = Matrix::Y;
				} else {
					continue;
				}
				r = p;
				found = true;
				break;
			}
		} else {
			ops.push_back(AlignmentOperation::DEL);
			result.nodes.push_back(-1);
			if (dp.at(Matrix::M, r, j - 1) + gap_first == value) {
				state = Matrix::M;
				found = true;
			} else if (dp.at(Matrix::Y, r, j - 1) + extend == value) {
				state = Matrix::Y;
				found = true;
			} else if (dp.at(Matrix::X, r, j - 1) + gap_first == value) {
				state = Matrix::X;
				found = true;
			}
			j--;
		}
		if (!found) {
			throw std::logic_error("Partial order traceback lost its path at row " + std::to_string(r) +
			                       ", column " + std::to_string(j));
		}
	}
	std::reverse(ops.begin(), ops.end());
	std::reverse(result.nodes.begin(), result.nodes.end());

	for (size_t k = 0; k < ops.size(); k++) {
		if (result.nodes[k] >= 0) {
			result.path += static_cast<char>(graph_.node(static_cast<uint32_t>(result.nodes[k])).symbol);
		}
	}

	auto &alignment = result.alignment;
	alignment.score = best_score;
	alignment.mode = AlignmentMode::GLOBAL;
	alignment.xstart = 0;
	alignment.xend = result.path.size();
	alignment.xlen = result.path.size();
	alignment.ystart = 0;
	alignment.yend = n;
	alignment.ylen = n;
	return result;
}

const GraphAlignment &PartialOrderAligner::global(std::string_view sequence) {
	pending_ = align(sequence);
	pending_sequence_.assign(sequence.data(), sequence.size());
	return *pending_;
}

void PartialOrderAligner::add_to_graph() {
	if (!pending_) {
		throw NotAlignedError("Nothing to add to the graph; call global() first");
	}
	graph_.add_alignment(*pending_, pending_sequence_);
	pending_.reset();
	pending_sequence_.clear();
}

GraphAlignment PartialOrderAligner::add_sequence(std::string_view sequence) {
	GraphAlignment aligned = global(sequence);
	add_to_graph();
	return aligned;
}

GraphAlignment AlignToReferences(const ScoringPolicy &scoring, std::string_view seed,
                                 const std::vector<std::string> &references, std::string_view query,
                                 PartialOrderLimits limits, WarningHandler warning_handler) {
	PartialOrderAligner aligner(scoring, seed, limits);
	aligner.set_warning_handler(std::move(warning_handler));
	for (const auto &reference : references) {
		aligner.add_sequence(reference);
	}
	return aligner.global(query);
}

} // namespace seqdiff

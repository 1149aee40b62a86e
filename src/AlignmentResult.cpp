#include "AlignmentResult.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace seqdiff {

std::string AlignmentModeName(AlignmentMode mode) {
	switch (mode) {
	case AlignmentMode::GLOBAL:
		return "global";
	case AlignmentMode::LOCAL:
		return "local";
	case AlignmentMode::SEMIGLOBAL:
		return "semiglobal";
	default:
		throw std::invalid_argument("Unknown alignment mode");
	}
}

std::optional<AlignmentMode> ParseAlignmentMode(const std::string &name) {
	std::string lowered(name);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "global") {
		return AlignmentMode::GLOBAL;
	}
	if (lowered == "local") {
		return AlignmentMode::LOCAL;
	}
	if (lowered == "semiglobal") {
		return AlignmentMode::SEMIGLOBAL;
	}
	return std::nullopt;
}

// Walks the trace in lockstep with both sequences. Every operation consumes
// one symbol of x, of y, or of both; running past either end means the trace
// was not produced for this pair.
namespace {
class TraceCursor {
public:
	TraceCursor(std::string_view x, std::string_view y) : x_(x), y_(y), xi_(0), yi_(0) {
	}

	char next_x() {
		if (xi_ >= x_.size()) {
			throw std::invalid_argument("Alignment consumes more x symbols than available");
		}
		return x_[xi_++];
	}

	char next_y() {
		if (yi_ >= y_.size()) {
			throw std::invalid_argument("Alignment consumes more y symbols than available");
		}
		return y_[yi_++];
	}

private:
	std::string_view x_;
	std::string_view y_;
	size_t xi_;
	size_t yi_;
};
} // namespace

std::string AlignmentResult::pretty(std::string_view x, std::string_view y, size_t width) const {
	if (width == 0) {
		throw std::invalid_argument("pretty width must be > 0");
	}

	std::string x_row;
	std::string marker_row;
	std::string y_row;
	x_row.reserve(operations.size());
	marker_row.reserve(operations.size());
	y_row.reserve(operations.size());

	TraceCursor cursor(x, y);
	for (auto op : operations) {
		switch (op) {
		case AlignmentOperation::MATCH:
			x_row += cursor.next_x();
			marker_row += '|';
			y_row += cursor.next_y();
			break;
		case AlignmentOperation::SUBST:
			x_row += cursor.next_x();
			marker_row += '\\';
			y_row += cursor.next_y();
			break;
		case AlignmentOperation::DEL:
			x_row += '-';
			marker_row += 'x';
			y_row += cursor.next_y();
			break;
		case AlignmentOperation::INS:
			x_row += cursor.next_x();
			marker_row += '+';
			y_row += '-';
			break;
		case AlignmentOperation::XCLIP:
			x_row += cursor.next_x();
			marker_row += ' ';
			y_row += ' ';
			break;
		case AlignmentOperation::YCLIP:
			x_row += ' ';
			marker_row += ' ';
			y_row += cursor.next_y();
			break;
		}
	}

	std::string out;
	for (size_t offset = 0; offset < x_row.size(); offset += width) {
		out.append(x_row, offset, width);
		out += '\n';
		out.append(marker_row, offset, width);
		out += '\n';
		out.append(y_row, offset, width);
		out += '\n';
		out += "\n\n";
	}
	return out;
}

static char CigarCode(AlignmentOperation op) {
	switch (op) {
	case AlignmentOperation::MATCH:
		return '=';
	case AlignmentOperation::SUBST:
		return 'X';
	case AlignmentOperation::INS:
		return 'I';
	case AlignmentOperation::DEL:
		return 'D';
	case AlignmentOperation::XCLIP:
		return 'S';
	case AlignmentOperation::YCLIP:
	default:
		return '\0';
	}
}

std::string AlignmentResult::cigar() const {
	std::string out;
	char run_code = '\0';
	size_t run_length = 0;

	for (auto op : operations) {
		char code = CigarCode(op);
		if (code == '\0') {
			continue;
		}
		if (code == run_code) {
			run_length++;
			continue;
		}
		if (run_length > 0) {
			out += std::to_string(run_length);
			out += run_code;
		}
		run_code = code;
		run_length = 1;
	}
	if (run_length > 0) {
		out += std::to_string(run_length);
		out += run_code;
	}
	return out;
}

AlignedSequences AlignmentResult::aligned_sequences(std::string_view x, std::string_view y) const {
	AlignedSequences result;
	result.x_aligned.reserve(operations.size());
	result.y_aligned.reserve(operations.size());

	TraceCursor cursor(x, y);
	for (auto op : operations) {
		switch (op) {
		case AlignmentOperation::MATCH:
		case AlignmentOperation::SUBST:
			result.x_aligned += cursor.next_x();
			result.y_aligned += cursor.next_y();
			break;
		case AlignmentOperation::DEL:
			result.x_aligned += '-';
			result.y_aligned += cursor.next_y();
			break;
		case AlignmentOperation::INS:
			result.x_aligned += cursor.next_x();
			result.y_aligned += '-';
			break;
		case AlignmentOperation::XCLIP:
			cursor.next_x();
			break;
		case AlignmentOperation::YCLIP:
			cursor.next_y();
			break;
		}
	}
	return result;
}

} // namespace seqdiff

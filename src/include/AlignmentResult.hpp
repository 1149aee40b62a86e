#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace seqdiff {

// Raised when an operation needs an alignment that has not been computed yet
class NotAlignedError : public std::logic_error {
public:
	explicit NotAlignedError(const std::string &msg) : std::logic_error(msg) {
	}
};

enum class AlignmentMode : uint8_t { GLOBAL, LOCAL, SEMIGLOBAL };

//! Name of a mode as accepted by ParseAlignmentMode
std::string AlignmentModeName(AlignmentMode mode);

//! Case-insensitive parse of "global", "local" or "semiglobal"; nullopt otherwise
std::optional<AlignmentMode> ParseAlignmentMode(const std::string &name);

// x is the reference (first sequence), y is the query (second sequence).
// Each operation consumes exactly one symbol of x, of y, or of both.
enum class AlignmentOperation : uint8_t {
	MATCH, // x and y symbols are equal
	SUBST, // x and y symbols differ
	DEL,   // y symbol against a gap in x
	INS,   // x symbol against a gap in y
	XCLIP, // x symbol left unaligned
	YCLIP  // y symbol left unaligned
};

struct AlignedSequences {
	std::string x_aligned;
	std::string y_aligned;
};

struct AlignmentResult {
	int64_t score = 0;
	// Half-open ranges [start, end) of the aligned body in x and y
	size_t xstart = 0;
	size_t xend = 0;
	size_t ystart = 0;
	size_t yend = 0;
	size_t xlen = 0;
	size_t ylen = 0;
	AlignmentMode mode = AlignmentMode::GLOBAL;
	std::vector<AlignmentOperation> operations;

	bool operator==(const AlignmentResult &other) const = default;

	//! Three-row rendering (x, markers, y) wrapped at width columns
	std::string pretty(std::string_view x, std::string_view y, size_t width) const;

	//! Extended CIGAR with x as the read: = X I D S. Y clips are not represented.
	std::string cigar() const;

	//! Gapped x and y over the aligned body, clips excluded
	AlignedSequences aligned_sequences(std::string_view x, std::string_view y) const;
};

} // namespace seqdiff

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace seqdiff {

// Raised when a metric requires sequences of equal length
class LengthMismatchError : public std::invalid_argument {
public:
	LengthMismatchError(size_t a_length, size_t b_length)
	    : std::invalid_argument("Sequences must have equal length, got " + std::to_string(a_length) + " and " +
	                            std::to_string(b_length)),
	      a_length(a_length), b_length(b_length) {
	}

	size_t a_length;
	size_t b_length;
};

//! Unit-cost edit distance (insert, delete, substitute). O(n*m) time, O(m) memory.
uint64_t Levenshtein(std::string_view a, std::string_view b);

//! Number of positions at which a and b differ. Throws LengthMismatchError when lengths differ.
uint64_t Hamming(std::string_view a, std::string_view b);

} // namespace seqdiff

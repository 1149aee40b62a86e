#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace seqdiff {

// Column-oriented batch of sequence records, one entry per record in each vector
struct SequenceRecordBatch {
	std::vector<std::string> read_ids;
	std::vector<std::string> comments;
	std::vector<std::string> sequences;

	size_t size() const {
		return read_ids.size();
	}

	bool empty() const {
		return read_ids.empty();
	}

	void reserve(size_t n) {
		read_ids.reserve(n);
		comments.reserve(n);
		sequences.reserve(n);
	}
};

}; // namespace seqdiff

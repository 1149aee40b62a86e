#include "DistanceMetrics.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace seqdiff {

uint64_t Levenshtein(std::string_view a, std::string_view b) {
	// Keep the shorter sequence along the row
	if (b.size() > a.size()) {
		std::swap(a, b);
	}
	if (b.empty()) {
		return a.size();
	}

	std::vector<uint64_t> prev(b.size() + 1);
	std::vector<uint64_t> cur(b.size() + 1);
	std::iota(prev.begin(), prev.end(), uint64_t {0});

	for (size_t i = 1; i <= a.size(); i++) {
		cur[0] = i;
		for (size_t j = 1; j <= b.size(); j++) {
			uint64_t substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
			uint64_t remove = prev[j] + 1;
			uint64_t insert = cur[j - 1] + 1;
			cur[j] = std::min({substitute, remove, insert});
		}
		std::swap(prev, cur);
	}
	return prev[b.size()];
}

uint64_t Hamming(std::string_view a, std::string_view b) {
	if (a.size() != b.size()) {
		throw LengthMismatchError(a.size(), b.size());
	}
	uint64_t distance = 0;
	for (size_t i = 0; i < a.size(); i++) {
		if (a[i] != b[i]) {
			distance++;
		}
	}
	return distance;
}

} // namespace seqdiff

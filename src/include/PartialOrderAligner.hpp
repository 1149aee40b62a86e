#pragma once

#include "AlignmentResult.hpp"
#include "PartialOrderGraph.hpp"
#include "ScoringPolicy.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace seqdiff {

// Raised before any computation when a graph alignment would exceed the cell limit
class AlignmentSizeError : public std::length_error {
public:
	AlignmentSizeError(size_t cells, size_t limit)
	    : std::length_error("Partial order alignment needs " + std::to_string(cells) + " cells, limit is " +
	                        std::to_string(limit)),
	      cells(cells), limit(limit) {
	}

	size_t cells;
	size_t limit;
};

// Receives human-readable diagnostics, e.g. forwarded to a logger
using WarningHandler = std::function<void(const std::string &)>;

// Cell counts are (graph nodes + 1) * (query length + 1)
struct PartialOrderLimits {
	size_t max_cells = 100000000;
	size_t warn_cells = 10000000;
};

// Aligns sequences globally against a growing partial order graph.
//
// Typical use: construct with a seed, add_sequence() each additional
// reference, then global() the query. Time and memory grow with the product
// of graph size and query length, so calls are gated by PartialOrderLimits.
//
// Thread-safety: not thread-safe; the graph is mutated by add_to_graph().
class PartialOrderAligner {
public:
	PartialOrderAligner(ScoringPolicy scoring, std::string_view seed);
	PartialOrderAligner(ScoringPolicy scoring, std::string_view seed, PartialOrderLimits limits);

	// Non-copyable, movable
	PartialOrderAligner(const PartialOrderAligner &) = delete;
	PartialOrderAligner &operator=(const PartialOrderAligner &) = delete;
	PartialOrderAligner(PartialOrderAligner &&) noexcept = default;
	PartialOrderAligner &operator=(PartialOrderAligner &&) noexcept = default;

	void set_warning_handler(WarningHandler handler) {
		warning_handler_ = std::move(handler);
	}

	// Global alignment of sequence against the graph; remembered for add_to_graph()
	const GraphAlignment &global(std::string_view sequence);

	// Merges the most recent global() result. Throws NotAlignedError when
	// nothing has been aligned since the last merge.
	void add_to_graph();

	// global() followed by add_to_graph()
	GraphAlignment add_sequence(std::string_view sequence);

	std::string consensus() const {
		return graph_.consensus();
	}

	const PartialOrderGraph &graph() const noexcept {
		return graph_;
	}

	const ScoringPolicy &scoring() const noexcept {
		return scoring_;
	}

private:
	GraphAlignment align(std::string_view sequence) const;
	void check_size(size_t cells) const;

	ScoringPolicy scoring_;
	PartialOrderLimits limits_;
	PartialOrderGraph graph_;
	WarningHandler warning_handler_;
	std::optional<GraphAlignment> pending_;
	std::string pending_sequence_;
};

//! Builds a graph from seed and references (in order), then aligns query against it
GraphAlignment AlignToReferences(const ScoringPolicy &scoring, std::string_view seed,
                                 const std::vector<std::string> &references, std::string_view query,
                                 PartialOrderLimits limits = {}, WarningHandler warning_handler = nullptr);

} // namespace seqdiff

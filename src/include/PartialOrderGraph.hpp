#pragma once

#include "AlignmentResult.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace seqdiff {

struct PartialOrderNode {
	uint8_t symbol;
	std::vector<uint32_t> in_edges;  // indices into the edge arena
	std::vector<uint32_t> out_edges; // indices into the edge arena
};

struct PartialOrderEdge {
	uint32_t begin;
	uint32_t end;
	uint64_t weight;
};

// Alignment of a sequence (y) against a path through the graph (x).
// nodes[k] is the graph node consumed by operations[k], or -1 for DEL.
struct GraphAlignment {
	AlignmentResult alignment;
	std::vector<int64_t> nodes;
	std::string path; // symbols of the consumed nodes, in path order
};

// Directed acyclic graph of single-symbol nodes, stored as dense node and edge
// arrays. A topological order is kept up to date by every mutating call.
class PartialOrderGraph {
public:
	PartialOrderGraph() = default;
	// Single path spelling seed
	explicit PartialOrderGraph(std::string_view seed);

	size_t node_count() const noexcept {
		return nodes_.size();
	}
	size_t edge_count() const noexcept {
		return edges_.size();
	}
	bool empty() const noexcept {
		return nodes_.empty();
	}

	const PartialOrderNode &node(uint32_t id) const {
		return nodes_.at(id);
	}
	const PartialOrderEdge &edge(uint32_t id) const {
		return edges_.at(id);
	}

	// Node ids in topological order; ties broken by smallest id
	const std::vector<uint32_t> &order() const noexcept {
		return order_;
	}

	//! Folds an aligned sequence into the graph. MATCH reuses the aligned node,
	//! SUBST and DEL add a node for the sequence symbol, INS adds nothing.
	//! Consecutive sequence symbols are joined by an edge (weight + 1 if present).
	void add_alignment(const GraphAlignment &aligned, std::string_view sequence);

	//! Symbols along the path of greatest total edge weight
	std::string consensus() const;

private:
	uint32_t add_node(uint8_t symbol);
	void add_edge(uint32_t begin, uint32_t end, uint64_t weight);
	void add_path(std::string_view sequence);
	void topological_sort();

	std::vector<PartialOrderNode> nodes_;
	std::vector<PartialOrderEdge> edges_;
	std::vector<uint32_t> order_;
};

} // namespace seqdiff

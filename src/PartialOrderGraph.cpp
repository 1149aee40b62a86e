#include "PartialOrderGraph.hpp"

#include <functional>
#include <queue>
#include <stdexcept>

namespace seqdiff {

PartialOrderGraph::PartialOrderGraph(std::string_view seed) {
	add_path(seed);
	topological_sort();
}

uint32_t PartialOrderGraph::add_node(uint8_t symbol) {
	auto id = static_cast<uint32_t>(nodes_.size());
	nodes_.push_back(PartialOrderNode {symbol, {}, {}});
	return id;
}

void PartialOrderGraph::add_edge(uint32_t begin, uint32_t end, uint64_t weight) {
	for (auto edge_id : nodes_[begin].out_edges) {
		if (edges_[edge_id].end == end) {
			edges_[edge_id].weight += weight;
			return;
		}
	}
	auto edge_id = static_cast<uint32_t>(edges_.size());
	edges_.push_back(PartialOrderEdge {begin, end, weight});
	nodes_[begin].out_edges.push_back(edge_id);
	nodes_[end].in_edges.push_back(edge_id);
}

void PartialOrderGraph::add_path(std::string_view sequence) {
	int64_t prev = -1;
	for (char c : sequence) {
		uint32_t id = add_node(static_cast<uint8_t>(c));
		if (prev >= 0) {
			add_edge(static_cast<uint32_t>(prev), id, 1);
		}
		prev = id;
	}
}

void PartialOrderGraph::add_alignment(const GraphAlignment &aligned, std::string_view sequence) {
	const auto &ops = aligned.alignment.operations;
	if (ops.size() != aligned.nodes.size()) {
		throw std::invalid_argument("Graph alignment has " + std::to_string(ops.size()) + " operations but " +
		                            std::to_string(aligned.nodes.size()) + " node entries");
	}

	int64_t prev = -1;
	size_t position = 0;
	for (size_t k = 0; k < ops.size(); k++) {
		auto op = ops[k];
		if (op == AlignmentOperation::INS || op == AlignmentOperation::XCLIP) {
			continue;
		}
		if (position >= sequence.size()) {
			throw std::invalid_argument("Graph alignment consumes more symbols than the sequence has");
		}
		if (op == AlignmentOperation::YCLIP) {
			position++;
			prev = -1;
			continue;
		}

		uint32_t current;
		if (op == AlignmentOperation::MATCH) {
			if (aligned.nodes[k] < 0 || static_cast<size_t>(aligned.nodes[k]) >= nodes_.size()) {
				throw std::invalid_argument("Graph alignment refers to unknown node " +
				                            std::to_string(aligned.nodes[k]));
			}
			current = static_cast<uint32_t>(aligned.nodes[k]);
		} else {
			current = add_node(static_cast<uint8_t>(sequence[position]));
		}
		if (prev >= 0) {
			add_edge(static_cast<uint32_t>(prev), current, 1);
		}
		prev = current;
		position++;
	}
	topological_sort();
}

void PartialOrderGraph::topological_sort() {
	std::vector<size_t> in_degree(nodes_.size());
	std::priority_queue<uint32_t, std::vector<uint32_t>, std::greater<uint32_t>> ready;
	for (uint32_t id = 0; id < nodes_.size(); id++) {
		in_degree[id] = nodes_[id].in_edges.size();
		if (in_degree[id] == 0) {
			ready.push(id);
		}
	}

	order_.clear();
	order_.reserve(nodes_.size());
	while (!ready.empty()) {
		uint32_t id = ready.top();
		ready.pop();
		order_.push_back(id);
		for (auto edge_id : nodes_[id].out_edges) {
			uint32_t next = edges_[edge_id].end;
			if (--in_degree[next] == 0) {
				ready.push(next);
			}
		}
	}
	if (order_.size() != nodes_.size()) {
		throw std::logic_error("Partial order graph contains a cycle");
	}
}

std::string PartialOrderGraph::consensus() const {
	if (nodes_.empty()) {
		return "";
	}

	std::vector<uint64_t> scores(nodes_.size(), 0);
	std::vector<int64_t> predecessors(nodes_.size(), -1);
	for (auto id : order_) {
		for (auto edge_id : nodes_[id].in_edges) {
			const auto &edge = edges_[edge_id];
			uint64_t candidate = scores[edge.begin] + edge.weight;
			if (predecessors[id] == -1 || candidate > scores[id]) {
				scores[id] = candidate;
				predecessors[id] = edge.begin;
			}
		}
	}

	uint32_t best = order_.front();
	for (auto id : order_) {
		if (scores[id] > scores[best]) {
			best = id;
		}
	}

	std::string out;
	for (int64_t id = best; id != -1; id = predecessors[id]) {
		out += static_cast<char>(nodes_[id].symbol);
	}
	return std::string(out.rbegin(), out.rend());
}

} // namespace seqdiff

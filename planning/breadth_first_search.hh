#pragma once

#include <algorithm>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

#include "common/check.hh"

namespace ogear::planning {
template <typename State, typename Edge>
struct Node {
    State state;
    std::optional<int> maybe_parent_idx;
    // The edge taken from the parent, empty for the initial node
    std::optional<Edge> maybe_edge;
    int depth;
};

template <typename State, typename Edge>
struct BFSSuccessor {
    State state;
    Edge edge;
};

template <typename State, typename Edge>
struct BreadthFirstResult {
    // path.front() is the initial state and path.back() satisfies the goal check
    std::vector<State> path;
    // edges[i] takes path[i] to path[i + 1]
    std::vector<Edge> edges;
    int num_nodes_expanded;
    int num_nodes_visited;
};

enum class ShouldQueueResult {
    SKIP,
    QUEUE,
};

struct BreadthFirstOptions {
    // Upper bound on the number of nodes created during the search
    std::optional<int> max_num_nodes;
};

template <typename State, typename Edge>
using SuccessorFunc = std::function<std::vector<BFSSuccessor<State, Edge>>(const State &start)>;

template <typename State, typename Edge>
using ShouldQueueFunc = std::function<ShouldQueueResult(
    const BFSSuccessor<State, Edge> &, const int parent_idx,
    const std::vector<Node<State, Edge>> &node_list)>;

template <typename State>
using GoalCheckFunc = std::function<bool(const State &)>;

namespace detail {
template <typename State, typename Edge>
BreadthFirstResult<State, Edge> extract_path(const std::vector<Node<State, Edge>> &nodes,
                                             const int end_idx, const int num_nodes_expanded,
                                             const int num_nodes_visited) {
    std::vector<State> path;
    std::vector<Edge> edges;
    std::optional<int> maybe_idx = end_idx;
    while (maybe_idx.has_value()) {
        const auto &node = nodes.at(maybe_idx.value());
        path.push_back(node.state);
        if (node.maybe_edge.has_value()) {
            edges.push_back(node.maybe_edge.value());
        }
        maybe_idx = node.maybe_parent_idx;
    }
    std::reverse(path.begin(), path.end());
    std::reverse(edges.begin(), edges.end());

    return BreadthFirstResult<State, Edge>{
        .path = std::move(path),
        .edges = std::move(edges),
        .num_nodes_expanded = num_nodes_expanded,
        .num_nodes_visited = num_nodes_visited,
    };
}
}  // namespace detail

// Breadth first search from `initial_state`. The goal check is applied when a node is created,
// so the first goal node found lies at the shallowest depth. Nodes rejected by
// `should_queue_check` are never created. Returns std::nullopt if the queue empties without
// reaching the goal.
template <typename State, typename Edge>
std::optional<BreadthFirstResult<State, Edge>> breadth_first_search(
    const State &initial_state, const SuccessorFunc<State, Edge> &successors_for_state,
    const ShouldQueueFunc<State, Edge> &should_queue_check, const GoalCheckFunc<State> &goal_check,
    const BreadthFirstOptions &options = {}) {
    int nodes_expanded = 0;
    int nodes_visited = 0;

    std::vector<Node<State, Edge>> nodes = {
        {.state = initial_state, .maybe_parent_idx = {}, .maybe_edge = {}, .depth = 0}};
    if (goal_check(initial_state)) {
        return detail::extract_path(nodes, 0, nodes_expanded, nodes_visited);
    }

    std::deque<int> node_idx_queue = {0};
    while (!node_idx_queue.empty()) {
        const int node_idx = node_idx_queue.front();
        node_idx_queue.pop_front();
        // Make a copy to avoid invalidated references when pushing back on nodes
        const Node<State, Edge> n = nodes.at(node_idx);
        nodes_expanded++;

        for (const auto &successor : successors_for_state(n.state)) {
            nodes_visited++;

            if (should_queue_check(successor, node_idx, nodes) == ShouldQueueResult::SKIP) {
                continue;
            }

            nodes.push_back(Node<State, Edge>{.state = successor.state,
                                              .maybe_parent_idx = node_idx,
                                              .maybe_edge = successor.edge,
                                              .depth = n.depth + 1});
            const int new_idx = static_cast<int>(nodes.size()) - 1;
            if (options.max_num_nodes.has_value()) {
                OGEAR_CHECK(static_cast<int>(nodes.size()) <= options.max_num_nodes.value(),
                            "breadth first search exceeded node limit", nodes.size());
            }

            if (goal_check(successor.state)) {
                return detail::extract_path(nodes, new_idx, nodes_expanded, nodes_visited);
            }
            node_idx_queue.push_back(new_idx);
        }
    }

    return std::nullopt;
}
}  // namespace ogear::planning

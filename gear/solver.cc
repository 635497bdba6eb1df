#include "gear/solver.hh"

#include <unordered_set>

#include "planning/breadth_first_search.hh"

namespace ogear::gear {

bool Move::operator==(const Move &other) const {
    return transition == other.transition && destination == other.destination;
}

NoSolutionFoundError::NoSolutionFoundError(const GearState &origin, const GearState &target)
    : std::runtime_error("No solution found from " + to_string(origin) + " to " +
                         to_string(target) + ", check the provided initial and target positions") {
}

SolveResult solve(const TransitionTable &table, const GearState &origin, const GearState &target,
                  const SolverOptions &options) {
    if (!table.contains(origin.position)) {
        throw InvalidPositionError(origin.position);
    }

    using Successor = planning::BFSSuccessor<GearState, Transition>;
    const planning::SuccessorFunc<GearState, Transition> successors_for_state =
        [&table](const GearState &state) {
            std::vector<Successor> out;
            for (const auto &transition : table.transitions_from(state.position)) {
                out.push_back({.state = apply_transition(state, transition), .edge = transition});
            }
            return out;
        };

    // States are marked as seen when they are queued, never when they are expanded
    std::unordered_set<GearState> seen_states = {origin};
    const planning::ShouldQueueFunc<GearState, Transition> not_seen_before =
        [&seen_states](const Successor &successor, const int,
                       const std::vector<planning::Node<GearState, Transition>> &) {
            if (seen_states.contains(successor.state)) {
                return planning::ShouldQueueResult::SKIP;
            }
            seen_states.insert(successor.state);
            return planning::ShouldQueueResult::QUEUE;
        };

    const planning::GoalCheckFunc<GearState> is_target = [&target](const GearState &state) {
        return state == target;
    };

    const auto maybe_result = planning::breadth_first_search(
        origin, successors_for_state, not_seen_before, is_target,
        {.max_num_nodes = options.max_num_nodes});
    if (!maybe_result.has_value()) {
        throw NoSolutionFoundError(origin, target);
    }

    SearchPath path;
    path.reserve(maybe_result->edges.size());
    for (const auto &transition : maybe_result->edges) {
        path.push_back({.transition = transition, .destination = transition.destination});
    }
    return SolveResult{
        .path = std::move(path),
        .num_nodes_expanded = maybe_result->num_nodes_expanded,
        .num_nodes_visited = maybe_result->num_nodes_visited,
    };
}

GearState replay_path(const GearState &origin, const SearchPath &path) {
    GearState state = origin;
    for (const auto &move : path) {
        state = apply_transition(state, move.transition);
    }
    return state;
}
}  // namespace ogear::gear

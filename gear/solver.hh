#pragma once

#include <stdexcept>
#include <vector>

#include "gear/gear_state.hh"
#include "gear/transition_table.hh"

namespace ogear::gear {

struct Move {
    Transition transition;
    // The position of the gear once the move is done
    Position destination;

    bool is_rotation() const { return transition.is_rotation(); }
    bool operator==(const Move &other) const;
};

// Moves in the order they must be applied
using SearchPath = std::vector<Move>;

// Thrown when every state reachable from the origin has been explored without finding the target
class NoSolutionFoundError : public std::runtime_error {
   public:
    NoSolutionFoundError(const GearState &origin, const GearState &target);
};

struct SolverOptions {
    // Bound on the number of search nodes. The full state space only holds
    // 6 sides * 3 axes * NUM_TEETH * 2 polarities states, so this is only hit by a malformed table.
    int max_num_nodes = 10000;
};

struct SolveResult {
    SearchPath path;
    int num_nodes_expanded;
    int num_nodes_visited;
};

// Finds a shortest sequence of moves taking `origin` to `target`.
// Throws InvalidPositionError if the origin, or any position reached during the search, is missing
// from the table, and NoSolutionFoundError if the target can't be reached.
SolveResult solve(const TransitionTable &table, const GearState &origin, const GearState &target,
                  const SolverOptions &options = {});

// Applies each move of `path` in turn starting from `origin` and returns the final state
GearState replay_path(const GearState &origin, const SearchPath &path);
}  // namespace ogear::gear

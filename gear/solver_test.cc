#include "gear/solver.hh"

#include <unordered_set>

#include "common/check.hh"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ogear::gear {
namespace {
using enum Axis;

std::vector<GearState> all_states() {
    std::vector<GearState> out;
    for (int side = MIN_SIDE; side <= MAX_SIDE; ++side) {
        for (const auto &[axis, _] : wise_enum::range<Axis>) {
            for (int tooth = 0; tooth < NUM_TEETH; ++tooth) {
                for (const int polarity : {POSITIVE_POLARITY, NEGATIVE_POLARITY}) {
                    out.push_back(make_gear_state(side, axis, tooth, polarity));
                }
            }
        }
    }
    return out;
}

// Shortest number of moves from `origin` to `target`, computed by growing the set of states
// reachable in exactly k moves without any bookkeeping of visited states.
std::optional<int> layered_distance(const TransitionTable &table, const GearState &origin,
                                    const GearState &target, const int max_moves) {
    std::unordered_set<GearState> layer = {origin};
    for (int num_moves = 0; num_moves <= max_moves; ++num_moves) {
        if (layer.contains(target)) {
            return num_moves;
        }
        std::unordered_set<GearState> next_layer;
        for (const auto &state : layer) {
            for (const auto &transition : table.transitions_from(state.position)) {
                next_layer.insert(apply_transition(state, transition));
            }
        }
        layer = std::move(next_layer);
    }
    return std::nullopt;
}

void expect_valid_path(const TransitionTable &table, const GearState &origin,
                       const GearState &target, const SearchPath &path) {
    GearState state = origin;
    for (const auto &move : path) {
        EXPECT_THAT(table.transitions_from(state.position), testing::Contains(move.transition));
        state = apply_transition(state, move.transition);
        EXPECT_EQ(state.position, move.destination);
    }
    EXPECT_EQ(state, target);
    EXPECT_EQ(replay_path(origin, path), target);
}
}  // namespace

TEST(SolverTest, solves_puzzle_from_default_start) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);
    const auto target = make_gear_state(6, X, 4, NEGATIVE_POLARITY);

    // Action
    const auto result = solve(*table, origin, target);

    // Verification
    EXPECT_EQ(result.path.size(), 16);
    expect_valid_path(*table, origin, target, result.path);
    ASSERT_FALSE(result.path.empty());
    // Reaching side 6 axis X takes a final rotation from side 6 axis Y
    EXPECT_TRUE(result.path.back().is_rotation());
    EXPECT_EQ(result.path.back().destination, (Position{6, X}));
    EXPECT_GT(result.num_nodes_expanded, 0);
    EXPECT_GE(result.num_nodes_visited, result.num_nodes_expanded);
}

TEST(SolverTest, solves_puzzle_in_reverse) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(6, X, 4, NEGATIVE_POLARITY);
    const auto target = make_gear_state(1, X, 0, POSITIVE_POLARITY);

    // Action
    const auto result = solve(*table, origin, target);

    // Verification
    EXPECT_EQ(result.path.size(), 16);
    expect_valid_path(*table, origin, target, result.path);
}

TEST(SolverTest, known_shortest_lengths) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);

    // Action + Verification
    EXPECT_EQ(solve(*table, origin, make_gear_state(1, Y, 0, NEGATIVE_POLARITY)).path.size(), 1);
    EXPECT_EQ(solve(*table, origin, make_gear_state(2, X, 4, POSITIVE_POLARITY)).path.size(), 1);
    EXPECT_EQ(solve(*table, origin, make_gear_state(6, X, 4, POSITIVE_POLARITY)).path.size(), 6);
    EXPECT_EQ(solve(*table, origin, make_gear_state(3, Z, 2, POSITIVE_POLARITY)).path.size(), 11);
    // Flipping the gear in place takes a full trip around the cube
    EXPECT_EQ(solve(*table, origin, make_gear_state(1, X, 0, NEGATIVE_POLARITY)).path.size(), 12);
}

TEST(SolverTest, single_move_reports_rotation_or_side_change) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);

    // Action
    const auto rotation = solve(*table, origin, make_gear_state(1, Y, 0, NEGATIVE_POLARITY));
    const auto side_change = solve(*table, origin, make_gear_state(4, X, 1, POSITIVE_POLARITY));

    // Verification
    ASSERT_EQ(rotation.path.size(), 1);
    EXPECT_TRUE(rotation.path.front().is_rotation());
    EXPECT_EQ(rotation.path.front().destination, (Position{1, Y}));
    ASSERT_EQ(side_change.path.size(), 1);
    EXPECT_FALSE(side_change.path.front().is_rotation());
    EXPECT_EQ(side_change.path.front().destination.side, 4);
}

TEST(SolverTest, origin_equal_to_target_returns_empty_path) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(3, Y, 2, NEGATIVE_POLARITY);

    // Action
    const auto result = solve(*table, origin, origin);

    // Verification
    EXPECT_TRUE(result.path.empty());
    EXPECT_EQ(result.num_nodes_expanded, 0);
}

TEST(SolverTest, every_state_is_reached_by_a_minimal_valid_path) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);

    for (const auto &target : all_states()) {
        if (!table->contains(target.position)) {
            continue;
        }
        // Action
        const auto result = solve(*table, origin, target);

        // Verification
        expect_valid_path(*table, origin, target, result.path);
        const int num_moves = static_cast<int>(result.path.size());
        EXPECT_EQ(layered_distance(*table, origin, target, num_moves), num_moves)
            << "target: " << to_string(target);
    }
}

TEST(SolverTest, repeated_solves_agree_on_length) {
    // Setup
    const auto origin = make_gear_state(5, Y, 3, NEGATIVE_POLARITY);
    const auto target = make_gear_state(2, Z, 1, POSITIVE_POLARITY);
    const auto table = make_ogear_transition_table();
    const auto expected_length = solve(*table, origin, target).path.size();

    for (int i = 0; i < 5; ++i) {
        // Action
        const auto fresh_table = make_ogear_transition_table();
        const auto result = solve(*fresh_table, origin, target);

        // Verification
        EXPECT_EQ(result.path.size(), expected_length);
        EXPECT_EQ(solve(*table, origin, target).path.size(), expected_length);
        expect_valid_path(*fresh_table, origin, target, result.path);
    }
}

TEST(SolverTest, invalid_origin_throws_invalid_position) {
    // Setup
    const auto table = make_ogear_transition_table();
    const GearState off_cube{.position = {7, X}, .tooth = 0, .polarity = POSITIVE_POLARITY};
    const auto not_in_table = make_gear_state(2, Y, 0, POSITIVE_POLARITY);
    const auto target = make_gear_state(6, X, 4, NEGATIVE_POLARITY);

    // Action + Verification
    EXPECT_THROW(solve(*table, off_cube, target), InvalidPositionError);
    EXPECT_THROW(solve(*table, not_in_table, target), InvalidPositionError);
    // The origin is checked before the trivial solution
    EXPECT_THROW(solve(*table, not_in_table, not_in_table), InvalidPositionError);
}

TEST(SolverTest, target_outside_table_throws_no_solution) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);
    // Side 2 along the Y axis is never the destination of a transition
    const auto target = make_gear_state(2, Y, 0, POSITIVE_POLARITY);

    // Action + Verification
    EXPECT_THROW(solve(*table, origin, target), NoSolutionFoundError);
}

TEST(SolverTest, disconnected_target_throws_no_solution) {
    // Setup
    // Rotating in place on side 1 never changes the tooth
    const auto table = TransitionTable::create({
        {{1, X}, {{{1, Y}, 0, -1}}},
        {{1, Y}, {{{1, X}, 0, -1}}},
    });
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);
    const auto target = make_gear_state(1, X, 1, POSITIVE_POLARITY);

    // Action + Verification
    EXPECT_EQ(solve(*table, origin, make_gear_state(1, Y, 0, NEGATIVE_POLARITY)).path.size(), 1);
    EXPECT_THROW(solve(*table, origin, target), NoSolutionFoundError);
    try {
        solve(*table, origin, target);
        FAIL() << "Expected NoSolutionFoundError";
    } catch (const NoSolutionFoundError &e) {
        EXPECT_THAT(e.what(), testing::HasSubstr("side 1 axis X tooth 1 polarity T"));
    }
}

TEST(SolverTest, dangling_destination_throws_invalid_position) {
    // Setup
    // Side 2 along X is a destination but has no entry of its own
    const auto table = TransitionTable::create({
        {{1, X}, {{{2, X}, -1, 1}}},
    });
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);

    // Action + Verification
    // The dangling position is reachable as a target
    EXPECT_EQ(solve(*table, origin, make_gear_state(2, X, 4, POSITIVE_POLARITY)).path.size(), 1);
    // Expanding it is an error
    try {
        solve(*table, origin, make_gear_state(6, X, 4, NEGATIVE_POLARITY));
        FAIL() << "Expected InvalidPositionError";
    } catch (const InvalidPositionError &e) {
        EXPECT_EQ(e.position(), (Position{2, X}));
    }
}

TEST(SolverTest, node_limit_fails_check) {
    // Setup
    const auto table = make_ogear_transition_table();
    const auto origin = make_gear_state(1, X, 0, POSITIVE_POLARITY);
    const auto target = make_gear_state(6, X, 4, NEGATIVE_POLARITY);

    // Action + Verification
    EXPECT_THROW(solve(*table, origin, target, {.max_num_nodes = 10}), check_failure);
}
}  // namespace ogear::gear

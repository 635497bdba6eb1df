#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "gear/gear_state.hh"

namespace ogear::gear {

// A single legal move of the gear. A zero tooth delta is an in-place rotation, anything else
// moves the gear to an adjacent side of the cube.
struct Transition {
    Position destination;
    // Change in the engaged tooth before the current polarity is applied, one of {-1, 0, 1}
    int tooth_delta;
    // -1 if the move flips the polarity, 1 otherwise
    int polarity_mult;

    bool is_rotation() const { return tooth_delta == 0; }
    bool operator==(const Transition &other) const;
};

// Thrown when a position has no entry in a transition table
class InvalidPositionError : public std::runtime_error {
   public:
    explicit InvalidPositionError(const Position &position);

    const Position &position() const { return position_; }

   private:
    Position position_;
};

// Returns the state reached by applying `transition` to `state`. The tooth moves in the
// direction given by the delta scaled by the current polarity.
GearState apply_transition(const GearState &state, const Transition &transition);
}  // namespace ogear::gear

namespace std {
template <>
struct hash<ogear::gear::Transition> {
    size_t operator()(const ogear::gear::Transition &transition) const {
        hash<ogear::gear::Position> position_hasher;
        return (position_hasher(transition.destination) << 4) |
               (static_cast<size_t>(transition.tooth_delta + 1) << 1) |
               (transition.polarity_mult > 0 ? 1 : 0);
    }
};
}  // namespace std

namespace ogear::gear {

// Immutable mapping from a position to the set of transitions leaving it. Instances are only
// handed out as shared pointers to const so that a single table can back any number of searches.
class TransitionTable {
   public:
    using TransitionSet = std::unordered_set<Transition>;

    static std::shared_ptr<const TransitionTable> create(
        std::unordered_map<Position, TransitionSet> transitions_from_position);

    // Throws InvalidPositionError if `position` is not a key of the table
    const TransitionSet &transitions_from(const Position &position) const;

    std::optional<std::reference_wrapper<const TransitionSet>> find(
        const Position &position) const;

    bool contains(const Position &position) const {
        return transitions_from_position_.contains(position);
    }

    std::vector<Position> positions() const;

    int num_positions() const { return static_cast<int>(transitions_from_position_.size()); }

    int num_transitions() const;

   private:
    explicit TransitionTable(std::unordered_map<Position, TransitionSet> transitions_from_position);
    std::unordered_map<Position, TransitionSet> transitions_from_position_;
};

// The topology of the Hanayama Cast O'Gear puzzle. Sides are numbered with the side with two
// notches on top (1), the front (2), the left (3), the back (4), the side with the small arrow
// mark on the right (5) and the bottom (6).
std::shared_ptr<const TransitionTable> make_ogear_transition_table();
}  // namespace ogear::gear

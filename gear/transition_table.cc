#include "gear/transition_table.hh"

#include "common/check.hh"

namespace ogear::gear {

bool Transition::operator==(const Transition &other) const {
    return destination == other.destination && tooth_delta == other.tooth_delta &&
           polarity_mult == other.polarity_mult;
}

InvalidPositionError::InvalidPositionError(const Position &position)
    : std::runtime_error(to_string(position) + " is an invalid position"), position_(position) {}

GearState apply_transition(const GearState &state, const Transition &transition) {
    return GearState{
        .position = transition.destination,
        .tooth = normalize_tooth(state.tooth + transition.tooth_delta * state.polarity),
        .polarity = state.polarity * transition.polarity_mult,
    };
}

TransitionTable::TransitionTable(
    std::unordered_map<Position, TransitionSet> transitions_from_position)
    : transitions_from_position_(std::move(transitions_from_position)) {}

std::shared_ptr<const TransitionTable> TransitionTable::create(
    std::unordered_map<Position, TransitionSet> transitions_from_position) {
    const auto is_valid_side = [](const int side) { return side >= MIN_SIDE && side <= MAX_SIDE; };
    for (const auto &[source, transitions] : transitions_from_position) {
        OGEAR_CHECK(is_valid_side(source.side), "Invalid source side", source.side);
        for (const auto &transition : transitions) {
            OGEAR_CHECK(is_valid_side(transition.destination.side), "Invalid destination side",
                        source.side, transition.destination.side);
            OGEAR_CHECK(transition.tooth_delta >= -1 && transition.tooth_delta <= 1,
                        "Invalid tooth delta", source.side, transition.tooth_delta);
            OGEAR_CHECK(transition.polarity_mult == 1 || transition.polarity_mult == -1,
                        "Invalid polarity multiplier", source.side, transition.polarity_mult);
        }
    }
    return std::shared_ptr<const TransitionTable>(
        new TransitionTable(std::move(transitions_from_position)));
}

const TransitionTable::TransitionSet &TransitionTable::transitions_from(
    const Position &position) const {
    const auto iter = transitions_from_position_.find(position);
    if (iter == transitions_from_position_.end()) {
        throw InvalidPositionError(position);
    }
    return iter->second;
}

std::optional<std::reference_wrapper<const TransitionTable::TransitionSet>> TransitionTable::find(
    const Position &position) const {
    const auto iter = transitions_from_position_.find(position);
    if (iter == transitions_from_position_.end()) {
        return std::nullopt;
    }
    return std::cref(iter->second);
}

std::vector<Position> TransitionTable::positions() const {
    std::vector<Position> out;
    out.reserve(transitions_from_position_.size());
    for (const auto &[position, _] : transitions_from_position_) {
        out.push_back(position);
    }
    return out;
}

int TransitionTable::num_transitions() const {
    int count = 0;
    for (const auto &[_, transitions] : transitions_from_position_) {
        count += static_cast<int>(transitions.size());
    }
    return count;
}

std::shared_ptr<const TransitionTable> make_ogear_transition_table() {
    using enum Axis;
    // Each entry is {destination, tooth_delta, polarity_mult}
    return TransitionTable::create({
        {{1, X}, {{{2, X}, -1, 1}, {{4, X}, 1, 1}, {{1, Y}, 0, -1}}},
        {{1, Y}, {{{3, Y}, 1, 1}, {{1, X}, 0, -1}}},
        {{2, X}, {{{1, X}, 1, 1}, {{2, Z}, 0, -1}}},
        {{2, Z}, {{{5, Z}, -1, 1}, {{2, X}, 0, -1}}},
        {{3, Y}, {{{1, Y}, -1, 1}, {{6, Y}, 1, 1}, {{3, Z}, 0, 1}}},
        {{3, Z}, {{{4, Z}, 1, 1}, {{3, Y}, 0, 1}}},
        {{4, Z}, {{{3, Z}, -1, 1}, {{5, Z}, 1, 1}, {{4, X}, 0, 1}}},
        {{4, X}, {{{1, X}, -1, 1}, {{4, Z}, 0, 1}}},
        {{5, Z}, {{{4, Z}, -1, 1}, {{2, Z}, 1, 1}, {{5, Y}, 0, -1}}},
        {{5, Y}, {{{6, Y}, -1, 1}, {{5, Z}, 0, -1}}},
        {{6, Y}, {{{5, Y}, 1, 1}, {{3, Y}, -1, 1}, {{6, X}, 0, 1}}},
        {{6, X}, {{{6, Y}, 0, 1}}},
    });
}
}  // namespace ogear::gear

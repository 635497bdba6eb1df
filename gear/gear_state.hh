#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "wise_enum.h"

namespace ogear::gear {

WISE_ENUM_CLASS(Axis, X, Y, Z)

constexpr int MIN_SIDE = 1;
constexpr int MAX_SIDE = 6;
constexpr int NUM_TEETH = 5;

// +1 when the reference face of the gear points toward the positive direction of its axis
constexpr int POSITIVE_POLARITY = 1;
constexpr int NEGATIVE_POLARITY = -1;

// Which face of the cube the gear sits on and which axis it is aligned with
struct Position {
    int side;
    Axis axis;

    bool operator==(const Position &other) const;
};

struct GearState {
    Position position;
    // Index of the tooth engaged inside the cube, in [0, NUM_TEETH)
    int tooth;
    // Either POSITIVE_POLARITY or NEGATIVE_POLARITY
    int polarity;

    bool operator==(const GearState &other) const;
};

// Wraps any tooth index into [0, NUM_TEETH)
int normalize_tooth(const int tooth);

// Throws std::invalid_argument if the side, tooth or polarity is out of range
GearState make_gear_state(const int side, const Axis axis, const int tooth, const int polarity);

// Accepts "X", "Y" or "Z"
std::optional<Axis> parse_axis(const std::string_view axis);

// Maps "T" to POSITIVE_POLARITY and "F" to NEGATIVE_POLARITY
std::optional<int> parse_polarity_flag(const std::string_view flag);

std::string polarity_flag(const int polarity);

std::string to_string(const Position &position);
std::string to_string(const GearState &state);
}  // namespace ogear::gear

namespace std {
template <>
struct hash<ogear::gear::Position> {
    size_t operator()(const ogear::gear::Position &position) const {
        return (static_cast<size_t>(position.side) << 8) | static_cast<size_t>(position.axis);
    }
};

template <>
struct hash<ogear::gear::GearState> {
    size_t operator()(const ogear::gear::GearState &state) const {
        hash<ogear::gear::Position> position_hasher;
        return (position_hasher(state.position) << 8) |
               (static_cast<size_t>(state.tooth) << 1) |
               (state.polarity > 0 ? 1 : 0);
    }
};
}  // namespace std

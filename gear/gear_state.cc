#include "gear/gear_state.hh"

#include <sstream>
#include <stdexcept>

namespace ogear::gear {

bool Position::operator==(const Position &other) const {
    return side == other.side && axis == other.axis;
}

bool GearState::operator==(const GearState &other) const {
    return position == other.position && tooth == other.tooth && polarity == other.polarity;
}

int normalize_tooth(const int tooth) { return ((tooth % NUM_TEETH) + NUM_TEETH) % NUM_TEETH; }

GearState make_gear_state(const int side, const Axis axis, const int tooth, const int polarity) {
    if (side < MIN_SIDE || side > MAX_SIDE) {
        std::stringstream error;
        error << "Side must be in [" << MIN_SIDE << ", " << MAX_SIDE << "], got " << side;
        throw std::invalid_argument(error.str());
    }
    if (tooth < 0 || tooth >= NUM_TEETH) {
        std::stringstream error;
        error << "Tooth must be in [0, " << NUM_TEETH - 1 << "], got " << tooth;
        throw std::invalid_argument(error.str());
    }
    if (polarity != POSITIVE_POLARITY && polarity != NEGATIVE_POLARITY) {
        throw std::invalid_argument("Polarity must be 1 or -1, got " + std::to_string(polarity));
    }
    return GearState{.position = {.side = side, .axis = axis}, .tooth = tooth, .polarity = polarity};
}

std::optional<Axis> parse_axis(const std::string_view axis) {
    const auto maybe_axis = wise_enum::from_string<Axis>(axis);
    if (!maybe_axis) {
        return std::nullopt;
    }
    return *maybe_axis;
}

std::optional<int> parse_polarity_flag(const std::string_view flag) {
    if (flag == "T") {
        return POSITIVE_POLARITY;
    } else if (flag == "F") {
        return NEGATIVE_POLARITY;
    }
    return std::nullopt;
}

std::string polarity_flag(const int polarity) { return polarity > 0 ? "T" : "F"; }

std::string to_string(const Position &position) {
    std::stringstream out;
    out << "(side " << position.side << ", axis " << wise_enum::to_string(position.axis) << ")";
    return out.str();
}

std::string to_string(const GearState &state) {
    std::stringstream out;
    out << "side " << state.position.side << " axis " << wise_enum::to_string(state.position.axis)
        << " tooth " << state.tooth << " polarity " << polarity_flag(state.polarity);
    return out.str();
}
}  // namespace ogear::gear

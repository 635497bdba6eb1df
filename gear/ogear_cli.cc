#include "gear/ogear_cli.hh"

#include <optional>
#include <stdexcept>

#include "cxxopts.hpp"
#include "fmt/core.h"
#include "gear/transition_table.hh"

namespace ogear::gear {
namespace {
struct StateArgs {
    int side;
    std::string axis;
    int tooth;
    std::string polarity;
};

std::optional<GearState> state_from_args(const std::string &name, const StateArgs &args,
                                         std::ostream &out) {
    const auto maybe_axis = parse_axis(args.axis);
    if (!maybe_axis.has_value()) {
        out << "Invalid " << name << " axis: " << args.axis << ", expected X, Y or Z" << std::endl;
        return std::nullopt;
    }
    const auto maybe_polarity = parse_polarity_flag(args.polarity);
    if (!maybe_polarity.has_value()) {
        out << "Invalid " << name << " polarity: " << args.polarity << ", expected T or F"
            << std::endl;
        return std::nullopt;
    }
    try {
        return make_gear_state(args.side, maybe_axis.value(), args.tooth, maybe_polarity.value());
    } catch (const std::invalid_argument &e) {
        out << "Invalid " << name << " state: " << e.what() << std::endl;
        return std::nullopt;
    }
}

StateArgs read_state_args(const cxxopts::ParseResult &args, const std::string &prefix) {
    return StateArgs{
        .side = args[prefix + "_side"].as<int>(),
        .axis = args[prefix + "_axis"].as<std::string>(),
        .tooth = args[prefix + "_tooth"].as<int>(),
        .polarity = args[prefix + "_polarity"].as<std::string>(),
    };
}

cxxopts::Options make_options() {
    cxxopts::Options options("ogear", "A solver for the Hanayama Cast O'Gear puzzle");
    options.add_options()("initial_side", "Initial side of the cube, 1 to 6",
                          cxxopts::value<int>()->default_value("1"))(
        "initial_axis", "Initial axis of the gear, X, Y or Z",
        cxxopts::value<std::string>()->default_value("X"))(
        "initial_tooth", "Initial tooth inside the cube, 0 to 4",
        cxxopts::value<int>()->default_value("0"))(
        "initial_polarity", "Initial polarity of the gear, T if facing the axis, F otherwise",
        cxxopts::value<std::string>()->default_value("T"))(
        "target_side", "Target side of the cube, 1 to 6",
        cxxopts::value<int>()->default_value("6"))(
        "target_axis", "Target axis of the gear, X, Y or Z",
        cxxopts::value<std::string>()->default_value("X"))(
        "target_tooth", "Target tooth inside the cube, 0 to 4",
        cxxopts::value<int>()->default_value("4"))(
        "target_polarity", "Target polarity of the gear, T if facing the axis, F otherwise",
        cxxopts::value<std::string>()->default_value("F"))(
        "v,verbose", "Print the state after every step and search statistics")("h,help",
                                                                               "Print usage");
    return options;
}

std::string render_move(const int step, const Move &move) {
    if (move.is_rotation()) {
        return fmt::format("Step {}: Rotate\n", step);
    }
    return fmt::format("Step {}: Move to side {}\n", step, move.destination.side);
}
}  // namespace

std::string render_path(const SearchPath &path) {
    std::string out;
    for (int i = 0; i < static_cast<int>(path.size()); ++i) {
        out += render_move(i + 1, path.at(i));
    }
    return out;
}

int run_solver(const GearState &origin, const GearState &target, const bool verbose,
               std::ostream &out) {
    out << fmt::format("Origin : {}\n", to_string(origin));
    out << fmt::format("Target : {}\n", to_string(target));

    const auto table = make_ogear_transition_table();
    try {
        const auto result = solve(*table, origin, target);
        if (!verbose) {
            out << render_path(result.path);
            return 0;
        }
        // Interleave each step with the state it leads to
        GearState state = origin;
        for (int i = 0; i < static_cast<int>(result.path.size()); ++i) {
            const auto &move = result.path.at(i);
            out << render_move(i + 1, move);
            state = apply_transition(state, move.transition);
            out << fmt::format("    now at {}\n", to_string(state));
        }
        out << fmt::format("Solved in {} moves, expanded {} nodes, visited {} nodes\n",
                           result.path.size(), result.num_nodes_expanded,
                           result.num_nodes_visited);
    } catch (const InvalidPositionError &e) {
        out << e.what() << std::endl;
        return 1;
    } catch (const NoSolutionFoundError &e) {
        out << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int run_ogear(int argc, const char *const *argv, std::ostream &out) {
    auto options = make_options();

    try {
        const auto args = options.parse(argc, argv);

        if (args.count("help")) {
            out << options.help() << std::endl;
            return 0;
        }

        const auto maybe_origin =
            state_from_args("initial", read_state_args(args, "initial"), out);
        const auto maybe_target = state_from_args("target", read_state_args(args, "target"), out);
        if (!maybe_origin.has_value() || !maybe_target.has_value()) {
            out << options.help() << std::endl;
            return 1;
        }

        return run_solver(maybe_origin.value(), maybe_target.value(), args.count("verbose") > 0,
                          out);
    } catch (const cxxopts::exceptions::exception &e) {
        // Unknown options and values of the wrong type
        out << e.what() << std::endl;
        out << options.help() << std::endl;
        return 1;
    }
}
}  // namespace ogear::gear

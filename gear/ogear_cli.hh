#pragma once

#include <ostream>
#include <string>

#include "gear/gear_state.hh"
#include "gear/solver.hh"

namespace ogear::gear {

// One line per move, numbered from 1: "Step N: Rotate" or "Step N: Move to side S"
std::string render_path(const SearchPath &path);

// Solves the puzzle from `origin` to `target` and writes the result to `out`.
// Returns the process exit code.
int run_solver(const GearState &origin, const GearState &target, const bool verbose,
               std::ostream &out);

// Parses the command line and runs the solver. Bad options print the usage and return 1.
int run_ogear(int argc, const char *const *argv, std::ostream &out);
}  // namespace ogear::gear

#include <iostream>

#include "gear/ogear_cli.hh"

int main(int argc, char **argv) { return ogear::gear::run_ogear(argc, argv, std::cout); }

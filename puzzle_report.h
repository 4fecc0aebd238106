#pragma once

#include <ostream>

#include "puzzle.h"
#include "puzzle_generator.h"
#include "puzzle_solver.h"

// Grid, sequences, buffer and par as plain text. Cells on the canonical
// path are bracketed when `show_solution` is set.
void print_puzzle(std::ostream &out, const Puzzle &puzzle,
                  bool show_solution);

// One JSON object describing the puzzle and, when given, the solver result.
void write_puzzle_json(std::ostream &out, const Puzzle &puzzle,
                       const SolveResult *result);

void print_generation_stats(std::ostream &out, const GenerationStats &stats);

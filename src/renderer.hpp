#pragma once
/*
 * Renderer
 *
 * Purpose: push a parsed Grid onto an ITerminal, either whole or by dirty regions.
 * Constraint: stateless; the runtime owns the previous grid and computes regions.
 */
#include <string>
#include <vector>
#include "grid.hpp"
#include "iterminal.hpp"

class Renderer {
public:
  bool render(ITerminal& term,
              const Grid& grid,
              const std::vector<Region>& regions,
              bool full,
              std::string& msg);
};

#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (Color/Cell/Region).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <cstdint>

struct Color {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  bool is_default = true; // resolved by the surface at draw time

  static Color default_color() { return Color{}; }
  static Color rgb(uint8_t r, uint8_t g, uint8_t b) { return Color{r, g, b, false}; }
  bool operator==(const Color&) const = default;
};

struct Cell {
  char32_t ch = U' ';
  Color fg{};
  Color bg{};
  bool bold = false;
  bool italic = false;
  bool underline = false;
  bool strikethrough = false;
  bool operator==(const Cell&) const = default;
};

struct Region { int x = 0; int y = 0; int width = 0; int height = 0; };

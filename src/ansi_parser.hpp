#pragma once
/*
 * AnsiParser
 *
 * Purpose: turn view text (UTF-8 with CSI style/cursor sequences) into a Grid.
 * Supports: SGR (16/256/truecolor, bold/italic/underline/strike), CUP, CUU/CUD/CUF/CUB, ED, EL.
 * Note: colors that were never set stay "default"; the surface resolves them.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include "grid.hpp"

class AnsiParser {
public:
  // Longest CSI body collected before the sequence is abandoned.
  static constexpr size_t kMaxSequence = 64;

  explicit AnsiParser(Grid& grid);
  void feed(std::u32string_view text);

  int cursor_x() const { return cx_; }
  int cursor_y() const { return cy_; }

private:
  void put(char32_t ch);
  void next_row();
  void move_to(long long x, long long y);
  void dispatch(const std::u32string& seq);
  void apply_sgr(const std::string& params);
  void cursor_position(const std::string& params);
  void erase_display(const std::string& params);
  void erase_line(const std::string& params);

  Grid& grid_;
  int cx_ = 0;
  int cy_ = 0;
  Color fg_{};
  Color bg_{};
  bool bold_ = false;
  bool italic_ = false;
  bool underline_ = false;
  bool strikethrough_ = false;
};

Grid parse_ansi(std::string_view text, int width, int height);

Color ansi16_color(int code);
Color ansi256_color(int code);

#include "ansi_parser.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

static constexpr char32_t ESC = 0x1B;

static bool is_final(char32_t c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

// "1;;31" -> {1,0,31}; empty fields count as 0, junk fields are skipped.
static std::vector<int> split_params(const std::string& params) {
  std::vector<int> out;
  if (params.empty()) { out.push_back(0); return out; }
  size_t st = 0;
  while (st <= params.size()) {
    size_t pos = params.find(';', st);
    std::string part = params.substr(st, pos == std::string::npos ? std::string::npos : pos - st);
    if (part.empty()) {
      out.push_back(0);
    } else if (std::all_of(part.begin(), part.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
      try { out.push_back(std::stoi(part)); } catch (const std::out_of_range&) { out.push_back(-1); }
    }
    if (pos == std::string::npos) break;
    st = pos + 1;
  }
  return out;
}

// Single numeric parameter; `fallback` when absent or not a plain number.
static int single_param(const std::string& params, int fallback) {
  if (params.empty()) return fallback;
  if (!std::all_of(params.begin(), params.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return fallback;
  try { return std::stoi(params); } catch (const std::out_of_range&) { return fallback; }
}

static uint8_t channel(int v) { return static_cast<uint8_t>(std::clamp(v, 0, 255)); }

Color ansi16_color(int code) {
  static const Color table[16] = {
    Color::rgb(0, 0, 0),       Color::rgb(128, 0, 0),     Color::rgb(0, 128, 0),     Color::rgb(128, 128, 0),
    Color::rgb(0, 0, 128),     Color::rgb(128, 0, 128),   Color::rgb(0, 128, 128),   Color::rgb(192, 192, 192),
    Color::rgb(128, 128, 128), Color::rgb(255, 0, 0),     Color::rgb(0, 255, 0),     Color::rgb(255, 255, 0),
    Color::rgb(0, 0, 255),     Color::rgb(255, 0, 255),   Color::rgb(0, 255, 255),   Color::rgb(255, 255, 255),
  };
  if (code < 0 || code >= 16) return Color::default_color();
  return table[code];
}

Color ansi256_color(int code) {
  if (code < 0 || code > 255) return Color::default_color();
  if (code < 16) return ansi16_color(code);
  if (code <= 231) {
    int c = code - 16;
    return Color::rgb(channel((c / 36) * 51), channel(((c % 36) / 6) * 51), channel((c % 6) * 51));
  }
  uint8_t gray = channel((code - 232) * 10 + 8);
  return Color::rgb(gray, gray, gray);
}

AnsiParser::AnsiParser(Grid& grid) : grid_(grid) {}

void AnsiParser::feed(std::u32string_view text) {
  bool in_seq = false;
  std::u32string seq;
  size_t i = 0;
  while (i < text.size()) {
    char32_t ch = text[i];
    if (in_seq) {
      if (is_final(ch)) {
        seq.push_back(ch);
        dispatch(seq);
        seq.clear();
        in_seq = false;
        i++;
      } else if (seq.size() >= kMaxSequence) {
        // abandon; re-read this codepoint in Normal state
        seq.clear();
        in_seq = false;
      } else {
        seq.push_back(ch);
        i++;
      }
      continue;
    }
    if (ch == ESC && i + 1 < text.size() && text[i + 1] == U'[') {
      in_seq = true;
      i += 2;
      continue;
    }
    put(ch);
    i++;
  }
  // an unterminated sequence at end of input is dropped
}

void AnsiParser::put(char32_t ch) {
  switch (ch) {
    case U'\n': cx_ = 0; next_row(); break;
    case U'\r': cx_ = 0; break;
    case U'\t': cx_ = (cx_ / 8 + 1) * 8; break;
    default:
      if (ch < 0x20 || ch == 0x7F) return;
      grid_.set(cx_, cy_, Cell{ch, fg_, bg_, bold_, italic_, underline_, strikethrough_});
      cx_++;
      break;
  }
  if (cx_ >= grid_.width()) { cx_ = 0; next_row(); }
}

// The cursor may sit one past the last row or column (writes there are dropped) but never further.
void AnsiParser::next_row() { cy_ = std::min(cy_ + 1, grid_.height()); }

void AnsiParser::move_to(long long x, long long y) {
  cx_ = static_cast<int>(std::clamp<long long>(x, 0, grid_.width()));
  cy_ = static_cast<int>(std::clamp<long long>(y, 0, grid_.height()));
}

void AnsiParser::dispatch(const std::u32string& seq) {
  char32_t cmd = seq.back();
  std::string params;
  params.reserve(seq.size());
  for (size_t k = 0; k + 1 < seq.size(); ++k) {
    char32_t c = seq[k];
    params.push_back(c < 0x80 ? static_cast<char>(c) : '?');
  }
  switch (cmd) {
    case U'm': apply_sgr(params); break;
    case U'H': case U'f': cursor_position(params); break;
    case U'A': move_to(cx_, static_cast<long long>(cy_) - std::max(1, single_param(params, 1))); break;
    case U'B': move_to(cx_, static_cast<long long>(cy_) + std::max(1, single_param(params, 1))); break;
    case U'C': move_to(static_cast<long long>(cx_) + std::max(1, single_param(params, 1)), cy_); break;
    case U'D': move_to(static_cast<long long>(cx_) - std::max(1, single_param(params, 1)), cy_); break;
    case U'J': erase_display(params); break;
    case U'K': erase_line(params); break;
    default: break;
  }
}

void AnsiParser::apply_sgr(const std::string& params) {
  std::vector<int> codes = split_params(params);
  for (size_t i = 0; i < codes.size(); ++i) {
    int code = codes[i];
    switch (code) {
      case 0:
        fg_ = Color::default_color(); bg_ = Color::default_color();
        bold_ = italic_ = underline_ = strikethrough_ = false;
        break;
      case 1: bold_ = true; break;
      case 3: italic_ = true; break;
      case 4: underline_ = true; break;
      case 9: strikethrough_ = true; break;
      case 22: bold_ = false; break;
      case 23: italic_ = false; break;
      case 24: underline_ = false; break;
      case 29: strikethrough_ = false; break;
      case 38: case 48: {
        Color& target = (code == 38) ? fg_ : bg_;
        if (i + 2 < codes.size() && codes[i + 1] == 5) {
          target = ansi256_color(codes[i + 2]);
          i += 2;
        } else if (i + 4 < codes.size() && codes[i + 1] == 2) {
          target = Color::rgb(channel(codes[i + 2]), channel(codes[i + 3]), channel(codes[i + 4]));
          i += 4;
        }
      } break;
      case 39: fg_ = Color::default_color(); break;
      case 49: bg_ = Color::default_color(); break;
      default:
        if (code >= 30 && code <= 37) fg_ = ansi16_color(code - 30);
        else if (code >= 40 && code <= 47) bg_ = ansi16_color(code - 40);
        else if (code >= 90 && code <= 97) fg_ = ansi16_color(code - 90 + 8);
        else if (code >= 100 && code <= 107) bg_ = ansi16_color(code - 100 + 8);
        break;
    }
  }
}

void AnsiParser::cursor_position(const std::string& params) {
  std::vector<int> coords = split_params(params);
  long long y = coords.size() >= 1 ? coords[0] - 1LL : 0;
  long long x = coords.size() >= 2 ? coords[1] - 1LL : 0;
  move_to(x, y);
}

void AnsiParser::erase_display(const std::string& params) {
  switch (single_param(params, 0)) {
    case 0:
      grid_.clear_from(cx_, cy_);
      for (int y = cy_ + 1; y < grid_.height(); ++y) grid_.clear_line(y);
      break;
    case 1:
      for (int y = 0; y < cy_ && y < grid_.height(); ++y) grid_.clear_line(y);
      grid_.clear_to(cx_, cy_);
      break;
    case 2: case 3:
      grid_.clear();
      break;
    default: break;
  }
}

void AnsiParser::erase_line(const std::string& params) {
  switch (single_param(params, 0)) {
    case 0: grid_.clear_from(cx_, cy_); break;
    case 1: grid_.clear_to(cx_, cy_); break;
    case 2: grid_.clear_line(cy_); break;
    default: break;
  }
}

Grid parse_ansi(std::string_view text, int width, int height) {
  Grid grid(width, height);
  if (grid.empty()) return grid;
  AnsiParser p(grid);
  p.feed(decode_utf8(text));
  return grid;
}

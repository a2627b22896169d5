#include "headless_terminal.hpp"
#include <stdexcept>
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int cols, int rows) : screen_(cols, rows) {}

TermSize HeadlessTerminal::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {screen_.height(), screen_.width()};
}

void HeadlessTerminal::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  screen_.clear();
  clears_++;
}

void HeadlessTerminal::draw_cell(int row, int col, const Cell& cell) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_draws_) throw std::runtime_error("headless surface: draw failed");
  screen_.set(col, row, cell);
  draws_++;
}

void HeadlessTerminal::refresh() {
  std::lock_guard<std::mutex> lk(mu_);
  refreshes_++;
}

void HeadlessTerminal::set_title(const std::string& title) {
  std::lock_guard<std::mutex> lk(mu_);
  title_ = title;
}

void HeadlessTerminal::pump(EventSink& sink, int) {
  std::deque<std::function<void(EventSink&)>> steps;
  {
    std::lock_guard<std::mutex> lk(mu_);
    steps.swap(script_);
  }
  for (auto& step : steps) step(sink);
}

void HeadlessTerminal::push(Msg msg) {
  std::lock_guard<std::mutex> lk(mu_);
  script_.push_back([m = std::move(msg)](EventSink& s) { s.post(m); });
}

void HeadlessTerminal::push_motion(int x, int y) {
  std::lock_guard<std::mutex> lk(mu_);
  script_.push_back([x, y](EventSink& s) { s.post_motion(x, y); });
}

void HeadlessTerminal::push_quit() {
  std::lock_guard<std::mutex> lk(mu_);
  script_.push_back([](EventSink& s) { s.quit(); });
}

void HeadlessTerminal::resize(int cols, int rows) {
  std::lock_guard<std::mutex> lk(mu_);
  screen_ = Grid(cols, rows);
  script_.push_back([cols, rows](EventSink& s) { s.post(WindowSizeMsg{cols, rows}); });
}

void HeadlessTerminal::set_fail_draws(bool fail) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_draws_ = fail;
}

std::optional<Cell> HeadlessTerminal::cell(int row, int col) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (const Cell* c = screen_.at(col, row)) return *c;
  return std::nullopt;
}

std::string HeadlessTerminal::row_text(int row) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::u32string line;
  for (int x = 0; x < screen_.width(); ++x) {
    const Cell* c = screen_.at(x, row);
    if (!c) break;
    line.push_back(c->ch);
  }
  while (!line.empty() && line.back() == U' ') line.pop_back();
  std::string out;
  for (char32_t cp : line) out += encode_utf8(cp);
  return out;
}

std::string HeadlessTerminal::title() const {
  std::lock_guard<std::mutex> lk(mu_);
  return title_;
}

size_t HeadlessTerminal::draws() const { std::lock_guard<std::mutex> lk(mu_); return draws_; }
size_t HeadlessTerminal::refreshes() const { std::lock_guard<std::mutex> lk(mu_); return refreshes_; }
size_t HeadlessTerminal::clears() const { std::lock_guard<std::mutex> lk(mu_); return clears_; }

void HeadlessTerminal::reset_counters() {
  std::lock_guard<std::mutex> lk(mu_);
  draws_ = refreshes_ = clears_ = 0;
}

#include "messages.hpp"
#include "utf8.hpp"
#include <sstream>

const char* key_type_name(KeyType t) {
  switch (t) {
    case KeyType::Runes: return "runes";
    case KeyType::Enter: return "enter";
    case KeyType::Backspace: return "backspace";
    case KeyType::Tab: return "tab";
    case KeyType::Esc: return "esc";
    case KeyType::Up: return "up";
    case KeyType::Down: return "down";
    case KeyType::Left: return "left";
    case KeyType::Right: return "right";
    case KeyType::Home: return "home";
    case KeyType::End: return "end";
    case KeyType::PgUp: return "pgup";
    case KeyType::PgDown: return "pgdown";
    case KeyType::Delete: return "delete";
    case KeyType::Insert: return "insert";
    case KeyType::F1: return "f1";
    case KeyType::F2: return "f2";
    case KeyType::F3: return "f3";
    case KeyType::F4: return "f4";
    case KeyType::F5: return "f5";
    case KeyType::F6: return "f6";
    case KeyType::F7: return "f7";
    case KeyType::F8: return "f8";
    case KeyType::F9: return "f9";
    case KeyType::F10: return "f10";
    case KeyType::F11: return "f11";
    case KeyType::F12: return "f12";
    case KeyType::CtrlC: return "ctrl+c";
    case KeyType::CtrlD: return "ctrl+d";
    case KeyType::CtrlL: return "ctrl+l";
    case KeyType::CtrlZ: return "ctrl+z";
  }
  return "unknown";
}

std::string KeyMsg::str() const {
  std::string s = alt ? "alt+" : "";
  if (type != KeyType::Runes) return s + key_type_name(type);
  for (char32_t r : runes) s += encode_utf8(r);
  return s;
}

static const char* mouse_type_name(MouseEventType t) {
  switch (t) {
    case MouseEventType::Press: return "press";
    case MouseEventType::Release: return "release";
    case MouseEventType::Motion: return "motion";
    case MouseEventType::Wheel: return "wheel";
  }
  return "?";
}

static const char* mouse_button_name(MouseButton b) {
  switch (b) {
    case MouseButton::None: return "none";
    case MouseButton::Left: return "left";
    case MouseButton::Middle: return "middle";
    case MouseButton::Right: return "right";
    case MouseButton::WheelUp: return "wheel-up";
    case MouseButton::WheelDown: return "wheel-down";
    case MouseButton::WheelLeft: return "wheel-left";
    case MouseButton::WheelRight: return "wheel-right";
  }
  return "?";
}

namespace {
struct Describer {
  std::string operator()(const KeyMsg& k) const { return "KeyMsg{" + k.str() + "}"; }
  std::string operator()(const MouseMsg& m) const {
    std::ostringstream oss;
    oss << "MouseMsg{x:" << m.x << " y:" << m.y << " " << mouse_type_name(m.type)
        << " " << mouse_button_name(m.button) << "}";
    return oss.str();
  }
  std::string operator()(const WindowSizeMsg& w) const {
    return "WindowSizeMsg{" + std::to_string(w.width) + "x" + std::to_string(w.height) + "}";
  }
  std::string operator()(const QuitMsg&) const { return "QuitMsg{}"; }
  std::string operator()(const ErrorMsg& e) const { return "ErrorMsg{" + e.what + "}"; }
  std::string operator()(const TickMsg& t) const { return "TickMsg{id:" + std::to_string(t.id) + "}"; }
  std::string operator()(const CustomMsg& c) const { return "CustomMsg{" + c.tag + "}"; }
};
}

std::string describe(const Msg& m) { return std::visit(Describer{}, m); }

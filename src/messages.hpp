#pragma once
/*
 * Messages
 *
 * Purpose: closed sum type of every event a Model::update can receive.
 * Extend: application-defined events travel as CustomMsg{tag, payload}.
 */
#include <any>
#include <chrono>
#include <string>
#include <variant>

enum class KeyType {
  Runes, Enter, Backspace, Tab, Esc,
  Up, Down, Left, Right, Home, End, PgUp, PgDown, Delete, Insert,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  CtrlC, CtrlD, CtrlL, CtrlZ
};

struct KeyMsg {
  KeyType type = KeyType::Runes;
  std::u32string runes;
  bool alt = false;
  std::string str() const;
};

enum class MouseEventType { Press, Release, Motion, Wheel };
enum class MouseButton { None, Left, Middle, Right, WheelUp, WheelDown, WheelLeft, WheelRight };

struct MouseMsg {
  int x = 0;
  int y = 0;
  MouseEventType type = MouseEventType::Press;
  MouseButton button = MouseButton::None;
};

struct WindowSizeMsg { int width = 0; int height = 0; };
struct QuitMsg {};
struct ErrorMsg { std::string what; };

struct TickMsg {
  std::chrono::system_clock::time_point time{};
  int id = 0;
};

struct CustomMsg {
  std::string tag;
  std::any payload;

  template <typename T>
  const T* as() const { return std::any_cast<T>(&payload); }
};

using Msg = std::variant<KeyMsg, MouseMsg, WindowSizeMsg, QuitMsg, ErrorMsg, TickMsg, CustomMsg>;

template <typename T>
CustomMsg custom(std::string tag, T value) { return CustomMsg{std::move(tag), std::any(std::move(value))}; }

inline bool is_quit(const Msg& m) { return std::holds_alternative<QuitMsg>(m); }

const char* key_type_name(KeyType t);
std::string describe(const Msg& m);

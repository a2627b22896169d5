#pragma once
/*
 * Model
 *
 * Purpose: application state driven by the Program's init/update/view cycle.
 * Contract: update() may return a new model or the same one (or nullptr to keep
 * the current model); view() must not mutate state.
 */
#include <memory>
#include <string>
#include "command.hpp"
#include "messages.hpp"

class Model;

struct Transition {
  std::shared_ptr<Model> model;
  Command cmd;
};

class Model : public std::enable_shared_from_this<Model> {
public:
  virtual ~Model() = default;
  virtual Command init() { return Command(); }
  virtual Transition update(const Msg& msg) = 0;
  virtual std::string view() const = 0;

protected:
  // Keep this model and optionally run a command.
  Transition stay(Command cmd = Command()) { return Transition{shared_from_this(), std::move(cmd)}; }
};

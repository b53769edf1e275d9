#pragma once

#include <functional>
#include <internal_name.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace mctext {
class Text;

/*
 * What the client does when the owning text is clicked. The payload is
 * itself a text node, usually a plain literal holding a URL or command.
 */
class ClickEvent {
public:
  class Action : public InternalName<Action> {
    explicit Action(std::string name) : InternalName(std::move(name)) {}

  public:
    static Action of(std::string internal_name);

    static const Action OPEN_URL;
    static const Action RUN_COMMAND;
    static const Action SUGGEST_COMMAND;
    static const Action CHANGE_PAGE;
  };

  ClickEvent(Action action, Text value);

  const Action &action() const;
  const Text &value() const;

  bool operator==(const ClickEvent &other) const;

  template <typename H> friend H AbslHashValue(H h, const ClickEvent &e) {
    return H::combine(std::move(h), e._action, *e._value);
  }

private:
  Action _action;
  std::shared_ptr<const Text> _value;
};

/*
 * What the client shows when the owning text is hovered over.
 */
class HoverEvent {
public:
  class Action : public InternalName<Action> {
    explicit Action(std::string name) : InternalName(std::move(name)) {}

  public:
    static Action of(std::string internal_name);

    static const Action SHOW_TEXT;
    static const Action SHOW_ITEM;
    static const Action SHOW_ENTITY;
    static const Action SHOW_ACHIEVEMENT;
  };

  HoverEvent(Action action, Text value);

  const Action &action() const;
  const Text &value() const;

  bool operator==(const HoverEvent &other) const;

  template <typename H> friend H AbslHashValue(H h, const HoverEvent &e) {
    return H::combine(std::move(h), e._action, *e._value);
  }

private:
  Action _action;
  std::shared_ptr<const Text> _value;
};

std::ostream &operator<<(std::ostream &stream, const ClickEvent &event);
std::ostream &operator<<(std::ostream &stream, const HoverEvent &event);
} // namespace mctext

namespace std {
template <> struct hash<mctext::ClickEvent::Action> {
  size_t operator()(const mctext::ClickEvent::Action &action) const;
};

template <> struct hash<mctext::HoverEvent::Action> {
  size_t operator()(const mctext::HoverEvent::Action &action) const;
};
} // namespace std

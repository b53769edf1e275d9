#include <event.hpp>
#include <text.hpp>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <absl/hash/hash.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
  ClickEvent::Action ClickEvent::Action::of(std::string internal_name) {
    return Action(std::move(internal_name));
  }

  const ClickEvent::Action ClickEvent::Action::OPEN_URL = Action("open_url");
  const ClickEvent::Action ClickEvent::Action::RUN_COMMAND = Action("run_command");
  const ClickEvent::Action ClickEvent::Action::SUGGEST_COMMAND = Action("suggest_command");
  const ClickEvent::Action ClickEvent::Action::CHANGE_PAGE = Action("change_page");

  ClickEvent::ClickEvent(Action action, Text value)
    : _action(std::move(action))
    , _value(std::make_shared<const Text>(std::move(value))) {}

  const ClickEvent::Action& ClickEvent::action() const {
    return _action;
  }

  const Text& ClickEvent::value() const {
    return *_value;
  }

  bool ClickEvent::operator==(const ClickEvent& other) const {
    return _action == other._action && *_value == *other._value;
  }

  std::ostream& operator<<(std::ostream& stream, const ClickEvent& event) {
    return stream << "ClickEvent{action=" << event.action() << ", value=" << event.value() << "}";
  }

  HoverEvent::Action HoverEvent::Action::of(std::string internal_name) {
    return Action(std::move(internal_name));
  }

  const HoverEvent::Action HoverEvent::Action::SHOW_TEXT = Action("show_text");
  const HoverEvent::Action HoverEvent::Action::SHOW_ITEM = Action("show_item");
  const HoverEvent::Action HoverEvent::Action::SHOW_ENTITY = Action("show_entity");
  const HoverEvent::Action HoverEvent::Action::SHOW_ACHIEVEMENT = Action("show_achievement");

  HoverEvent::HoverEvent(Action action, Text value)
    : _action(std::move(action))
    , _value(std::make_shared<const Text>(std::move(value))) {}

  const HoverEvent::Action& HoverEvent::action() const {
    return _action;
  }

  const Text& HoverEvent::value() const {
    return *_value;
  }

  bool HoverEvent::operator==(const HoverEvent& other) const {
    return _action == other._action && *_value == *other._value;
  }

  std::ostream& operator<<(std::ostream& stream, const HoverEvent& event) {
    return stream << "HoverEvent{action=" << event.action() << ", value=" << event.value() << "}";
  }
}

size_t std::hash<mctext::ClickEvent::Action>::operator()(const mctext::ClickEvent::Action &action) const {
  return absl::Hash<mctext::ClickEvent::Action>{}(action);
}

size_t std::hash<mctext::HoverEvent::Action>::operator()(const mctext::HoverEvent::Action &action) const {
  return absl::Hash<mctext::HoverEvent::Action>{}(action);
}

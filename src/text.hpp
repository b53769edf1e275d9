#pragma once

#include <event.hpp>
#include <format.hpp>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mctext {
class Text;

struct Literal {
  std::string content;

  bool operator==(const Literal &) const = default;

  template <typename H> friend H AbslHashValue(H h, const Literal &l) {
    return H::combine(std::move(h), l.content);
  }
};

struct Translatable {
  std::string key;
  std::vector<Text> args;

  bool has_arguments() const;
  bool operator==(const Translatable &other) const;

  template <typename H> friend H AbslHashValue(H h, const Translatable &t) {
    return H::combine(std::move(h), t.key, t.args);
  }
};

struct Keybind {
  std::string keybind;

  bool operator==(const Keybind &) const = default;

  template <typename H> friend H AbslHashValue(H h, const Keybind &k) {
    return H::combine(std::move(h), k.keybind);
  }
};

using Content = std::variant<Literal, Translatable, Keybind>;
using Decorations = std::map<Decoration, bool>;

template <typename Derived> class TextBuilder;

/*
 * An immutable node of a chat text tree. Nodes are only created through the
 * builders in text_builder.hpp or the factories below.
 */
class Text {
  Content _content;
  Decorations _decorations;
  Colour _colour;
  std::optional<std::string> _insertion;
  std::optional<ClickEvent> _click_event;
  std::optional<HoverEvent> _hover_event;
  std::vector<Text> _children;

  Text(Content content, Decorations decorations, Colour colour,
       std::optional<std::string> insertion,
       std::optional<ClickEvent> click_event,
       std::optional<HoverEvent> hover_event, std::vector<Text> children);

  template <typename Derived> friend class TextBuilder;

public:
  static Text of(std::string content);
  static Text translation(std::string key, std::vector<Text> args = {});
  static Text key(std::string keybind);

  const Content &content() const;
  const Literal *literal() const;
  const Translatable *translatable() const;
  const Keybind *keybind() const;

  const Decorations &decorations() const;
  /* Explicit value of the decoration, nullopt when unspecified. */
  std::optional<bool> decoration(const Decoration &decoration) const;
  bool has_decoration(const Decoration &d) const;
  bool is_bold() const;
  bool is_italic() const;
  bool is_underlined() const;
  bool is_strikethrough() const;
  bool is_obfuscated() const;

  const Colour &colour() const;
  const std::optional<std::string> &insertion() const;
  const std::optional<ClickEvent> &click_event() const;
  const std::optional<HoverEvent> &hover_event() const;

  const std::vector<Text> &children() const;
  bool has_children() const;
  bool contains(const Text &child) const;

  bool operator==(const Text &other) const;

  template <typename H> friend H AbslHashValue(H h, const Text &t) {
    return H::combine(std::move(h), t._content, t._decorations, t._colour,
                      t._insertion, t._click_event, t._hover_event,
                      t._children);
  }
};

std::ostream &operator<<(std::ostream &stream, const Literal &literal);
std::ostream &operator<<(std::ostream &stream, const Translatable &translatable);
std::ostream &operator<<(std::ostream &stream, const Keybind &keybind);
std::ostream &operator<<(std::ostream &stream, const Text &text);
} // namespace mctext

namespace std {
template <> struct hash<mctext::Text> {
  size_t operator()(const mctext::Text &text) const;
};
} // namespace std

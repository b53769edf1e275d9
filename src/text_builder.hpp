#pragma once

#include <optional>
#include <string>
#include <text.hpp>
#include <utility>
#include <vector>

namespace mctext {
/*
 * Shared part of the builders. Every setter returns the concrete builder so
 * calls chain:
 *
 *   auto text = LiteralBuilder("Hello").apply(Decoration::BOLD)
 *                                      .apply(Colour::RED)
 *                                      .build();
 */
template <typename Derived> class TextBuilder {
protected:
  Decorations decorations;
  Colour colour = Colour::NONE;
  std::optional<std::string> insertion_text;
  std::optional<ClickEvent> click_event;
  std::optional<HoverEvent> hover_event;
  std::vector<Text> children;

  TextBuilder() = default;
  explicit TextBuilder(const Text &text)
      : decorations(text.decorations()), colour(text.colour()),
        insertion_text(text.insertion()), click_event(text.click_event()),
        hover_event(text.hover_event()), children(text.children()) {}

  Text make(Content content) const {
    return Text(std::move(content), decorations, colour, insertion_text,
                click_event, hover_event, children);
  }

  Derived &self() { return static_cast<Derived &>(*this); }

public:
  Derived &apply(const Decoration &decoration) {
    return apply(decoration, true);
  }

  Derived &unapply(const Decoration &decoration) {
    return apply(decoration, false);
  }

  /* nullopt removes the decoration, leaving it unspecified. */
  Derived &apply(const Decoration &decoration, std::optional<bool> active) {
    if (decoration == Decoration::RESET) {
      decorations.clear();
      colour = Colour::NONE;
    } else if (!active.has_value()) {
      decorations.erase(decoration);
    } else {
      decorations.insert_or_assign(decoration, *active);
    }
    return self();
  }

  Derived &apply(const Colour &_colour) {
    colour = _colour;
    return self();
  }

  Derived &insertion(std::string insertion) {
    insertion_text = std::move(insertion);
    return self();
  }

  Derived &click(ClickEvent event) {
    click_event.emplace(std::move(event));
    return self();
  }

  Derived &hover(HoverEvent event) {
    hover_event.emplace(std::move(event));
    return self();
  }

  Derived &append(Text child) {
    children.push_back(std::move(child));
    return self();
  }
};

class LiteralBuilder : public TextBuilder<LiteralBuilder> {
  std::string _content;

public:
  LiteralBuilder() = default;
  explicit LiteralBuilder(std::string content);
  /* Copies every field of a literal node. */
  explicit LiteralBuilder(const Text &text);

  LiteralBuilder &content(std::string content);
  Text build() const;
};

class TranslatableBuilder : public TextBuilder<TranslatableBuilder> {
  std::string _key;
  std::vector<Text> args;

public:
  TranslatableBuilder() = default;
  explicit TranslatableBuilder(std::string key, std::vector<Text> args = {});
  /* Copies every field of a translatable node. */
  explicit TranslatableBuilder(const Text &text);

  TranslatableBuilder &key(std::string key);
  TranslatableBuilder &argument(Text argument);
  Text build() const;
};

class KeybindBuilder : public TextBuilder<KeybindBuilder> {
  std::string _keybind;

public:
  KeybindBuilder() = default;
  explicit KeybindBuilder(std::string keybind);
  /* Copies every field of a keybind node. */
  explicit KeybindBuilder(const Text &text);

  KeybindBuilder &keybind(std::string keybind);
  Text build() const;
};
} // namespace mctext

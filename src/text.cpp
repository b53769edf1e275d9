#include <algorithm>
#include <text.hpp>
#include <text_builder.hpp>
#include <util.hpp>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <absl/hash/hash.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
  bool Translatable::has_arguments() const {
    return !args.empty();
  }

  bool Translatable::operator==(const Translatable& other) const {
    return key == other.key && args == other.args;
  }

  Text::Text(Content content, Decorations decorations, Colour colour,
             std::optional<std::string> insertion,
             std::optional<ClickEvent> click_event,
             std::optional<HoverEvent> hover_event, std::vector<Text> children)
    : _content(std::move(content))
    , _decorations(std::move(decorations))
    , _colour(std::move(colour))
    , _insertion(std::move(insertion))
    , _click_event(std::move(click_event))
    , _hover_event(std::move(hover_event))
    , _children(std::move(children)) {}

  Text Text::of(std::string content) {
    return LiteralBuilder(std::move(content)).build();
  }

  Text Text::translation(std::string key, std::vector<Text> args) {
    return TranslatableBuilder(std::move(key), std::move(args)).build();
  }

  Text Text::key(std::string keybind) {
    return KeybindBuilder(std::move(keybind)).build();
  }

  const Content& Text::content() const {
    return _content;
  }

  const Literal* Text::literal() const {
    return std::get_if<Literal>(&_content);
  }

  const Translatable* Text::translatable() const {
    return std::get_if<Translatable>(&_content);
  }

  const Keybind* Text::keybind() const {
    return std::get_if<Keybind>(&_content);
  }

  const Decorations& Text::decorations() const {
    return _decorations;
  }

  std::optional<bool> Text::decoration(const Decoration& decoration) const {
    auto i = _decorations.find(decoration);
    if (i == _decorations.end()) {
      return std::nullopt;
    }
    return i->second;
  }

  bool Text::has_decoration(const Decoration& d) const {
    return decoration(d).value_or(false);
  }

  bool Text::is_bold() const {
    return has_decoration(Decoration::BOLD);
  }

  bool Text::is_italic() const {
    return has_decoration(Decoration::ITALIC);
  }

  bool Text::is_underlined() const {
    return has_decoration(Decoration::UNDERLINED);
  }

  bool Text::is_strikethrough() const {
    return has_decoration(Decoration::STRIKETHROUGH);
  }

  bool Text::is_obfuscated() const {
    return has_decoration(Decoration::OBFUSCATED);
  }

  const Colour& Text::colour() const {
    return _colour;
  }

  const std::optional<std::string>& Text::insertion() const {
    return _insertion;
  }

  const std::optional<ClickEvent>& Text::click_event() const {
    return _click_event;
  }

  const std::optional<HoverEvent>& Text::hover_event() const {
    return _hover_event;
  }

  const std::vector<Text>& Text::children() const {
    return _children;
  }

  bool Text::has_children() const {
    return !_children.empty();
  }

  bool Text::contains(const Text& child) const {
    return std::find(_children.begin(), _children.end(), child) != _children.end();
  }

  bool Text::operator==(const Text& other) const {
    return _content == other._content
        && _decorations == other._decorations
        && _colour == other._colour
        && _insertion == other._insertion
        && _click_event == other._click_event
        && _hover_event == other._hover_event
        && _children == other._children;
  }

  std::ostream& operator<<(std::ostream& stream, const Literal& literal) {
    return stream << "Literal{content=\"" << literal.content << "\"}";
  }

  std::ostream& operator<<(std::ostream& stream, const Translatable& translatable) {
    stream << "Translatable{key=\"" << translatable.key << "\"";
    if (translatable.has_arguments()) {
      stream << ", args=[" << absl::StrJoin(translatable.args, ", ", absl::StreamFormatter()) << "]";
    }
    return stream << "}";
  }

  std::ostream& operator<<(std::ostream& stream, const Keybind& keybind) {
    return stream << "Keybind{keybind=\"" << keybind.keybind << "\"}";
  }

  std::ostream& operator<<(std::ostream& stream, const Text& text) {
    stream << "Text{";
    std::visit([&](const auto& content) { stream << content; }, text.content());
    if (!text.decorations().empty()) {
      stream << ", decorations={"
             << absl::StrJoin(text.decorations(), ", ", [](std::string* out, const auto& entry) {
                  absl::StrAppend(out, entry.first.internal_name(), "=", entry.second ? "true" : "false");
                })
             << "}";
    }
    if (text.colour() != Colour::NONE) {
      stream << ", colour=" << text.colour();
    }
    if (text.insertion()) {
      stream << ", insertion=\"" << *text.insertion() << "\"";
    }
    if (text.click_event()) {
      stream << ", click=" << *text.click_event();
    }
    if (text.hover_event()) {
      stream << ", hover=" << *text.hover_event();
    }
    if (text.has_children()) {
      stream << ", children=[" << absl::StrJoin(text.children(), ", ", absl::StreamFormatter()) << "]";
    }
    return stream << "}";
  }

  LiteralBuilder::LiteralBuilder(std::string content)
    : _content(std::move(content)) {}

  LiteralBuilder::LiteralBuilder(const Text& text)
    : TextBuilder(text) {
    auto literal = text.literal();
    MCTEXT_ASSERT(literal != nullptr, "LiteralBuilder requires a literal node");
    _content = literal->content;
  }

  LiteralBuilder& LiteralBuilder::content(std::string content) {
    _content = std::move(content);
    return *this;
  }

  Text LiteralBuilder::build() const {
    return make(Literal{_content});
  }

  TranslatableBuilder::TranslatableBuilder(std::string key, std::vector<Text> _args)
    : _key(std::move(key))
    , args(std::move(_args)) {}

  TranslatableBuilder::TranslatableBuilder(const Text& text)
    : TextBuilder(text) {
    auto translatable = text.translatable();
    MCTEXT_ASSERT(translatable != nullptr, "TranslatableBuilder requires a translatable node");
    _key = translatable->key;
    args = translatable->args;
  }

  TranslatableBuilder& TranslatableBuilder::key(std::string key) {
    _key = std::move(key);
    return *this;
  }

  TranslatableBuilder& TranslatableBuilder::argument(Text argument) {
    args.push_back(std::move(argument));
    return *this;
  }

  Text TranslatableBuilder::build() const {
    return make(Translatable{_key, args});
  }

  KeybindBuilder::KeybindBuilder(std::string keybind)
    : _keybind(std::move(keybind)) {}

  KeybindBuilder::KeybindBuilder(const Text& text)
    : TextBuilder(text) {
    auto keybind = text.keybind();
    MCTEXT_ASSERT(keybind != nullptr, "KeybindBuilder requires a keybind node");
    _keybind = keybind->keybind;
  }

  KeybindBuilder& KeybindBuilder::keybind(std::string keybind) {
    _keybind = std::move(keybind);
    return *this;
  }

  Text KeybindBuilder::build() const {
    return make(Keybind{_keybind});
  }
}

size_t std::hash<mctext::Text>::operator()(const mctext::Text &text) const {
  return absl::Hash<mctext::Text>{}(text);
}

#pragma once

#include <functional>
#include <internal_name.hpp>
#include <string>
#include <utility>

namespace mctext {
class Colour : public InternalName<Colour> {
  explicit Colour(std::string name) : InternalName(std::move(name)) {}

public:
  static Colour of(std::string internal_name);

  /* Inherit the colour of the parent. Never written to the wire. */
  static const Colour NONE;

  static const Colour BLACK;
  static const Colour DARK_BLUE;
  static const Colour DARK_GREEN;
  static const Colour DARK_CYAN;
  static const Colour DARK_RED;
  static const Colour PURPLE;
  static const Colour GOLD;
  static const Colour GREY;
  static const Colour DARK_GREY;
  static const Colour BLUE;
  static const Colour BRIGHT_GREEN;
  static const Colour CYAN;
  static const Colour RED;
  static const Colour PINK;
  static const Colour YELLOW;
  static const Colour WHITE;
};

class Decoration : public InternalName<Decoration> {
  explicit Decoration(std::string name) : InternalName(std::move(name)) {}

public:
  static Decoration of(std::string internal_name);

  /* Clears every decoration and the colour when applied, never stored. */
  static const Decoration RESET;

  static const Decoration OBFUSCATED;
  static const Decoration BOLD;
  static const Decoration STRIKETHROUGH;
  static const Decoration UNDERLINED;
  static const Decoration ITALIC;
};
} // namespace mctext

namespace std {
template <> struct hash<mctext::Colour> {
  size_t operator()(const mctext::Colour &colour) const;
};

template <> struct hash<mctext::Decoration> {
  size_t operator()(const mctext::Decoration &decoration) const;
};
} // namespace std

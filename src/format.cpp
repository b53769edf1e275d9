#include <format.hpp>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <absl/hash/hash.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
  Colour Colour::of(std::string internal_name) {
    return Colour(std::move(internal_name));
  }

  const Colour Colour::NONE = Colour("none");

  const Colour Colour::BLACK = Colour("black");
  const Colour Colour::DARK_BLUE = Colour("dark_blue");
  const Colour Colour::DARK_GREEN = Colour("dark_green");
  const Colour Colour::DARK_CYAN = Colour("dark_aqua");
  const Colour Colour::DARK_RED = Colour("dark_red");
  const Colour Colour::PURPLE = Colour("dark_purple");
  const Colour Colour::GOLD = Colour("gold");
  const Colour Colour::GREY = Colour("gray");
  const Colour Colour::DARK_GREY = Colour("dark_gray");
  const Colour Colour::BLUE = Colour("blue");
  const Colour Colour::BRIGHT_GREEN = Colour("green");
  const Colour Colour::CYAN = Colour("aqua");
  const Colour Colour::RED = Colour("red");
  const Colour Colour::PINK = Colour("light_purple");
  const Colour Colour::YELLOW = Colour("yellow");
  const Colour Colour::WHITE = Colour("white");

  Decoration Decoration::of(std::string internal_name) {
    return Decoration(std::move(internal_name));
  }

  const Decoration Decoration::RESET = Decoration("reset");

  const Decoration Decoration::OBFUSCATED = Decoration("obfuscated");
  const Decoration Decoration::BOLD = Decoration("bold");
  const Decoration Decoration::STRIKETHROUGH = Decoration("strikethrough");
  const Decoration Decoration::UNDERLINED = Decoration("underline");
  const Decoration Decoration::ITALIC = Decoration("italic");
}

size_t std::hash<mctext::Colour>::operator()(const mctext::Colour &colour) const {
  return absl::Hash<mctext::Colour>{}(colour);
}

size_t std::hash<mctext::Decoration>::operator()(const mctext::Decoration &decoration) const {
  return absl::Hash<mctext::Decoration>{}(decoration);
}

#include <plain_text_serialiser.hpp>
#include <text_builder.hpp>

namespace mctext {
  static void append_plain_text(std::string& out, const Text& text) {
    auto literal = text.literal();
    if (literal == nullptr) {
      return;
    }
    out += literal->content;
    for (const auto& child : text.children()) {
      append_plain_text(out, child);
    }
  }

  std::string PlainTextSerialiser::serialise(const Text& text) const {
    std::string result;
    append_plain_text(result, text);
    return result;
  }

  Text PlainTextSerialiser::deserialise(std::string_view text) const {
    return LiteralBuilder(std::string(text)).build();
  }
}

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <text.hpp>
#include <text_serialiser.hpp>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <boost/json.hpp>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
/*
 * Converts text trees to and from the chat JSON wire format.
 *
 *   {"text":"Hello ","color":"red","extra":[{"keybind":"key.jump"}]}
 *
 * Decorations are written as booleans unless decorations_as_strings is set,
 * both forms are accepted when reading. Style identifiers are resolved
 * against the registries in registry.hpp.
 */
class JsonSerialiser : public TextSerialiser {
public:
  struct Options {
    bool decorations_as_strings = false;
    /* Maximum JSON nesting, each level of "extra" or "with" costs two. */
    std::size_t max_depth = 4096;
    bool pretty = false;
  };

  JsonSerialiser();
  explicit JsonSerialiser(Options options);

  std::string serialise(const Text &text) const override;
  /* Throws TextParseError. */
  Text deserialise(std::string_view text) const override;

  boost::json::value to_json(const Text &text) const;
  /* Throws TextParseError. */
  Text from_json(const boost::json::value &value) const;

  const Options &options() const;

private:
  Options _options;
};

/* Indented rendering of any JSON value, ending in a newline. */
std::string pretty_print(const boost::json::value &value);
} // namespace mctext

#pragma once

#include <string>
#include <string_view>
#include <text.hpp>
#include <text_serialiser.hpp>

namespace mctext {
/*
 * Flattens literal content in pre-order. Translatable and keybind nodes are
 * resolved by the client, so they and their children contribute nothing.
 */
class PlainTextSerialiser : public TextSerialiser {
public:
  std::string serialise(const Text &text) const override;
  /* Wraps the whole string in one literal node. */
  Text deserialise(std::string_view text) const override;
};
} // namespace mctext

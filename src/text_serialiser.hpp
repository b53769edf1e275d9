#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <text.hpp>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <boost/system/error_code.hpp>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
class TextParseError : public std::runtime_error {
public:
  enum class Kind { Syntax, TooDeep, Malformed, UnknownIdentifier };

  TextParseError(Kind kind, const std::string &message,
                 boost::system::error_code cause = {});

  Kind kind() const;
  /* Error reported by the JSON parser, empty for errors in the text tree. */
  const boost::system::error_code &cause() const;

private:
  Kind _kind;
  boost::system::error_code _cause;
};

std::string_view to_string(TextParseError::Kind kind);

class TextSerialiser {
public:
  virtual ~TextSerialiser();
  virtual std::string serialise(const Text &text) const = 0;
  virtual Text deserialise(std::string_view text) const = 0;
};
} // namespace mctext

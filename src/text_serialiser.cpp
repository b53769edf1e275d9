#include <text_serialiser.hpp>

namespace mctext {
  TextParseError::TextParseError(Kind kind, const std::string& message, boost::system::error_code cause)
    : std::runtime_error(message)
    , _kind(kind)
    , _cause(cause) {}

  TextParseError::Kind TextParseError::kind() const {
    return _kind;
  }

  const boost::system::error_code& TextParseError::cause() const {
    return _cause;
  }

  std::string_view to_string(TextParseError::Kind kind) {
    switch (kind) {
    case TextParseError::Kind::Syntax:
      return "syntax";
    case TextParseError::Kind::TooDeep:
      return "too deep";
    case TextParseError::Kind::Malformed:
      return "malformed";
    case TextParseError::Kind::UnknownIdentifier:
      return "unknown identifier";
    }
    return "unknown";
  }

  TextSerialiser::~TextSerialiser() {}
}

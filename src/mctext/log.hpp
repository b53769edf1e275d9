#pragma once

#include <filesystem>
#include <optional>
#include <string>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <boost/log/trivial.hpp>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
  /* Console sink on stderr plus an optional file sink, both filtered at level. */
  void setup_logging(boost::log::trivial::severity_level level,
                     const std::optional<std::filesystem::path>& file = std::nullopt);

  /* Parses trace, debug, info, warning, error or fatal. */
  std::optional<boost::log::trivial::severity_level> parse_severity(const std::string& name);
}

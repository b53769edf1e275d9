#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace mctext {

  std::string read_file(const std::filesystem::path& path);
  std::string read_stream(std::istream& stream);
  bool can_write_file(const std::filesystem::path& path);
}

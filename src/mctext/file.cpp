#include <mctext/file.hpp>
#include <util.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace mctext {

  std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
      MCTEXT_THROW(std::runtime_error(absl::StrFormat("Failed to open %s", path.string())));
    }
    return read_stream(stream);
  }

  std::string read_stream(std::istream& stream) {
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
  }

  bool can_write_file(const std::filesystem::path& path) {
    std::ofstream stream(path.string(), std::ios::app);
    stream.close();
    return std::filesystem::exists(path);
  }
}

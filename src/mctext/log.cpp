#include <mctext/log.hpp>
#include <mctext/file.hpp>
#include <iomanip>
#include <iostream>
#include <string_view>

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wnested-anon-types"
  #pragma clang diagnostic ignored "-Wgnu-anonymous-struct"
  #pragma clang diagnostic ignored "-Wlanguage-extension-token"
    #include <boost/log/utility/setup/console.hpp>
  #pragma clang diagnostic pop
#else
  #include <boost/log/utility/setup/console.hpp>
#endif

#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wmicrosoft-cpp-macro"
    #include <boost/log/expressions.hpp>
  #pragma clang diagnostic pop
#else
  #include <boost/log/expressions.hpp>
#endif

#include <boost/log/support/date_time.hpp>

namespace mctext {
  void setup_logging(boost::log::trivial::severity_level level, const std::optional<std::filesystem::path>& file) {
    auto format = (
      boost::log::expressions::stream <<
      "[" << boost::log::expressions::format_date_time< boost::posix_time::ptime >("TimeStamp", "%Y-%m-%d %H:%M:%S") <<
      "] [" << boost::log::expressions::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") <<
      "] [" << std::left << std::setw(7) << std::setfill(' ') << boost::log::trivial::severity <<
      "] (" << boost::log::expressions::attr<std::string_view>("File") <<
      ":" << boost::log::expressions::attr<int>("Line") <<
      ":" << boost::log::expressions::attr<std::string>("Function") <<
      ") " << boost::log::expressions::smessage
      );

    boost::log::core::get()->remove_all_sinks();
    boost::log::add_console_log(std::clog,
      boost::log::keywords::format = format);

    if (file) {
      if (can_write_file(*file)) {
        boost::log::add_file_log(
          boost::log::keywords::file_name = file->string(),
          boost::log::keywords::open_mode = std::ios::app,
          boost::log::keywords::auto_flush = true,
          boost::log::keywords::format = format);
      } else {
        std::cerr << "Failed to create log file: " << *file << std::endl;
      }
    }

    boost::log::core::get()->set_filter
    (
      boost::log::trivial::severity >= level
    );
    boost::log::add_common_attributes();
  }

  std::optional<boost::log::trivial::severity_level> parse_severity(const std::string& name) {
    boost::log::trivial::severity_level level;
    if (!boost::log::trivial::from_string(name.data(), name.size(), level)) {
      return std::nullopt;
    }
    return level;
  }
}

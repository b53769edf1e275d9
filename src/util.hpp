#pragma once
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Weverything"
#endif

#include <absl/strings/str_format.h>
#include <boost/stacktrace.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators.hpp>

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

#define MCTEXT_LOG(LEVEL) BOOST_LOG_TRIVIAL(LEVEL) \
  << boost::log::add_value("Line", __LINE__) \
  << boost::log::add_value("File", mctext::filename(__FILE__)) \
  << boost::log::add_value("Function", __FUNCTION__)

#define MCTEXT_ASSERT(condition, ...) do { if(!(condition)) {MCTEXT_LOG(fatal) << absl::StrFormat("" __VA_ARGS__) << "\n" << boost::stacktrace::stacktrace(2, std::numeric_limits<size_t>::max()); std::abort(); } } while(0)

#define MCTEXT_THROW(exc) throw boost::enable_error_info(exc) << mctext::traced(boost::stacktrace::stacktrace(2, std::numeric_limits<size_t>::max()));

namespace mctext {
  typedef boost::error_info<struct tag_stacktrace, boost::stacktrace::stacktrace> traced;
  consteval std::string_view filename(const std::string_view& path) {
    auto filename_start = path.find_last_of("/\\");
    return filename_start == std::string::npos ? path : path.substr(filename_start + 1);
  }
}

#include <mctext.hpp>
#include <json_serialiser.hpp>
#include <plain_text_serialiser.hpp>
#include <mctext/file.hpp>
#include <mctext/log.hpp>
#include <mctext_config.h>
#include <util.hpp>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

namespace mctext {
  namespace {
    using Command = std::function<std::string(const Text&, const JsonSerialiser&)>;

    int run(int argc, char** argv, const std::string& description, Command command) {
      boost::program_options::options_description desc(description + ", version " MCTEXT_VERSION);
      desc.add_options()
        ("help,h", "produce help message")
        ("input,i", boost::program_options::value<std::string>(), "Input file, stdin when omitted")
        ("output,o", boost::program_options::value<std::string>(), "Output file, stdout when omitted")
        ("strings", "Write decorations as \"true\"/\"false\" strings")
        ("pretty", "Indent the JSON output")
        ("max-depth", boost::program_options::value<size_t>()->default_value(JsonSerialiser::Options().max_depth), "Maximum JSON nesting depth")
        ("log-level", boost::program_options::value<std::string>()->default_value("warning"), "trace, debug, info, warning, error or fatal")
        ("log-file", boost::program_options::value<std::string>(), "Also write the log to this file");

      boost::program_options::positional_options_description p;
      p.add("input", 1);

      boost::program_options::variables_map vm;
      try {
        boost::program_options::store(boost::program_options::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
        boost::program_options::notify(vm);
      } catch (boost::program_options::error& e) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
      }

      if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
      }

      auto level = parse_severity(vm["log-level"].as<std::string>());
      if (!level) {
        std::cerr << "Unknown log level: " << vm["log-level"].as<std::string>() << std::endl;
        return 1;
      }
      std::optional<std::filesystem::path> log_file;
      if (vm.count("log-file")) {
        log_file = vm["log-file"].as<std::string>();
      }
      setup_logging(*level, log_file);

      JsonSerialiser::Options options;
      options.decorations_as_strings = vm.count("strings") > 0;
      options.pretty = vm.count("pretty") > 0;
      options.max_depth = vm["max-depth"].as<size_t>();
      JsonSerialiser serialiser(options);

      std::string input;
      try {
        if (vm.count("input")) {
          auto path = vm["input"].as<std::string>();
          MCTEXT_LOG(debug) << "Reading " << path;
          input = read_file(path);
        } else {
          input = read_stream(std::cin);
        }
      } catch (std::runtime_error& e) {
        MCTEXT_LOG(error) << e.what();
        return 1;
      }

      std::string output;
      try {
        auto text = serialiser.deserialise(input);
        output = command(text, serialiser);
      } catch (TextParseError& e) {
        const boost::stacktrace::stacktrace* st = boost::get_error_info<mctext::traced>(e);
        MCTEXT_LOG(error) << "Invalid text (" << to_string(e.kind()) << "): " << e.what();
        if (st) {
          MCTEXT_LOG(debug) << *st;
        }
        return 1;
      }

      if (vm.count("output")) {
        auto path = vm["output"].as<std::string>();
        std::ofstream stream(path);
        if (!stream) {
          MCTEXT_LOG(error) << "Failed to open " << path;
          return 1;
        }
        stream << output;
        stream.flush();
        if (!stream) {
          MCTEXT_LOG(error) << "Failed to write " << path;
          return 1;
        }
      } else {
        std::cout << output;
      }
      return 0;
    }
  }

  int format_main(int argc, char** argv) {
    return run(argc, argv, "Rewrite chat JSON in canonical form", [](const Text& text, const JsonSerialiser& serialiser) {
      auto result = serialiser.serialise(text);
      if (!serialiser.options().pretty) {
        result += "\n";
      }
      return result;
    });
  }

  int plain_main(int argc, char** argv) {
    return run(argc, argv, "Print the literal content of chat JSON", [](const Text& text, const JsonSerialiser&) {
      return PlainTextSerialiser().serialise(text) + "\n";
    });
  }

  int check_main(int argc, char** argv) {
    return run(argc, argv, "Validate chat JSON", [](const Text& text, const JsonSerialiser&) {
      MCTEXT_LOG(info) << "Valid: " << text;
      return std::string();
    });
  }
}

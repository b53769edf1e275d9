#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif
#include <gtest/gtest.h>
#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>
#include <mctext.hpp>
#include <mctext/file.hpp>
#include <mctext/log.hpp>

using namespace mctext;

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wglobal-constructors"
#endif

namespace {
  class CommandTest : public ::testing::Test {
  protected:
    std::filesystem::path input;
    std::filesystem::path output;

    void SetUp() override {
      auto name = std::string(::testing::UnitTest::GetInstance()->current_test_info()->name());
      input = std::filesystem::temp_directory_path() / ("mctext_" + name + "_in.json");
      output = std::filesystem::temp_directory_path() / ("mctext_" + name + "_out.json");
      std::filesystem::remove(output);
    }

    void TearDown() override {
      std::filesystem::remove(input);
      std::filesystem::remove(output);
      setup_logging(boost::log::trivial::warning);
    }

    void write_input(const std::string& json) {
      std::ofstream stream(input, std::ios::binary);
      stream << json;
    }

    int run(std::function<int(int, char**)> command, std::vector<std::string> args) {
      args.insert(args.begin(), "mctext");
      std::vector<char*> argv;
      for (auto& arg : args) {
        argv.push_back(arg.data());
      }
      return command(int(argv.size()), argv.data());
    }
  };
}

TEST(LogTest, ParseSeverity) {
  ASSERT_EQ(parse_severity("debug"), std::optional<boost::log::trivial::severity_level>(boost::log::trivial::debug));
  ASSERT_EQ(parse_severity("fatal"), std::optional<boost::log::trivial::severity_level>(boost::log::trivial::fatal));
  ASSERT_FALSE(parse_severity("bogus").has_value());
  ASSERT_FALSE(parse_severity("").has_value());
}

TEST_F(CommandTest, FormatWritesCanonicalJson) {
  write_input("{ \"color\" : \"red\", \"text\" : \"Hello\", \"bold\" : \"TRUE\", \"unknown\" : 1 }");
  ASSERT_EQ(run(format_main, {input.string(), "-o", output.string()}), 0);
  ASSERT_EQ(read_file(output), "{\"text\":\"Hello\",\"bold\":true,\"color\":\"red\"}\n");
}

TEST_F(CommandTest, FormatStrings) {
  write_input("{\"text\":\"x\",\"bold\":true,\"italic\":false}");
  ASSERT_EQ(run(format_main, {"--strings", "-i", input.string(), "-o", output.string()}), 0);
  ASSERT_EQ(read_file(output), "{\"text\":\"x\",\"bold\":\"true\",\"italic\":\"false\"}\n");
}

TEST_F(CommandTest, FormatPretty) {
  write_input("{\"text\":\"x\",\"extra\":[{\"keybind\":\"key.jump\"}]}");
  ASSERT_EQ(run(format_main, {"--pretty", input.string(), "-o", output.string()}), 0);
  ASSERT_EQ(read_file(output),
            "{\n"
            "  \"text\": \"x\",\n"
            "  \"extra\": [\n"
            "    {\n"
            "      \"keybind\": \"key.jump\"\n"
            "    }\n"
            "  ]\n"
            "}\n");
}

TEST_F(CommandTest, PlainFlattensLiterals) {
  write_input("{\"text\":\"a\",\"extra\":[{\"text\":\"b\"},{\"translate\":\"c\"}]}");
  ASSERT_EQ(run(plain_main, {input.string(), "-o", output.string()}), 0);
  ASSERT_EQ(read_file(output), "ab\n");
}

TEST_F(CommandTest, CheckAcceptsValidText) {
  write_input("{\"translate\":\"chat.type.text\",\"with\":[{\"text\":\"A\"}]}");
  ASSERT_EQ(run(check_main, {input.string(), "-o", output.string()}), 0);
  ASSERT_EQ(read_file(output), "");
}

TEST_F(CommandTest, InvalidTextFails) {
  write_input("{\"color\":\"bogus_colour\",\"text\":\"x\"}");
  ASSERT_EQ(run(check_main, {input.string(), "-o", output.string()}), 1);
  ASSERT_FALSE(std::filesystem::exists(output));

  write_input("{\"text\":");
  ASSERT_EQ(run(format_main, {input.string(), "-o", output.string()}), 1);
  ASSERT_FALSE(std::filesystem::exists(output));
}

TEST_F(CommandTest, MaxDepth) {
  write_input("{\"text\":\"a\",\"extra\":[{\"text\":\"b\",\"extra\":[{\"text\":\"c\"}]}]}");
  ASSERT_EQ(run(check_main, {"--max-depth", "4", input.string()}), 1);
  ASSERT_EQ(run(check_main, {"--max-depth", "5", input.string()}), 0);
}

TEST_F(CommandTest, BadArguments) {
  write_input("{\"text\":\"a\"}");
  ASSERT_EQ(run(check_main, {"--log-level", "bogus", input.string()}), 1);
  ASSERT_EQ(run(check_main, {"--no-such-option", input.string()}), 1);
  ASSERT_EQ(run(check_main, {(std::filesystem::temp_directory_path() / "mctext_missing_dir" / "in.json").string()}), 1);
  ASSERT_EQ(run(check_main, {"--help"}), 0);
}

TEST_F(CommandTest, FailedWriteFails) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full not available";
  }
  write_input("{\"text\":\"a\"}");
  ASSERT_EQ(run(format_main, {input.string(), "-o", "/dev/full"}), 1);
}

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include <functional>
#include <iostream>
#include <map>
#include <mctext.hpp>
#include <mctext_config.h>
#include <string>
#include <vector>

const auto HELP = "mctext chat text tool, version " MCTEXT_VERSION "\n"
                  "  format           Rewrite chat JSON in canonical form\n"
                  "  plain            Print the literal content of chat JSON\n"
                  "  check            Validate chat JSON\n";

int main(int argc, char *argv[]) {
  std::map<std::string, std::function<int(int, char **)>> COMMANDS = {
      {"format", mctext::format_main},
      {"plain", mctext::plain_main},
      {"check", mctext::check_main}};

  auto command = argc < 2 ? COMMANDS.end() : COMMANDS.find(argv[1]);
  if (command == COMMANDS.end()) {
    std::cout << HELP;
    return 1;
  }

  auto arguments = std::vector<char *>(argv, argv + argc);
  arguments.erase(arguments.begin() + 1);

  return command->second(int(arguments.size()), arguments.data());
}

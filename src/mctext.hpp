#pragma once

namespace mctext {
  int format_main(int argc, char** argv);
  int plain_main(int argc, char** argv);
  int check_main(int argc, char** argv);
}

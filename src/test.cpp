#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif
#include <gtest/gtest.h>
#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include <mctext/log.hpp>

int main(int argc, char** argv) {
  mctext::setup_logging(boost::log::trivial::warning);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

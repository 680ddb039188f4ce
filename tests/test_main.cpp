#include "domainflow/util/log.hpp"

#include <csignal>
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);

  const char *level = std::getenv("DOMAINFLOW_TEST_LOG_LEVEL");
  domainflow::log::set_level(level != nullptr ? level : "error");

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

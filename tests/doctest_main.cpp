#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <nomat/core/logger.hpp>

int main(int argc, char **argv) {
  nomat::core::Logger::init();

  doctest::Context context;
  context.applyCommandLine(argc, argv);

  int res = context.run();

  nomat::core::Logger::shutdown();

  if (context.shouldExit())
    return res;

  return res;
}

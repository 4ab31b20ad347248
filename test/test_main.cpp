#include "test_framework.hpp"

#include <cstring>

#include "tpn/log.hpp"

// Usage: tpn_tests [name-substring]
int main(int argc, char** argv) {
  const char* filter = argc > 1 ? argv[1] : nullptr;

  // Sessions log closures at warn; keep test output readable
  tpn::LogLevel level = tpn::LogLevel::Off;
  if (const char* env = std::getenv("TPN_LOG_LEVEL")) {
    tpn::ParseLogLevel(env, &level);
  }
  tpn::Logger::Instance().SetLevel(level);

  int passed = 0;
  int failed = 0;

  for (const auto& test : GetTests()) {
    if (filter && test.name.find(filter) == std::string::npos) {
      continue;
    }
    printf("Running %s... ", test.name.c_str());
    fflush(stdout);
    try {
      test.fn();
      printf("PASS\n");
      passed++;
    } catch (const std::exception& e) {
      printf("FAIL: %s\n", e.what());
      failed++;
    }
  }

  printf("\n%d passed, %d failed\n", passed, failed);
  return failed > 0 ? 1 : 0;
}

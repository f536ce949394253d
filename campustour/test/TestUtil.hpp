#pragma once

#include <cmath>
#include <iostream>
#include <string>

namespace TestUtil {

inline int &failures() {
  static int count = 0;
  return count;
}

inline void check(bool ok, const std::string &what) {
  std::cout << (ok ? "  ✓ " : "  ✗ ") << what << std::endl;
  if (!ok) {
    ++failures();
  }
}

inline void section(const std::string &name) {
  std::cout << "\n=== " << name << " ===" << std::endl;
}

inline bool near(float a, float b, float eps = 0.01f) { return std::fabs(a - b) <= eps; }

inline int summary(const std::string &suite) {
  std::cout << "\n=== Summary ===" << std::endl;
  if (failures() == 0) {
    std::cout << "✓ " << suite << ": all checks passed" << std::endl;
    return 0;
  }
  std::cout << "✗ " << suite << ": " << failures() << " check(s) failed" << std::endl;
  return 1;
}

} // namespace TestUtil

#define CHECK(cond) TestUtil::check((cond), #cond)
#define CHECK_NEAR(a, b) TestUtil::check(TestUtil::near((a), (b)), #a " ~ " #b)

/**
 * @file version.h
 * @brief Version information
 */

#pragma once

#include <string>

namespace mybinlog {

struct Version {
  static constexpr int kMajor = 1;
  static constexpr int kMinor = 0;
  static constexpr int kPatch = 0;

  static std::string String() {
    return std::to_string(kMajor) + "." + std::to_string(kMinor) + "." + std::to_string(kPatch);
  }

  static std::string FullString() { return "mybinlog-dump " + String(); }
};

}  // namespace mybinlog

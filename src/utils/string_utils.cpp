/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 */

#include "utils/string_utils.h"

#include <iomanip>
#include <sstream>

namespace mybinlog::utils {

std::string HexString(const std::vector<uint8_t>& bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

}  // namespace mybinlog::utils

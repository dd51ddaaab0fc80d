/**
 * @file string_utils.h
 * @brief String helpers shared by the decoder and the dump output
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mybinlog::utils {

/**
 * @brief Lowercase hex without separators
 *
 * @param bytes Input bytes
 * @return Two hex digits per byte, empty for no input
 */
std::string HexString(const std::vector<uint8_t>& bytes);

}  // namespace mybinlog::utils

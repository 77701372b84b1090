#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nrelay
{
namespace encoding
{
/**
 * @brief Indicates whether the string is made up of exactly `length` hex digits.
 * @param lowercaseOnly When true, uppercase digits are rejected.
 */
bool isHex(const std::string& value, size_t length, bool lowercaseOnly = false);

/**
 * @brief Encodes bytes as a lowercase hex string.
 */
std::string toHex(const uint8_t* data, size_t length);

std::string toHex(const std::vector<uint8_t>& data);

/**
 * @brief Decodes a hex string of either case.
 * @throws `std::invalid_argument` if the string has an odd length or a non-hex character.
 */
std::vector<uint8_t> fromHex(const std::string& value);

/**
 * @brief Lowercases ASCII letters, leaving any other byte untouched.
 */
std::string toLower(std::string value);
} // namespace encoding
} // namespace nrelay

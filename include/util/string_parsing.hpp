// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values to numeric types with validation
 - Consistent error handling for the CLI and scenario configuration

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParseUint64: Parse unsigned 64-bit value (RNG seeds)
 - SafeParseDouble: Parse finite floating point value with bounds checking
 - SplitList: Split a separator-delimited option value

 All parsers validate the entire input is consumed (no trailing garbage)
 and return std::nullopt on any error instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace isds {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse unsigned 64-bit integer string
 *
 * Rejects signs, whitespace, trailing characters and overflow.
 */
std::optional<uint64_t> SafeParseUint64(const std::string& str);

/**
 * Parse a finite floating point value within [min, max]
 *
 * Examples:
 *   SafeParseDouble("2.5", 0.0, 10.0) -> 2.5
 *   SafeParseDouble("nan", 0.0, 10.0) -> std::nullopt
 *   SafeParseDouble("1e400", 0.0, 1e300) -> std::nullopt (overflow)
 */
std::optional<double> SafeParseDouble(const std::string& str, double min, double max);

/**
 * Split a delimited list, dropping empty entries
 *
 * Example:
 *   SplitList("sim,,consensus", ',') -> {"sim", "consensus"}
 */
std::vector<std::string> SplitList(const std::string& str, char separator = ',');

} // namespace util
} // namespace isds

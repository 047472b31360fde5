// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace isds {
namespace util {

static bool HasLeadingGarbage(const std::string& str) {
  return str.empty() || std::isspace(static_cast<unsigned char>(str[0]));
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (HasLeadingGarbage(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::logic_error&) {
    // std::invalid_argument or std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUint64(const std::string& str) {
  // stoull silently accepts a leading minus sign
  if (HasLeadingGarbage(str) || str[0] == '-' || str[0] == '+') {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<double> SafeParseDouble(const std::string& str, double min, double max) {
  if (HasLeadingGarbage(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    double value = std::stod(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    if (!std::isfinite(value) || value < min || value > max) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitList(const std::string& str, char separator) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(separator, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      parts.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return parts;
}

} // namespace util
} // namespace isds

// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "util/uint.hpp"
#include <cstdio>

namespace isds {

const uint256 uint256::ZERO{};
const uint256 uint256::ONE{1};

static int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool uint256::IsNull() const {
  for (uint64_t word : words_) {
    if (word != 0) {
      return false;
    }
  }
  return true;
}

std::string uint256::GetHex() const {
  std::string out;
  out.reserve(WORDS * 16);
  char buf[17];
  for (size_t i = WORDS; i-- > 0;) {
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(words_[i]));
    out += buf;
  }
  return out;
}

void uint256::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    digits++;
  }

  // Last digit is the least significant nibble
  size_t nibble = 0;
  for (size_t i = digits; i-- > 0 && nibble < WORDS * 16; ++nibble) {
    const uint64_t value = static_cast<uint64_t>(HexDigit(str[i]));
    words_[nibble / 16] |= value << (4 * (nibble % 16));
  }
}

int uint256::Compare(const uint256 &other) const {
  for (size_t i = WORDS; i-- > 0;) {
    if (words_[i] != other.words_[i]) {
      return words_[i] < other.words_[i] ? -1 : 1;
    }
  }
  return 0;
}

} // namespace isds

// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace isds {

/**
 * uint256 - opaque 256-bit identifier
 *
 * Stored as four 64-bit words, word 0 least significant. Hex form prints the
 * most significant word first. No arithmetic.
 */
class uint256 {
public:
  static constexpr size_t WORDS = 4;

  constexpr uint256() : words_{} {}
  constexpr explicit uint256(uint64_t low) : words_{low, 0, 0, 0} {}

  static const uint256 ZERO;
  static const uint256 ONE;

  bool IsNull() const;
  void SetNull() { words_.fill(0); }

  uint64_t GetUint64(size_t pos) const { return words_[pos]; }
  void SetUint64(size_t pos, uint64_t value) { words_[pos] = value; }

  // 64 lowercase hex digits
  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }

  // Reads the leading run of hex digits, optional "0x" prefix; short input
  // fills the low words
  void SetHex(std::string_view str);

  // Orders by most significant word first
  int Compare(const uint256 &other) const;

  friend bool operator==(const uint256 &a, const uint256 &b) {
    return a.words_ == b.words_;
  }
  friend bool operator!=(const uint256 &a, const uint256 &b) { return !(a == b); }
  friend bool operator<(const uint256 &a, const uint256 &b) { return a.Compare(b) < 0; }

private:
  std::array<uint64_t, WORDS> words_;
};

inline uint256 uint256S(std::string_view str) {
  uint256 value;
  value.SetHex(str);
  return value;
}

} // namespace isds

#include "command_order.hpp"

#include <cctype>

namespace digiplayer::command {

namespace {

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

int CompareCommandIds(std::string_view lhs, std::string_view rhs) {
  std::size_t i = 0;
  std::size_t j = 0;

  while (i < lhs.size() && j < rhs.size()) {
    if (IsDigit(lhs[i]) && IsDigit(rhs[j])) {
      // skip leading zeros, then the longer run is the larger number
      while (i < lhs.size() && lhs[i] == '0') ++i;
      while (j < rhs.size() && rhs[j] == '0') ++j;

      std::size_t li = i;
      std::size_t rj = j;
      while (li < lhs.size() && IsDigit(lhs[li])) ++li;
      while (rj < rhs.size() && IsDigit(rhs[rj])) ++rj;

      const std::size_t lhs_len = li - i;
      const std::size_t rhs_len = rj - j;
      if (lhs_len != rhs_len) {
        return lhs_len < rhs_len ? -1 : 1;
      }
      if (const int cmp = lhs.substr(i, lhs_len).compare(rhs.substr(j, rhs_len)); cmp != 0) {
        return cmp < 0 ? -1 : 1;
      }
      i = li;
      j = rj;
      continue;
    }

    if (lhs[i] != rhs[j]) {
      return static_cast<unsigned char>(lhs[i]) < static_cast<unsigned char>(rhs[j]) ? -1 : 1;
    }
    ++i;
    ++j;
  }

  if (i == lhs.size() && j == rhs.size()) {
    return 0;
  }
  return i == lhs.size() ? -1 : 1;
}

bool IsNewer(std::string_view candidate, std::string_view watermark) {
  if (candidate.empty()) {
    return false;
  }
  if (watermark.empty()) {
    return true;
  }
  return CompareCommandIds(candidate, watermark) > 0;
}

} // namespace digiplayer::command

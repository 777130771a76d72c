#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utils/util.hpp>

static inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' ||
         c == '\f';
}

// 非 ASCII 字节在 char 下为负数, 先转 unsigned char
static inline bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void handle_error(const std::string &message, int exit_code) {
  std::cerr << "[ERROR]: " << message << std::endl;
  std::exit(exit_code);
}

bool try_stoull(std::string_view str, uint64_t &value) {
  if (str.empty())
    return false;
  value = 0;
  for (char c : str) {
    if (c < '0' || c > '9')
      return false;
    uint64_t digit = c - '0';
    if (value > (UINT64_MAX - digit) / 10)
      return false; // 溢出检查
    value = value * 10 + digit;
  }
  return true;
}

bool try_stoul(std::string_view str, uint32_t &value) {
  uint64_t wide;
  if (!try_stoull(str, wide) || wide > UINT32_MAX)
    return false;
  value = static_cast<uint32_t>(wide);
  return true;
}

void split_whitespace(std::string_view str, VecSV &out) {
  out.clear();
  size_t i = 0, n = str.size();
  while (i < n) {
    while (i < n && is_space(str[i]))
      ++i;
    if (i == n)
      break;
    size_t start = i;
    while (i < n && !is_space(str[i]))
      ++i;
    out.emplace_back(str.substr(start, i - start));
  }
}

bool natural_less(const std::string &lhs, const std::string &rhs) {
  size_t i = 0, j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (is_digit(lhs[i]) && is_digit(rhs[j])) {
      size_t si = i, sj = j;
      while (si < lhs.size() && lhs[si] == '0')
        ++si;
      while (sj < rhs.size() && rhs[sj] == '0')
        ++sj;
      size_t ei = si, ej = sj;
      while (ei < lhs.size() && is_digit(lhs[ei]))
        ++ei;
      while (ej < rhs.size() && is_digit(rhs[ej]))
        ++ej;
      // 先比有效位数, 再逐位比较
      if (ei - si != ej - sj)
        return ei - si < ej - sj;
      int cmp = lhs.compare(si, ei - si, rhs, sj, ej - sj);
      if (cmp != 0)
        return cmp < 0;
      // 数值相同时前导 0 少的在前
      if (ei - i != ej - j)
        return ei - i < ej - j;
      i = ei;
      j = ej;
    } else {
      if (lhs[i] != rhs[j])
        return static_cast<unsigned char>(lhs[i]) <
               static_cast<unsigned char>(rhs[j]);
      ++i;
      ++j;
    }
  }
  return lhs.size() - i < rhs.size() - j;
}

#pragma once

#include <compare>
#include <cstddef>
#include <string_view>

namespace taskweave {

namespace detail {

[[nodiscard]] constexpr auto is_digit(char c) noexcept -> bool {
  return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr auto digit_run(std::string_view s, std::size_t pos)
    -> std::size_t {
  auto end = pos;
  while (end < s.size() && is_digit(s[end])) ++end;
  return end;
}

}  // namespace detail

// Orders strings so that embedded numbers compare by value: "2" < "10",
// "task9" < "task10". Runs of digits are compared numerically (ignoring
// leading zeros), everything else byte-wise.
[[nodiscard]] constexpr auto natural_compare(std::string_view a,
                                             std::string_view b) noexcept
    -> std::strong_ordering {
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < a.size() && j < b.size()) {
    if (detail::is_digit(a[i]) && detail::is_digit(b[j])) {
      auto a_end = detail::digit_run(a, i);
      auto b_end = detail::digit_run(b, j);
      auto a_num = a.substr(i, a_end - i);
      auto b_num = b.substr(j, b_end - j);
      while (a_num.size() > 1 && a_num.front() == '0') a_num.remove_prefix(1);
      while (b_num.size() > 1 && b_num.front() == '0') b_num.remove_prefix(1);
      if (a_num.size() != b_num.size()) {
        return a_num.size() <=> b_num.size();
      }
      if (auto cmp = a_num.compare(b_num); cmp != 0) {
        return cmp <=> 0;
      }
      i = a_end;
      j = b_end;
      continue;
    }
    if (a[i] != b[j]) {
      return static_cast<unsigned char>(a[i]) <=> static_cast<unsigned char>(b[j]);
    }
    ++i;
    ++j;
  }
  return (a.size() - i) <=> (b.size() - j);
}

}  // namespace taskweave

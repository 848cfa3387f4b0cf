#pragma once

#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

namespace vencode {

// Exception with an inline, fixed capacity message buffer: constructing and copying it never allocates.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 159;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_info, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args &&...args) {
    const auto res = std::format_to_n(_info, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (static_cast<std::size_t>(res.size) > kMsgMaxLen) {
      std::memcpy(_info + kMsgMaxLen - 3, "...", 3);
      _info[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char *what() const noexcept override { return _info; }

 private:
  char _info[kMsgMaxLen + 1];
};

}  // namespace vencode

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string> split_and_trim(const std::string &text,
                                        char delimiter);
uint64_t get_current_time_ms();
std::string url_decode(std::string_view encoded_string);
std::string to_lower_copy(std::string_view s);

// "2025-06-19T04:12:33.120Z" style timestamps. Offsets other than Z are
// honoured ("+05:30"). Returns nullopt on anything it cannot read.
std::optional<uint64_t> parse_iso8601_to_ms(std::string_view text);
std::string format_ms_as_iso8601(uint64_t epoch_ms);

bool create_directory_for_file(const std::string &file_path);

// Writes to "<path>.tmp" then renames over `path`, so readers observe either
// the old or the new content.
bool write_file_atomically(const std::string &path, const std::string &content);
std::optional<std::string> read_file(const std::string &path);

uint64_t fnv1a_64(std::string_view data,
                  uint64_t seed = 0xcbf29ce484222325ULL);
std::string to_hex(uint64_t value);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP

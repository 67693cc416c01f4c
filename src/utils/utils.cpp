#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::string url_decode(std::string_view encoded_string) {
  auto hex_value = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  std::string decoded;
  decoded.reserve(encoded_string.size());
  for (size_t i = 0; i < encoded_string.length(); i++) {
    if (encoded_string[i] == '%' && i + 2 < encoded_string.length()) {
      int hi = hex_value(encoded_string[i + 1]);
      int lo = hex_value(encoded_string[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
      } else {
        decoded.push_back('%');
      }
    } else if (encoded_string[i] == '+')
      decoded.push_back(' ');
    else
      decoded.push_back(encoded_string[i]);
  }
  return decoded;
}

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string> split_and_trim(const std::string &text,
                                        char delimiter) {
  std::vector<std::string> tokens;
  for (auto &token : split_string(text, delimiter)) {
    trim_inplace(token);
    if (!token.empty())
      tokens.push_back(std::move(token));
  }
  return tokens;
}

std::string to_lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::optional<uint64_t> parse_iso8601_to_ms(std::string_view text) {
  // Minimum: YYYY-MM-DDTHH:MM:SS
  if (text.size() < 19)
    return std::nullopt;

  auto read_int = [&](size_t pos, size_t len) -> std::optional<int> {
    return string_to_number<int>(text.substr(pos, len));
  };

  auto year = read_int(0, 4);
  auto month = read_int(5, 2);
  auto day = read_int(8, 2);
  auto hour = read_int(11, 2);
  auto minute = read_int(14, 2);
  auto second = read_int(17, 2);
  if (!year || !month || !day || !hour || !minute || !second)
    return std::nullopt;
  if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
      text[13] != ':' || text[16] != ':')
    return std::nullopt;
  if (*month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 ||
      *minute > 59 || *second > 60)
    return std::nullopt;

  size_t pos = 19;
  uint64_t millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3)
        millis = millis * 10 + static_cast<uint64_t>(text[pos] - '0');
      ++digits;
      ++pos;
    }
    for (; digits < 3; ++digits)
      millis *= 10;
  }

  int64_t offset_seconds = 0;
  if (pos < text.size()) {
    char sign = text[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if ((sign == '+' || sign == '-') && pos + 6 <= text.size() &&
               text[pos + 3] == ':') {
      auto off_h = read_int(pos + 1, 2);
      auto off_m = read_int(pos + 4, 2);
      if (!off_h || !off_m)
        return std::nullopt;
      offset_seconds = (*off_h * 3600 + *off_m * 60) * (sign == '+' ? 1 : -1);
      pos += 6;
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size())
    return std::nullopt;

  std::tm t{};
  t.tm_year = *year - 1900;
  t.tm_mon = *month - 1;
  t.tm_mday = *day;
  t.tm_hour = *hour;
  t.tm_min = *minute;
  t.tm_sec = *second;
  int64_t epoch_seconds = static_cast<int64_t>(timegm(&t)) - offset_seconds;
  if (epoch_seconds < 0)
    return std::nullopt;
  return static_cast<uint64_t>(epoch_seconds) * 1000 + millis;
}

std::string format_ms_as_iso8601(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);
  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (epoch_ms % 1000) << 'Z';
  return oss.str();
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

bool write_file_atomically(const std::string &path,
                           const std::string &content) {
  if (!create_directory_for_file(path))
    return false;

  const std::string temp_path = path + ".tmp";
  int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    return false;

  const char *data = content.data();
  size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      ::close(fd);
      ::unlink(temp_path.c_str());
      return false;
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  // The data must be on disk before the rename makes it visible.
  if (::fsync(fd) != 0) {
    ::close(fd);
    ::unlink(temp_path.c_str());
    return false;
  }
  if (::close(fd) != 0) {
    ::unlink(temp_path.c_str());
    return false;
  }

  if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
    ::unlink(temp_path.c_str());
    return false;
  }

  // Persist the directory entry too.
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty())
    parent = ".";
  int dir_fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0)
    return false;
  const bool synced = ::fsync(dir_fd) == 0;
  ::close(dir_fd);
  return synced;
}

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

uint64_t fnv1a_64(std::string_view data, uint64_t seed) {
  uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

std::string to_hex(uint64_t value) {
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << value;
  return oss.str();
}

} // namespace Utils

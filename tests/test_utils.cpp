#include "utils/aho_corasick.hpp"
#include "utils/retry_policy.hpp"
#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <filesystem>

// --- Tests for parse_iso8601_to_ms ---
TEST(UtilsTest, ParseIso8601ToMs) {
  auto t1 = Utils::parse_iso8601_to_ms("2025-06-19T04:00:00Z");
  ASSERT_TRUE(t1.has_value());
  EXPECT_EQ(*t1, 1750305600000ULL);

  auto t2 = Utils::parse_iso8601_to_ms("2025-06-19T04:00:00.5Z");
  ASSERT_TRUE(t2.has_value());
  EXPECT_EQ(*t2, 1750305600500ULL);

  // 09:30 +05:30 is 04:00 UTC
  auto t3 = Utils::parse_iso8601_to_ms("2025-06-19T09:30:00+05:30");
  ASSERT_TRUE(t3.has_value());
  EXPECT_EQ(*t3, 1750305600000ULL);

  // Invalid formats
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("not a time").has_value());
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("2025-13-19T04:00:00Z").has_value());
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("").has_value());
}

TEST(UtilsTest, FormatMsAsIso8601) {
  EXPECT_EQ(Utils::format_ms_as_iso8601(1750305600123ULL),
            "2025-06-19T04:00:00.123Z");
}

// --- Tests for url_decode ---
TEST(UtilsTest, URLDecode) {
  EXPECT_EQ(Utils::url_decode("hello+world"), "hello world");
  EXPECT_EQ(Utils::url_decode("foo%20bar"), "foo bar");
  EXPECT_EQ(Utils::url_decode("%2Fetc%2Fpasswd"), "/etc/passwd");
  EXPECT_EQ(Utils::url_decode("invalid%2g"),
            "invalid%2g"); // Handles invalid hex
  EXPECT_EQ(Utils::url_decode(""), "");
}

TEST(UtilsTest, SplitAndTrim) {
  auto parts = Utils::split_and_trim(" a@x.org , b@x.org,, ", ',');
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "a@x.org");
  EXPECT_EQ(parts[1], "b@x.org");
}

TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_FALSE(Utils::string_to_number<int>("42abc").has_value());
  EXPECT_EQ(Utils::string_to_number<double>("0.75"), 0.75);
}

TEST(UtilsTest, Fnv1aIsStableAndKeyed) {
  EXPECT_EQ(Utils::fnv1a_64(""), 0xcbf29ce484222325ULL);
  EXPECT_EQ(Utils::to_hex(Utils::fnv1a_64("a")), "af63dc4c8601ec8c");
  EXPECT_NE(Utils::fnv1a_64("key1\npayload"), Utils::fnv1a_64("key2\npayload"));
}

TEST(UtilsTest, AtomicWriteReplacesContent) {
  const auto path =
      (std::filesystem::temp_directory_path() / "waf_utils_test" / "state.json")
          .string();
  ASSERT_TRUE(Utils::write_file_atomically(path, "first"));
  ASSERT_TRUE(Utils::write_file_atomically(path, "second"));
  EXPECT_EQ(Utils::read_file(path), "second");
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
  std::filesystem::remove_all(std::filesystem::path(path).parent_path());
  EXPECT_FALSE(Utils::read_file(path).has_value());
}

TEST(UtilsTest, FailedAtomicWriteLeavesPreviousContent) {
  const auto dir = std::filesystem::temp_directory_path() / "waf_utils_failed_write";
  const auto path = (dir / "state.json").string();
  ASSERT_TRUE(Utils::write_file_atomically(path, "first"));

  // A directory squatting on the temp name makes the write fail.
  std::filesystem::create_directories(path + ".tmp");
  EXPECT_FALSE(Utils::write_file_atomically(path, "second"));
  EXPECT_EQ(Utils::read_file(path), "first");
  std::filesystem::remove_all(dir);
}

// --- Tests for AhoCorasick ---
TEST(UtilsTest, AhoCorasickCountsOverlappingMatchesCaseInsensitively) {
  Utils::AhoCorasick matcher({"he", "she", "hers"});
  auto counts = matcher.count_matches("USHERS and she");
  ASSERT_EQ(counts.size(), 3u);
  EXPECT_EQ(counts[0], 2u);
  EXPECT_EQ(counts[1], 2u);
  EXPECT_EQ(counts[2], 1u);
}

// --- Tests for RetryPolicy ---
TEST(UtilsTest, RetryDelaysAreCapped) {
  RetryPolicy policy;
  policy.base_delay = std::chrono::milliseconds(500);
  policy.backoff_multiplier = 2.0;
  policy.max_delay = std::chrono::milliseconds(1500);
  EXPECT_EQ(policy.delay_for(0), std::chrono::milliseconds(500));
  EXPECT_EQ(policy.delay_for(1), std::chrono::milliseconds(1000));
  EXPECT_EQ(policy.delay_for(2), std::chrono::milliseconds(1500));
}

TEST(UtilsTest, RetryOnlyCoversTransientErrors) {
  RetryPolicy policy;
  policy.max_attempts = 3;
  policy.sleeper = [](std::chrono::milliseconds) {};

  int calls = 0;
  EXPECT_THROW(retry_with_backoff(policy, "op", LogComponent::CORE,
                                  [&]() -> int {
                                    ++calls;
                                    throw SchemaMismatchError("fatal");
                                  }),
               SchemaMismatchError);
  EXPECT_EQ(calls, 1);

  calls = 0;
  int value = retry_with_backoff(policy, "op", LogComponent::CORE, [&] {
    if (++calls < 3)
      throw FetchError("flaky");
    return 7;
  });
  EXPECT_EQ(value, 7);
  EXPECT_EQ(calls, 3);
}

#include "minitest.hpp"
#include "probe/ErrorClassifier.hpp"

using rtspmon::model::ErrorKind;
using rtspmon::probe::classify_tool_error;
using rtspmon::probe::is_unsupported_option;
using rtspmon::probe::short_reason;

TEST(classify_connection_refused) {
  auto k = classify_tool_error("[tcp @ 0x55d] Connection to tcp://cam:554 failed: Connection refused\n");
  ASSERT_TRUE(k == ErrorKind::ConnectionRefused);
}

TEST(classify_unreachable_variants) {
  ASSERT_TRUE(classify_tool_error("Failed to resolve hostname cam: Name or service not known") == ErrorKind::Unreachable);
  ASSERT_TRUE(classify_tool_error("Temporary failure in name resolution") == ErrorKind::Unreachable);
  ASSERT_TRUE(classify_tool_error("No route to host") == ErrorKind::Unreachable);
  ASSERT_TRUE(classify_tool_error("Network is unreachable") == ErrorKind::Unreachable);
}

TEST(classify_tool_reported_timeout) {
  ASSERT_TRUE(classify_tool_error("rtsp://x: Connection timed out") == ErrorKind::Timeout);
}

TEST(classify_ignores_words_inside_the_stream_url) {
  ASSERT_FALSE(classify_tool_error("rtsp://cam.local/timeout-lab: Server returned 404 Not Found").has_value());
  ASSERT_FALSE(classify_tool_error("rtsp://timed out/x: Invalid data found when processing input").has_value());
  ASSERT_TRUE(classify_tool_error("rtsp://refused.example/live: Connection refused\n") == ErrorKind::ConnectionRefused);
  // Multi-line output: each line loses its own URL prefix.
  ASSERT_TRUE(classify_tool_error("rtsp://cam/timeout: method DESCRIBE failed\nrtsp://cam/timeout: Operation timed out\n")
              == ErrorKind::Timeout);
}

TEST(classify_bare_timeout_word_is_not_a_timeout) {
  ASSERT_FALSE(classify_tool_error("Unrecognized option 'rw_timeout'.").has_value());
}

TEST(classify_unknown_text) {
  ASSERT_FALSE(classify_tool_error("Invalid data found when processing input").has_value());
  ASSERT_FALSE(classify_tool_error("").has_value());
}

TEST(unsupported_option_detection) {
  ASSERT_TRUE(is_unsupported_option("Unrecognized option 'rw_timeout'.\nError splitting the argument list"));
  ASSERT_TRUE(is_unsupported_option("Option not found"));
  ASSERT_FALSE(is_unsupported_option("Connection refused"));
}

TEST(short_reason_single_line_and_capped) {
  ASSERT_EQ(short_reason("  line one\n\nline   two \n"), std::string("line one line two"));
  ASSERT_EQ(short_reason(""), std::string("unknown"));
  ASSERT_EQ(short_reason("\n \t"), std::string("unknown"));
  std::string big(500, 'x');
  ASSERT_EQ(short_reason(big).size(), 120u);
  ASSERT_EQ(short_reason(big, 10).size(), 10u);
}

#include "text_transform.hpp"
#include <string>
#include <gtest/gtest.h>

using namespace largefile_common;

namespace {

std::vector<char> Bytes(const std::string &text) {
  return std::vector<char>(text.begin(), text.end());
}

}  // namespace

TEST(TextTransformTest, UpperCasesAsciiLetters) {
  std::vector<char> data = Bytes("This is a line, 42 times!\n");
  to_upper_ascii(data);
  EXPECT_EQ(data, Bytes("THIS IS A LINE, 42 TIMES!\n"));
}

TEST(TextTransformTest, LeavesNonAsciiBytesAlone) {
  std::vector<char> data = Bytes("caf\xC3\xA9\n");
  to_upper_ascii(data);
  EXPECT_EQ(data, Bytes("CAF\xC3\xA9\n"));
}

TEST(TextTransformTest, EmptyChunk) {
  std::vector<char> data;
  to_upper_ascii(data);
  EXPECT_TRUE(data.empty());
  EXPECT_EQ(count_line_terminators(data), 0u);
}

TEST(TextTransformTest, CountsLineTerminators) {
  EXPECT_EQ(count_line_terminators(Bytes("a\nb\nc")), 2u);
  EXPECT_EQ(count_line_terminators(Bytes("\n\n\n")), 3u);
  EXPECT_EQ(count_line_terminators(Bytes("no newline")), 0u);
  EXPECT_EQ(count_line_terminators(Bytes("crlf\r\n")), 1u);
}

// Copyright 2024 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "src/tools/abimirror/token_stream.h"

#include <stdio.h>

#include <string>
#include <vector>

#include "src/main/cpp/util/exit_code.h"
#include "src/main/cpp/util/port.h"
#include "src/tools/abimirror/test_util.h"
#include "gtest/gtest.h"

namespace abimirror {
namespace {

using abimirror_test_util::OutputFilePath;
using abimirror_test_util::WriteFile;

// Indirect command file contents (each string is a separate line):
const char *lines[] = {
    "-cmd1 foo", "bar",       "'abcd'",    "\"efg\"", "hi'x'",
    "'\\jkl'",   "\"\\xyz\"", "\"\\\"0\"", "cont\\",  "inue x",
};

// Tokens that the tokenizer is expected to return from the
// indirect file above:
const char *expected_tokens[] = {
    "-cmd1", "foo",   "bar", "abcd",     "efg", "hix",
    "\\jkl", "\\xyz", "\"0", "continue", "x",
};

std::string CreateCommandFile(const std::string &name,
                              const std::string &contents) {
  std::string path = OutputFilePath(name);
  EXPECT_TRUE(WriteFile(path, contents));
  return path;
}

// Simple '-foo -bar' command line.
TEST(TokenStreamTest, SimpleArgs) {
  const char *args[] = {"-foo", "-bar"};
  ArgTokenStream token_stream(arraysize(args), args);
  EXPECT_EQ("-foo", token_stream.token());
  bool flag_foo = false;
  EXPECT_FALSE(token_stream.MatchAndSet("-bar", &flag_foo));
  ASSERT_TRUE(token_stream.MatchAndSet("-foo", &flag_foo));
  EXPECT_TRUE(flag_foo);
  bool flag_bar = false;
  ASSERT_TRUE(token_stream.MatchAndSet("-bar", &flag_bar));
  EXPECT_TRUE(flag_bar);
  EXPECT_TRUE(token_stream.AtEnd());
}

// '-foo @commandfile -bar' command line.
TEST(TokenStreamTest, CommandFile) {
  std::string contents;
  for (size_t i = 0; i < arraysize(lines); ++i) {
    contents += lines[i];
    contents += '\n';
  }
  std::string command_file_arg =
      std::string("@") + CreateCommandFile("tokens", contents);
  const char *args[] = {"-before_file", "", "-after_file"};
  args[1] = command_file_arg.c_str();
  ArgTokenStream token_stream(arraysize(args), args);
  bool flag = false;
  ASSERT_TRUE(token_stream.MatchAndSet("-before_file", &flag));
  EXPECT_TRUE(flag);
  for (size_t i = 0; i < arraysize(expected_tokens); ++i) {
    flag = false;
    ASSERT_TRUE(token_stream.MatchAndSet(expected_tokens[i], &flag));
    EXPECT_TRUE(flag);
  }
  ASSERT_TRUE(token_stream.MatchAndSet("-after_file", &flag));
  EXPECT_TRUE(flag);
  EXPECT_TRUE(token_stream.AtEnd());
}

// Command file whose last token ends at the end of the file.
TEST(TokenStreamTest, CommandFileWithoutTrailingNewline) {
  std::string command_file_arg =
      std::string("@") + CreateCommandFile("no_newline", "--sources a b");
  const char *args[] = {command_file_arg.c_str(), "--verbose"};
  ArgTokenStream token_stream(arraysize(args), args);
  std::vector<std::string> sources;
  ASSERT_TRUE(token_stream.MatchAndSet("--sources", &sources));
  EXPECT_EQ((std::vector<std::string>{"a", "b"}), sources);
  bool verbose = false;
  ASSERT_TRUE(token_stream.MatchAndSet("--verbose", &verbose));
  EXPECT_TRUE(token_stream.AtEnd());
}

// An empty command file contributes no tokens.
TEST(TokenStreamTest, EmptyCommandFile) {
  std::string command_file_arg =
      std::string("@") + CreateCommandFile("empty", "");
  const char *args[] = {command_file_arg.c_str()};
  ArgTokenStream token_stream(arraysize(args), args);
  EXPECT_TRUE(token_stream.AtEnd());
}

// '--opt value' and '--opt 12'.
TEST(TokenStreamTest, OptargValues) {
  const char *args[] = {"--name", "x y", "--count", "12"};
  ArgTokenStream token_stream(arraysize(args), args);
  std::string name;
  int count = 0;
  EXPECT_FALSE(token_stream.MatchAndSet("--count", &count));
  ASSERT_TRUE(token_stream.MatchAndSet("--name", &name));
  EXPECT_EQ("x y", name);
  ASSERT_TRUE(token_stream.MatchAndSet("--count", &count));
  EXPECT_EQ(12, count);
  EXPECT_TRUE(token_stream.AtEnd());
}

TEST(TokenStreamTest, TokenizeQuoting) {
  std::vector<std::string> tokens;
  std::string error;
  ASSERT_TRUE(TokenizeCommandFile(
      "a\\ b 'c d' \"e 'f'\" g\"h\"i \t\n\\'", &tokens, &error));
  EXPECT_EQ((std::vector<std::string>{"a b", "c d", "e 'f'", "ghi", "'"}),
            tokens);
}

TEST(TokenStreamTest, TokenizeErrors) {
  std::vector<std::string> tokens;
  std::string error;
  EXPECT_FALSE(TokenizeCommandFile("'open", &tokens, &error));
  EXPECT_EQ("no closing '", error);
  EXPECT_FALSE(TokenizeCommandFile("ok \"open", &tokens, &error));
  EXPECT_EQ("no closing \"", error);
  EXPECT_FALSE(TokenizeCommandFile("trailing\\", &tokens, &error));
  EXPECT_EQ("expected character after \\, got end of file", error);
}

TEST(TokenStreamTest, MissingCommandFile) {
  std::string arg = std::string("@") + OutputFilePath("no_such_file");
  const char *args[] = {arg.c_str()};
  EXPECT_EXIT({ ArgTokenStream token_stream(arraysize(args), args); },
              ::testing::ExitedWithCode(abimirror_exit_code::BAD_ARGV),
              "Cannot read command file");
}

}  // namespace
}  // namespace abimirror

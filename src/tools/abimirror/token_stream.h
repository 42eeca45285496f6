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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_TOKEN_STREAM_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_TOKEN_STREAM_H_

#include <cstddef>
#include <string>
#include <vector>

namespace abimirror {

// Splits the contents of a command file into tokens the way Bash does:
// tokens are separated by whitespace, single and double quotes keep
// whitespace and the other quote inside a token, and a backslash followed by
// a newline is removed. Outside quotes a backslash escapes the next
// character; inside double quotes only \" is an escape. Returns false with
// `error` set on an unterminated quote or a trailing backslash.
bool TokenizeCommandFile(const std::string &contents,
                         std::vector<std::string> *tokens, std::string *error);

/*
 * Tokenizes a command line containing indirect command line arguments.
 * An '@' at the beginning of a command line argument means that the rest of
 * the argument names a command file whose tokens (see TokenizeCommandFile)
 * replace the argument.
 *
 * This class is used as follows:
 *
 *  int main(int argc, char* argv[]) {
 *    ArgTokenStream tokens(argc-1, argv+1);
 *    while (!tokens.AtEnd()) {
 *       if (tokens.MatchAndSet("--opt1", ...) ||
 *           tokens.MatchAndSet("--opt2", ...) ||
 *           ...) {
 *         continue;
 *       }
 *       // Process non-option argument or report an error.
 *       // ArgTokenStream::token() returns the current token.
 *    }
 *  }
 *
 * Malformed input (an unreadable command file, a missing or non-numeric
 * option argument) terminates the process with exit code BAD_ARGV.
 */
class ArgTokenStream {
 public:
  // Automatically reads the first token.
  ArgTokenStream(int argc, const char *const *argv);

  // Process --OPTION
  // If the current token is --OPTION, set given FLAG to true, proceed to next
  // token and return true.
  bool MatchAndSet(const char *option, bool *flag);

  // Process --OPTION OPTARG
  // If the current token is --OPTION, set OPTARG to the next token, proceed to
  // the next token after it and return true.
  bool MatchAndSet(const char *option, std::string *optarg);

  // Process --OPTION N, where N must be a decimal integer.
  bool MatchAndSet(const char *option, int *optarg);

  // Process --OPTION OPTARG1 OPTARG2 ...
  // If the current token is --OPTION, append all subsequent tokens up to the
  // next option to OPTARGS, proceed to the next option and return true.
  bool MatchAndSet(const char *option, std::vector<std::string> *optargs);

  // Current token.
  const std::string &token() const { return token_; }

  // Read the next token.
  void next();

  // True if there are no more tokens.
  bool AtEnd() const { return at_end_; }

 private:
  // Reads the command file `path` into file_tokens_.
  void ExpandCommandFile(const char *path);

  const char *const *argv_;
  const char *const *argv_end_;
  std::vector<std::string> file_tokens_;
  size_t next_file_token_;
  std::string token_;
  bool at_end_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_TOKEN_STREAM_H_

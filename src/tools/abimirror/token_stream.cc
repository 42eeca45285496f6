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

#include <ctype.h>
#include <stdio.h>

#include <string>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "src/main/cpp/util/errors.h"
#include "src/main/cpp/util/exit_code.h"
#include "src/main/cpp/util/logging.h"

namespace abimirror {

bool TokenizeCommandFile(const std::string &contents,
                         std::vector<std::string> *tokens,
                         std::string *error) {
  // Line continuations vanish before anything else is looked at.
  std::string text;
  text.reserve(contents.size());
  for (size_t i = 0; i < contents.size(); ++i) {
    if (contents[i] == '\\' && i + 1 < contents.size() &&
        contents[i + 1] == '\n') {
      ++i;
    } else {
      text.push_back(contents[i]);
    }
  }

  std::string token;
  bool in_token = false;
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (isspace(static_cast<unsigned char>(c))) {
      if (in_token) {
        tokens->push_back(token);
        token.clear();
        in_token = false;
      }
      ++i;
    } else if (c == '\'' || c == '"') {
      in_token = true;
      size_t close = i + 1;
      while (close < text.size() && text[close] != c) {
        if (c == '"' && text[close] == '\\' && close + 1 < text.size()) {
          // In a "-quoted string \" stands for ", and \x is copied
          // literally for any other x.
          if (text[close + 1] != '"') {
            token.push_back('\\');
          }
          token.push_back(text[close + 1]);
          close += 2;
        } else {
          token.push_back(text[close]);
          ++close;
        }
      }
      if (close >= text.size()) {
        *error = absl::StrCat("no closing ", std::string(1, c));
        return false;
      }
      i = close + 1;
    } else if (c == '\\') {
      if (i + 1 >= text.size()) {
        *error = "expected character after \\, got end of file";
        return false;
      }
      in_token = true;
      token.push_back(text[i + 1]);
      i += 2;
    } else {
      in_token = true;
      token.push_back(c);
      ++i;
    }
  }
  if (in_token) {
    tokens->push_back(token);
  }
  return true;
}

ArgTokenStream::ArgTokenStream(int argc, const char *const *argv)
    : argv_(argv), argv_end_(argv + argc), next_file_token_(0),
      at_end_(false) {
  next();
}

void ArgTokenStream::next() {
  if (at_end_) {
    return;
  }
  for (;;) {
    if (next_file_token_ < file_tokens_.size()) {
      token_ = file_tokens_[next_file_token_++];
      return;
    }
    if (argv_ >= argv_end_) {
      token_.clear();
      at_end_ = true;
      return;
    }
    const char *arg = *argv_++;
    if (arg[0] != '@') {
      token_ = arg;
      return;
    }
    ExpandCommandFile(arg + 1);
  }
}

void ArgTokenStream::ExpandCommandFile(const char *path) {
  FILE *fp = fopen(path, "r");
  if (fp == nullptr) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
        << "Cannot read command file " << path << ": "
        << abimirror_util::GetLastErrorString();
  }
  std::string contents;
  char buffer[4096];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
    contents.append(buffer, n);
  }
  bool read_error = ferror(fp) != 0;
  fclose(fp);
  if (read_error) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
        << "Cannot read command file " << path;
  }

  file_tokens_.clear();
  next_file_token_ = 0;
  std::string error;
  if (!TokenizeCommandFile(contents, &file_tokens_, &error)) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV) << path << ": " << error;
  }
}

bool ArgTokenStream::MatchAndSet(const char *option, bool *flag) {
  if (at_end_ || token_ != option) {
    return false;
  }
  *flag = true;
  next();
  return true;
}

bool ArgTokenStream::MatchAndSet(const char *option, std::string *optarg) {
  if (at_end_ || token_ != option) {
    return false;
  }
  next();
  if (AtEnd()) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
        << option << " requires argument";
  }
  *optarg = token_;
  next();
  return true;
}

bool ArgTokenStream::MatchAndSet(const char *option, int *optarg) {
  std::string value;
  if (!MatchAndSet(option, &value)) {
    return false;
  }
  if (!absl::SimpleAtoi(value, optarg)) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
        << option << " requires an integer argument, got '" << value << "'";
  }
  return true;
}

bool ArgTokenStream::MatchAndSet(const char *option,
                                 std::vector<std::string> *optargs) {
  if (at_end_ || token_ != option) {
    return false;
  }
  next();
  while (!AtEnd() && (token_.empty() || token_[0] != '-')) {
    optargs->push_back(token_);
    next();
  }
  return true;
}

}  // namespace abimirror

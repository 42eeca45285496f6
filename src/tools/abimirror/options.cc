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

#include "src/tools/abimirror/options.h"

#include "src/main/cpp/util/exit_code.h"
#include "src/main/cpp/util/logging.h"

namespace abimirror {

void Options::ParseCommandLine(int argc, const char *const argv[]) {
  ArgTokenStream tokens(argc, argv);
  while (!tokens.AtEnd()) {
    if (!ParseToken(&tokens)) {
      ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
          << "Bad command line argument " << tokens.token();
    }
  }

  PostValidateOptions();
}

bool Options::ParseToken(ArgTokenStream *tokens) {
  return tokens->MatchAndSet("--output", &output_jar) ||
         tokens->MatchAndSet("--sources", &sources) ||
         tokens->MatchAndSet("--class_root", &class_root) ||
         tokens->MatchAndSet("--jobs", &jobs) ||
         tokens->MatchAndSet("--nocompress", &nocompress) ||
         tokens->MatchAndSet("--verbose", &verbose);
}

void Options::PostValidateOptions() {
  if (output_jar.empty()) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
        << "Use --output <output_jar> to specify the output file name";
  }
  if (jobs < 0) {
    ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV)
        << "--jobs must not be negative, got " << jobs;
  }
}

}  // namespace abimirror

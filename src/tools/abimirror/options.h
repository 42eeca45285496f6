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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_OPTIONS_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_OPTIONS_H_

#include <string>
#include <vector>

#include "src/tools/abimirror/token_stream.h"

namespace abimirror {

/* Command line options. */
class Options {
 public:
  Options() : jobs(0), nocompress(false), verbose(false) {}

  virtual ~Options() {}

  // Parses command line arguments into the fields of this instance.
  void ParseCommandLine(int argc, const char *const argv[]);

  std::string output_jar;
  // Input jars and loose .class files.
  std::vector<std::string> sources;
  // Loose class files are named relative to this directory in the output.
  std::string class_root;
  // Number of worker threads; 0 means one per hardware thread.
  int jobs;
  bool nocompress;
  bool verbose;

 protected:
  /*
   * Given the token stream, consume one notional flag from the input stream and
   * return true if the flag was recognized and fully consumed. This notional
   * flag may result in many tokens being consumed, as flags like --sources end
   * up consuming many future tokens: --sources a b c d e --some_other_flag
   */
  virtual bool ParseToken(ArgTokenStream *tokens);

  /*
   * After all of the command line options are consumed, validate that the
   * options make sense. Exits with BAD_ARGV on invalid combinations of flags
   * (e.g.: a missing --output).
   */
  virtual void PostValidateOptions();
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_OPTIONS_H_

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

#ifndef ABIMIRROR_SRC_MAIN_CPP_UTIL_EXIT_CODE_H_
#define ABIMIRROR_SRC_MAIN_CPP_UTIL_EXIT_CODE_H_

namespace abimirror_exit_code {

enum ExitCode {
  // Success.
  SUCCESS = 0,

  // At least one input could not be read or parsed, or the output jar could
  // not be written. No output jar is left behind.
  EXTRACTION_FAILED = 1,

  // Command Line Problem, Bad or Illegal flags or flag combination. The user
  // must modify their command line.
  BAD_ARGV = 2,

  // Something is wrong with the host and a re-run of the same command
  // probably will not help.
  LOCAL_ENVIRONMENTAL_ERROR = 36,

  // A broken internal invariant. This exit code should be a last resort.
  INTERNAL_ERROR = 37,
};

}  // namespace abimirror_exit_code

#endif  // ABIMIRROR_SRC_MAIN_CPP_UTIL_EXIT_CODE_H_

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

#ifndef ABIMIRROR_SRC_MAIN_CPP_UTIL_CONSOLE_LOG_HANDLER_H_
#define ABIMIRROR_SRC_MAIN_CPP_UTIL_CONSOLE_LOG_HANDLER_H_

#include <iostream>
#include <string>

#include "src/main/cpp/util/logging.h"

namespace abimirror_util {

// Prints log messages to a stream (stderr unless told otherwise).
// Messages below `min_level` are dropped. INFO messages, when printed, carry
// a timestamp and their origin; USER and above are printed the way the
// default handler prints them.
class ConsoleLogHandler : public LogHandler {
 public:
  explicit ConsoleLogHandler(LogLevel min_level);
  ConsoleLogHandler(LogLevel min_level, std::ostream* stream);
  ~ConsoleLogHandler() override;

  void HandleMessage(LogLevel level, const std::string& filename, int line,
                     const std::string& message, int exit_code) override;

 private:
  const LogLevel min_level_;
  std::ostream* stream_;
};

}  // namespace abimirror_util

#endif  // ABIMIRROR_SRC_MAIN_CPP_UTIL_CONSOLE_LOG_HANDLER_H_

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

#include "src/main/cpp/util/console_log_handler.h"

#include <time.h>

#include <chrono>  // NOLINT
#include <cstdio>
#include <cstdlib>
#include <string>

namespace abimirror_util {

static std::string Timestamp() {
  auto now = std::chrono::system_clock::now();
  time_t s = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch());
  struct tm tmbuf = {};
  localtime_r(&s, &tmbuf);
  char buf[16];
  int r = strftime(buf, sizeof buf - 5, "%H:%M:%S", &tmbuf);
  r += snprintf(buf + r, 5, ".%03d", static_cast<int>(ms.count() % 1000));
  return std::string(buf, r);
}

ConsoleLogHandler::ConsoleLogHandler(LogLevel min_level)
    : min_level_(min_level), stream_(&std::cerr) {}

ConsoleLogHandler::ConsoleLogHandler(LogLevel min_level, std::ostream* stream)
    : min_level_(min_level), stream_(stream) {}

ConsoleLogHandler::~ConsoleLogHandler() { stream_->flush(); }

void ConsoleLogHandler::HandleMessage(LogLevel level,
                                      const std::string& filename, int line,
                                      const std::string& message,
                                      int exit_code) {
  if (level >= min_level_) {
    if (level == LOGLEVEL_INFO) {
      (*stream_) << "[" << LogLevelName(level) << " " << Timestamp() << " "
                 << filename << ":" << line << "] " << message << '\n';
    } else if (level == LOGLEVEL_USER) {
      (*stream_) << message << '\n';
    } else {
      (*stream_) << LogLevelName(level) << ": " << message << '\n';
    }
  }
  if (level == LOGLEVEL_FATAL) {
    stream_->flush();
    std::exit(exit_code);
  }
}

}  // namespace abimirror_util

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

#ifndef ABIMIRROR_SRC_MAIN_CPP_UTIL_LOGGING_H_
#define ABIMIRROR_SRC_MAIN_CPP_UTIL_LOGGING_H_

#include <memory>
#include <sstream>
#include <string>

// Stream-style logging for the abimirror tools. Usage:
//   ABIMIRROR_LOG(WARNING) << "Skipping " << entry_name;
//   ABIMIRROR_DIE(abimirror_exit_code::BAD_ARGV) << "--output is required";
// Without a LogHandler, INFO messages are dropped and everything of level USER
// and above goes to stderr.

namespace abimirror_util {

enum LogLevel {
  LOGLEVEL_INFO,
  LOGLEVEL_USER,
  LOGLEVEL_WARNING,
  LOGLEVEL_ERROR,
  LOGLEVEL_FATAL,

#ifdef NDEBUG
  LOGLEVEL_DFATAL = LOGLEVEL_ERROR
#else
  LOGLEVEL_DFATAL = LOGLEVEL_FATAL
#endif
};

const char* LogLevelName(LogLevel level);

namespace internal {

class LogFinisher;
class LogMessage {
 public:
  LogMessage(LogLevel level, const std::string& filename, int line);
  LogMessage(LogLevel level, const std::string& filename, int line,
             int exit_code);

  LogMessage& operator<<(const std::string& value);
  LogMessage& operator<<(const char* value);
  LogMessage& operator<<(char value);
  LogMessage& operator<<(bool value);
  LogMessage& operator<<(int value);
  LogMessage& operator<<(unsigned int value);
  LogMessage& operator<<(long value);
  LogMessage& operator<<(unsigned long value);
  LogMessage& operator<<(long long value);
  LogMessage& operator<<(unsigned long long value);
  LogMessage& operator<<(double value);
  LogMessage& operator<<(const void* value);

 private:
  friend class LogFinisher;
  void Finish();

  const LogLevel level_;
  const std::string filename_;
  const int line_;
  // Only used for FATAL log messages.
  const int exit_code_;
  std::stringstream message_;
};

class LogFinisher {
 public:
  void operator=(LogMessage& other);
};

}  // namespace internal

#define ABIMIRROR_LOG(LEVEL)                                              \
  ::abimirror_util::internal::LogFinisher() =                             \
      ::abimirror_util::internal::LogMessage(                             \
          ::abimirror_util::LOGLEVEL_##LEVEL, __FILE__, __LINE__)
#define ABIMIRROR_LOG_IF(LEVEL, CONDITION) \
  !(CONDITION) ? (void)0 : ABIMIRROR_LOG(LEVEL)
#define ABIMIRROR_DIE(EXIT_CODE)                                          \
  ::abimirror_util::internal::LogFinisher() =                             \
      ::abimirror_util::internal::LogMessage(                             \
          ::abimirror_util::LOGLEVEL_FATAL, __FILE__, __LINE__, EXIT_CODE)

#define ABIMIRROR_CHECK(EXPRESSION) \
  ABIMIRROR_LOG_IF(FATAL, !(EXPRESSION)) << "CHECK failed: " #EXPRESSION ": "
#define ABIMIRROR_CHECK_EQ(A, B) ABIMIRROR_CHECK((A) == (B))
#define ABIMIRROR_CHECK_NE(A, B) ABIMIRROR_CHECK((A) != (B))
#define ABIMIRROR_CHECK_LT(A, B) ABIMIRROR_CHECK((A) < (B))
#define ABIMIRROR_CHECK_LE(A, B) ABIMIRROR_CHECK((A) <= (B))

#ifdef NDEBUG

#define ABIMIRROR_DCHECK(EXPRESSION) \
  while (false) ABIMIRROR_CHECK(EXPRESSION)

#else  // NDEBUG

#define ABIMIRROR_DCHECK ABIMIRROR_CHECK

#endif  // !NDEBUG

class LogHandler {
 public:
  virtual ~LogHandler() {}
  // Called for every message. Must exit the process with `exit_code` if
  // `level` is LOGLEVEL_FATAL.
  virtual void HandleMessage(LogLevel level, const std::string& filename,
                             int line, const std::string& message,
                             int exit_code) = 0;
};

// Installs `new_handler` as the process-wide handler. Passing nullptr restores
// the default behavior.
void SetLogHandler(std::unique_ptr<LogHandler> new_handler);

}  // namespace abimirror_util

#endif  // ABIMIRROR_SRC_MAIN_CPP_UTIL_LOGGING_H_

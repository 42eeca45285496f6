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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_INPUT_JAR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_INPUT_JAR_H_

#include <cstdint>
#include <string>
#include <vector>

#include "src/tools/abimirror/mapped_file.h"
#include "src/tools/abimirror/zip_headers.h"

namespace abimirror {

/*
 * An input jar. The usage pattern is:
 *   InputJar input_jar;
 *   if (!input_jar.Open("path/to/file", &error)) { fail...}
 *   const CDH *dir_entry;
 *   const LH *local_header;
 *   while ((dir_entry = input_jar.NextEntry(&local_header))) {
 *     // process entry.
 *   }
 *   if (!input_jar.error().empty()) { fail...}
 *   input_jar.Close(); // actually, called by destructor, too.
 */
class InputJar {
 public:
  InputJar() : cdh_(nullptr), preamble_size_(0) {}

  ~InputJar() { Close(); }

  // Opens the file, memory maps it and locates Central Directory.
  bool Open(const std::string &path, std::string *error);

  // Returns the next Central Directory Header, or nullptr after the last one
  // or when the directory turns out to be corrupt, in which case error() is
  // set.
  const CDH *NextEntry(const LH **local_header_ptr);

  // Stores the uncompressed contents of an entry in `contents`.
  bool ReadEntry(const CDH *entry, const LH *local_header,
                 std::vector<uint8_t> *contents, std::string *error) const;

  void Close();

  const std::string &path() const { return path_; }
  const std::string &error() const { return error_; }

 private:
  bool Corrupt(const std::string &message);

  std::string path_;
  std::string error_;
  MappedFile mapped_file_;
  const CDH *cdh_;          // current directory entry
  uint64_t preamble_size_;  // Bytes before the Zip proper.
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_INPUT_JAR_H_

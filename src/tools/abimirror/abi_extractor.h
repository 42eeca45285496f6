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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_ABI_EXTRACTOR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_ABI_EXTRACTOR_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "src/tools/abimirror/abi_jar_writer.h"
#include "src/tools/abimirror/input_jar.h"

namespace abimirror {

// Collects class files from jars and directories and writes their ABI into
// an AbiJarWriter. Each class is parsed into its own ClassMirror on a pool of
// worker threads; the jar is committed in file name order once all of them
// are done, so the output does not depend on the number of threads.
//
// When two inputs provide the same entry name the first one is used.
class AbiExtractor {
 public:
  AbiExtractor();
  ~AbiExtractor();

  AbiExtractor(const AbiExtractor &) = delete;
  AbiExtractor &operator=(const AbiExtractor &) = delete;

  // Queues the class entries of the jar at `path`. Other entries are
  // ignored.
  bool AddJar(const std::string &path);

  // Queues a loose class file, named relative to `class_root` or, when that
  // is empty, by its base name.
  bool AddClassFile(const std::string &path, const std::string &class_root);

  // Queues `path` as a jar or, if it ends in .class, as a loose class file.
  bool AddSource(const std::string &path, const std::string &class_root);

  size_t class_count() const { return tasks_.size(); }

  // Parses the queued classes on `jobs` threads (0 for one per hardware
  // thread) and commits `writer`, which must be open. If any class cannot be
  // read, nothing is committed and the output is discarded.
  bool Extract(AbiJarWriter *writer, size_t jobs);

  // True if the jar entry `name` is a class whose ABI is extracted.
  static bool IsClassEntry(const std::string &name);

  // Computes the entry name of the loose class file `path`.
  static bool EntryNameFor(const std::string &path,
                           const std::string &class_root,
                           std::string *entry_name, std::string *error);

 private:
  struct Task {
    std::string entry_name;
    // Set for jar entries.
    const InputJar *jar;
    const CDH *cdh;
    const LH *local_header;
    // Set for loose class files.
    std::string path;
  };

  // Returns false if an earlier input already provided `entry_name`.
  bool Claim(const std::string &entry_name, const std::string &source);
  bool ExtractOne(const Task &task, AbiJarWriter *writer) const;

  std::vector<std::unique_ptr<InputJar>> jars_;
  std::vector<Task> tasks_;
  // Entry name to the input that provided it.
  absl::flat_hash_map<std::string, std::string> sources_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_ABI_EXTRACTOR_H_

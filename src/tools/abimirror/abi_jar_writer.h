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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_ABI_JAR_WRITER_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_ABI_JAR_WRITER_H_

#include <stdio.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>  // NOLINT
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "src/tools/abimirror/class_mirror.h"
#include "src/tools/abimirror/zlib_interface.h"

namespace abimirror {

// MS-DOS date of every entry: 1980-01-01, the earliest date the format can
// express.
const uint16_t kAbiEntryDate = (0 << 9) | (1 << 5) | 1;
// MS-DOS time of every entry: 00:00:00.
const uint16_t kAbiEntryTime = 0;

/*
 * The ABI jar being written. The usage pattern is:
 *   AbiJarWriter writer;
 *   if (!writer.Open("path/to/abi.jar")) { fail... }
 *   writer.Add(std::move(mirror));  // for each class
 *   if (!writer.Commit()) { fail... }
 *
 * Entries carry fixed timestamps and no extra fields, so the same classes
 * always produce the same archive. Once any operation fails the writer
 * refuses further entries, and Close deletes the output file.
 */
class AbiJarWriter {
 public:
  // Entries are deflated when `compress` is true and that makes them
  // smaller; otherwise they are stored.
  explicit AbiJarWriter(bool compress = true);

  // Deletes the output file if it was not closed.
  ~AbiJarWriter();

  AbiJarWriter(const AbiJarWriter &) = delete;
  AbiJarWriter &operator=(const AbiJarWriter &) = delete;

  // Creates or truncates the output file.
  bool Open(const std::string &path);

  // Queues a class for Commit. Thread-safe.
  void Add(std::unique_ptr<ClassMirror> mirror);

  // Writes the queued classes ordered by file name, then closes the archive.
  bool Commit();

  // Writes one entry. Thread-safe: concurrent calls are serialized, and each
  // entry is written whole before the next one starts. Fails on a duplicate
  // name.
  bool WriteEntry(const std::string &name, const uint8_t *data, size_t size);

  // Writes the Central Directory and closes the file. Returns false, having
  // deleted the output, if anything failed since Open.
  bool Close();

  // Closes and deletes the output without finishing it. Queued mirrors are
  // dropped.
  void Discard();

  const std::string &path() const { return path_; }
  int entries() const { return entries_; }
  size_t pending() const { return mirrors_.size(); }

 private:
  bool Fail(const std::string &message);
  bool WriteBytes(const void *buffer, size_t count);
  void AppendToDirectory(const std::string &name, uint16_t method,
                         uint32_t crc, uint32_t compressed_size,
                         uint32_t uncompressed_size, uint32_t offset);
  void Abandon();

  const bool compress_;
  std::mutex mutex_;
  std::string path_;
  FILE *file_;
  uint64_t outpos_;
  bool failed_;
  int entries_;
  std::vector<uint8_t> cen_;
  absl::flat_hash_set<std::string> names_;
  std::vector<std::unique_ptr<ClassMirror>> mirrors_;
  Deflater deflater_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_ABI_JAR_WRITER_H_

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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_BYTE_VECTOR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_BYTE_VECTOR_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace abimirror {

// A growable buffer of big-endian class file data.
class ByteVector {
 public:
  ByteVector() {}

  void PutU1(uint8_t value) { data_.push_back(value); }

  void PutU2(uint16_t value) {
    data_.push_back(static_cast<uint8_t>(value >> 8));
    data_.push_back(static_cast<uint8_t>(value));
  }

  void PutU4(uint32_t value) {
    PutU2(static_cast<uint16_t>(value >> 16));
    PutU2(static_cast<uint16_t>(value));
  }

  void PutU8(uint64_t value) {
    PutU4(static_cast<uint32_t>(value >> 32));
    PutU4(static_cast<uint32_t>(value));
  }

  void PutBytes(const uint8_t *bytes, size_t count) {
    data_.insert(data_.end(), bytes, bytes + count);
  }

  void PutBytes(const std::string &bytes) {
    data_.insert(data_.end(), bytes.begin(), bytes.end());
  }

  void PutBytes(const ByteVector &other) {
    data_.insert(data_.end(), other.data_.begin(), other.data_.end());
  }

  // Overwrites the two bytes at `offset`, which must already be written.
  void PatchU2(size_t offset, uint16_t value) {
    data_[offset] = static_cast<uint8_t>(value >> 8);
    data_[offset + 1] = static_cast<uint8_t>(value);
  }

  void PatchU4(size_t offset, uint32_t value) {
    PatchU2(offset, static_cast<uint16_t>(value >> 16));
    PatchU2(offset + 2, static_cast<uint16_t>(value));
  }

  size_t size() const { return data_.size(); }
  const uint8_t *data() const { return data_.data(); }
  const std::vector<uint8_t> &bytes() const { return data_; }

 private:
  std::vector<uint8_t> data_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_BYTE_VECTOR_H_

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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_CONSTANT_POOL_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_CONSTANT_POOL_H_

#include <cstdint>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "src/tools/abimirror/byte_vector.h"
#include "src/tools/abimirror/constant.h"

namespace abimirror {

// Constant pool tags (JVMS 4.4).
enum ConstantTag {
  CONSTANT_Utf8 = 1,
  CONSTANT_Integer = 3,
  CONSTANT_Float = 4,
  CONSTANT_Long = 5,
  CONSTANT_Double = 6,
  CONSTANT_Class = 7,
  CONSTANT_String = 8,
  CONSTANT_Fieldref = 9,
  CONSTANT_Methodref = 10,
  CONSTANT_InterfaceMethodref = 11,
  CONSTANT_NameAndType = 12,
  CONSTANT_MethodHandle = 15,
  CONSTANT_MethodType = 16,
  CONSTANT_Dynamic = 17,
  CONSTANT_InvokeDynamic = 18,
  CONSTANT_Module = 19,
  CONSTANT_Package = 20,
};

// The constant pool of a class file under construction. Each distinct entry
// is stored once, and indexes are handed out in order of first use, so the
// same sequence of Add calls always yields the same pool.
class ConstantPool {
 public:
  ConstantPool();

  uint16_t AddUtf8(const std::string &value);
  uint16_t AddClass(const std::string &internal_name);
  uint16_t AddString(const std::string &value);
  uint16_t AddInteger(int32_t value);
  uint16_t AddFloat(uint32_t bits);
  uint16_t AddLong(int64_t value);
  uint16_t AddDouble(uint64_t bits);

  // Adds the entry a ConstantValue attribute refers to for `value`.
  uint16_t AddConstant(const Constant &value);

  // The constant_pool_count of the class file: one more than the highest
  // index in use.
  uint16_t count() const { return next_index_; }

  // Writes constant_pool_count followed by the entries.
  void Put(ByteVector *out) const;

 private:
  uint16_t Add(const ByteVector &entry, uint16_t slots);

  absl::flat_hash_map<std::string, uint16_t> indexes_;
  ByteVector entries_;
  uint16_t next_index_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_CONSTANT_POOL_H_

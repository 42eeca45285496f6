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

#include "src/tools/abimirror/constant_pool.h"

#include <string>
#include <utility>

#include "src/main/cpp/util/logging.h"

namespace abimirror {

ConstantPool::ConstantPool() : next_index_(1) {}

uint16_t ConstantPool::Add(const ByteVector &entry, uint16_t slots) {
  std::string key(reinterpret_cast<const char *>(entry.data()), entry.size());
  auto it = indexes_.find(key);
  if (it != indexes_.end()) {
    return it->second;
  }
  ABIMIRROR_CHECK_LE(next_index_ + slots, 0xFFFF)
      << "constant pool overflow";
  uint16_t index = next_index_;
  next_index_ += slots;
  entries_.PutBytes(entry);
  indexes_.emplace(std::move(key), index);
  return index;
}

uint16_t ConstantPool::AddUtf8(const std::string &value) {
  ABIMIRROR_CHECK_LE(value.size(), 0xFFFFu) << "Utf8 constant too long";
  ByteVector entry;
  entry.PutU1(CONSTANT_Utf8);
  entry.PutU2(static_cast<uint16_t>(value.size()));
  entry.PutBytes(value);
  return Add(entry, 1);
}

uint16_t ConstantPool::AddClass(const std::string &internal_name) {
  ByteVector entry;
  entry.PutU1(CONSTANT_Class);
  entry.PutU2(AddUtf8(internal_name));
  return Add(entry, 1);
}

uint16_t ConstantPool::AddString(const std::string &value) {
  ByteVector entry;
  entry.PutU1(CONSTANT_String);
  entry.PutU2(AddUtf8(value));
  return Add(entry, 1);
}

uint16_t ConstantPool::AddInteger(int32_t value) {
  ByteVector entry;
  entry.PutU1(CONSTANT_Integer);
  entry.PutU4(static_cast<uint32_t>(value));
  return Add(entry, 1);
}

uint16_t ConstantPool::AddFloat(uint32_t bits) {
  ByteVector entry;
  entry.PutU1(CONSTANT_Float);
  entry.PutU4(bits);
  return Add(entry, 1);
}

uint16_t ConstantPool::AddLong(int64_t value) {
  ByteVector entry;
  entry.PutU1(CONSTANT_Long);
  entry.PutU8(static_cast<uint64_t>(value));
  return Add(entry, 2);
}

uint16_t ConstantPool::AddDouble(uint64_t bits) {
  ByteVector entry;
  entry.PutU1(CONSTANT_Double);
  entry.PutU8(bits);
  return Add(entry, 2);
}

uint16_t ConstantPool::AddConstant(const Constant &value) {
  switch (value.kind()) {
    case Constant::kLong:
      return AddLong(value.long_value());
    case Constant::kFloat:
      return AddFloat(value.float_bits());
    case Constant::kDouble:
      return AddDouble(value.double_bits());
    case Constant::kString:
      return AddString(value.string_value());
    case Constant::kClass:
      return AddClass(value.string_value());
    default:
      return AddInteger(value.int_value());
  }
}

void ConstantPool::Put(ByteVector *out) const {
  out->PutU2(next_index_);
  out->PutBytes(entries_);
}

}  // namespace abimirror

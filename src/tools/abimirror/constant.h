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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_CONSTANT_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_CONSTANT_H_

#include <cstdint>
#include <string>

namespace abimirror {

// A constant value as it appears in a class file: the initial value of a
// static final field (ConstantValue attribute), or a constant element value
// of an annotation. Floating point values are kept as their raw IEEE 754 bits
// so that NaN payloads survive a round trip unchanged.
class Constant {
 public:
  enum Kind {
    kBoolean,
    kByte,
    kChar,
    kShort,
    kInt,
    kLong,
    kFloat,
    kDouble,
    kString,
    // A class literal, held as a return descriptor such as "Ljava/lang/Foo;"
    // or "V".
    kClass,
  };

  // The int constant 0.
  Constant() : kind_(kInt), bits_(0) {}

  static Constant Boolean(bool value) { return Constant(kBoolean, value); }
  static Constant Byte(int8_t value) { return Constant(kByte, value); }
  static Constant Char(uint16_t value) { return Constant(kChar, value); }
  static Constant Short(int16_t value) { return Constant(kShort, value); }
  static Constant Int(int32_t value) { return Constant(kInt, value); }
  static Constant Long(int64_t value) { return Constant(kLong, value); }
  static Constant FloatBits(uint32_t bits) { return Constant(kFloat, bits); }
  static Constant DoubleBits(uint64_t bits) { return Constant(kDouble, bits); }
  static Constant Float(float value);
  static Constant Double(double value);
  static Constant String(const std::string &value) {
    return Constant(kString, value);
  }
  static Constant Class(const std::string &descriptor) {
    return Constant(kClass, descriptor);
  }

  // Builds the constant for the annotation element value tag `tag`
  // (one of "BCISZ") holding `value`. Returns false for other tags.
  static bool FromIntegerTag(char tag, int32_t value, Constant *constant);

  Kind kind() const { return kind_; }

  // The value of a boolean, byte, char, short or int constant.
  int32_t int_value() const { return static_cast<int32_t>(bits_); }
  int64_t long_value() const { return static_cast<int64_t>(bits_); }
  uint32_t float_bits() const { return static_cast<uint32_t>(bits_); }
  uint64_t double_bits() const { return bits_; }
  float float_value() const;
  double double_value() const;
  // The value of a string constant, or the descriptor of a class constant.
  const std::string &string_value() const { return text_; }

  // True for the kinds stored in the class file as CONSTANT_Integer.
  bool is_integer() const { return kind_ <= kInt; }

  // The annotation element_value tag of this constant (JVMS 4.7.16.1):
  // one of "ZBCSIJFDsc".
  char tag() const;

  // A debugging representation, e.g. I:42 or s:"hello".
  std::string ToString() const;

  bool operator==(const Constant &other) const {
    return kind_ == other.kind_ && bits_ == other.bits_ &&
           text_ == other.text_;
  }
  bool operator!=(const Constant &other) const { return !(*this == other); }

 private:
  Constant(Kind kind, int64_t value)
      : kind_(kind), bits_(static_cast<uint64_t>(value)) {}
  Constant(Kind kind, const std::string &text)
      : kind_(kind), bits_(0), text_(text) {}

  Kind kind_;
  uint64_t bits_;
  std::string text_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_CONSTANT_H_

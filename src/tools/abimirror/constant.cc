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

#include "src/tools/abimirror/constant.h"

#include <string.h>

#include <cinttypes>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace abimirror {

Constant Constant::Float(float value) {
  uint32_t bits;
  memcpy(&bits, &value, sizeof(bits));
  return FloatBits(bits);
}

Constant Constant::Double(double value) {
  uint64_t bits;
  memcpy(&bits, &value, sizeof(bits));
  return DoubleBits(bits);
}

bool Constant::FromIntegerTag(char tag, int32_t value, Constant *constant) {
  switch (tag) {
    case 'Z':
      *constant = Boolean(value != 0);
      return true;
    case 'B':
      *constant = Byte(static_cast<int8_t>(value));
      return true;
    case 'C':
      *constant = Char(static_cast<uint16_t>(value));
      return true;
    case 'S':
      *constant = Short(static_cast<int16_t>(value));
      return true;
    case 'I':
      *constant = Int(value);
      return true;
    default:
      return false;
  }
}

float Constant::float_value() const {
  uint32_t bits = float_bits();
  float value;
  memcpy(&value, &bits, sizeof(value));
  return value;
}

double Constant::double_value() const {
  uint64_t bits = double_bits();
  double value;
  memcpy(&value, &bits, sizeof(value));
  return value;
}

char Constant::tag() const {
  static const char kTags[] = "ZBCSIJFDsc";
  return kTags[kind_];
}

std::string Constant::ToString() const {
  switch (kind_) {
    case kFloat:
      return absl::StrFormat("F:0x%08" PRIx32, float_bits());
    case kDouble:
      return absl::StrFormat("D:0x%016" PRIx64, double_bits());
    case kLong:
      return absl::StrCat("J:", long_value());
    case kString:
    case kClass:
      return absl::StrCat(std::string(1, tag()), ":\"", text_, "\"");
    default:
      return absl::StrCat(std::string(1, tag()), ":", int_value());
  }
}

}  // namespace abimirror

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

#include "src/tools/abimirror/class_reader.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"

namespace abimirror {

namespace {

const uint32_t kClassMagic = 0xCAFEBABE;

// Bounds recursion through nested annotations and arrays.
const int kMaxAnnotationDepth = 128;

}  // namespace

ClassReader::ClassReader(const uint8_t *data, size_t size)
    : data_(data), size_(size), pos_(0) {}

bool ClassReader::Accept(ClassVisitor *visitor, std::string *error) {
  pos_ = 0;
  error_.clear();
  pool_.clear();
  if (!ReadClass(visitor)) {
    *error = error_;
    return false;
  }
  return true;
}

bool ClassReader::ReadClass(ClassVisitor *visitor) {
  uint32_t magic = ReadU4();
  if (failed()) {
    return false;
  }
  if (magic != kClassMagic) {
    return Fail(absl::StrCat("bad magic number 0x", absl::Hex(magic)));
  }
  uint16_t minor_version = ReadU2();
  uint16_t major_version = ReadU2();
  if (!ReadConstantPool()) {
    return false;
  }

  uint32_t access = ReadU2();
  std::string name;
  if (!ClassNameAt(ReadU2(), &name)) {
    return false;
  }
  uint16_t super_index = ReadU2();
  std::string super_name;
  if (super_index != 0 && !ClassNameAt(super_index, &super_name)) {
    return false;
  }
  uint16_t interface_count = ReadU2();
  std::vector<std::string> interfaces(interface_count);
  for (uint16_t i = 0; i < interface_count; ++i) {
    if (!ClassNameAt(ReadU2(), &interfaces[i])) {
      return false;
    }
  }

  // The class attributes follow the members, but the header visit needs the
  // class signature. Skip ahead to them and come back for the members.
  size_t members_offset = pos_;
  Attributes attributes;
  if (!SkipMembers() || !SkipMembers() || !ReadAttributes(&attributes)) {
    return false;
  }
  std::string signature;
  if (attributes.signature != 0) {
    pos_ = attributes.signature;
    if (!Utf8At(ReadU2(), &signature)) {
      return false;
    }
  }
  if (attributes.deprecated) {
    access |= kAccDeprecated;
  }

  visitor->Visit(static_cast<uint32_t>(minor_version) << 16 | major_version,
                 access, name, attributes.signature != 0 ? &signature : nullptr,
                 super_index != 0 ? &super_name : nullptr, &interfaces);
  if (!ReadAnnotations(attributes.visible_annotations,
                       [visitor](const std::string &descriptor) {
                         return visitor->VisitAnnotation(descriptor, true);
                       }) ||
      !ReadAnnotations(attributes.invisible_annotations,
                       [visitor](const std::string &descriptor) {
                         return visitor->VisitAnnotation(descriptor, false);
                       })) {
    return false;
  }

  pos_ = members_offset;
  uint16_t field_count = ReadU2();
  for (uint16_t i = 0; i < field_count; ++i) {
    if (!ReadField(visitor)) {
      return false;
    }
  }
  uint16_t method_count = ReadU2();
  for (uint16_t i = 0; i < method_count; ++i) {
    if (!ReadMethod(visitor)) {
      return false;
    }
  }
  if (failed()) {
    return false;
  }
  visitor->VisitEnd();
  return true;
}

bool ClassReader::Fail(const std::string &message) {
  if (error_.empty()) {
    error_ = message;
  }
  return false;
}

bool ClassReader::Require(size_t count) {
  if (failed()) {
    return false;
  }
  if (count > size_ - pos_) {
    return Fail(absl::StrCat("truncated class file: ", count,
                             " bytes needed at offset ", pos_, ", ",
                             size_ - pos_, " available"));
  }
  return true;
}

uint8_t ClassReader::ReadU1() {
  if (!Require(1)) {
    return 0;
  }
  return data_[pos_++];
}

uint16_t ClassReader::ReadU2() {
  if (!Require(2)) {
    return 0;
  }
  uint16_t value = static_cast<uint16_t>(data_[pos_] << 8 | data_[pos_ + 1]);
  pos_ += 2;
  return value;
}

uint32_t ClassReader::ReadU4() {
  if (!Require(4)) {
    return 0;
  }
  uint32_t value = static_cast<uint32_t>(data_[pos_]) << 24 |
                   static_cast<uint32_t>(data_[pos_ + 1]) << 16 |
                   static_cast<uint32_t>(data_[pos_ + 2]) << 8 |
                   static_cast<uint32_t>(data_[pos_ + 3]);
  pos_ += 4;
  return value;
}

uint64_t ClassReader::ReadU8() {
  uint64_t high = ReadU4();
  uint64_t low = ReadU4();
  return high << 32 | low;
}

void ClassReader::Skip(size_t count) {
  if (Require(count)) {
    pos_ += count;
  }
}

bool ClassReader::ReadConstantPool() {
  uint16_t count = ReadU2();
  if (failed()) {
    return false;
  }
  if (count == 0) {
    return Fail("constant pool count is 0");
  }
  pool_.assign(count, PoolEntry{0, 0});
  for (uint16_t i = 1; i < count; ++i) {
    uint8_t tag = ReadU1();
    pool_[i].tag = tag;
    pool_[i].offset = pos_;
    switch (tag) {
      case CONSTANT_Utf8:
        Skip(ReadU2());
        break;
      case CONSTANT_Integer:
      case CONSTANT_Float:
        Skip(4);
        break;
      case CONSTANT_Long:
      case CONSTANT_Double:
        // Eight-byte constants take up two pool slots; the second is unusable.
        if (i + 1 >= count) {
          return Fail(absl::StrCat("8-byte constant at index ", i,
                                   " overflows the constant pool"));
        }
        Skip(8);
        ++i;
        break;
      case CONSTANT_Class:
      case CONSTANT_String:
      case CONSTANT_MethodType:
      case CONSTANT_Module:
      case CONSTANT_Package:
        Skip(2);
        break;
      case CONSTANT_Fieldref:
      case CONSTANT_Methodref:
      case CONSTANT_InterfaceMethodref:
      case CONSTANT_NameAndType:
      case CONSTANT_Dynamic:
      case CONSTANT_InvokeDynamic:
        Skip(4);
        break;
      case CONSTANT_MethodHandle:
        Skip(3);
        break;
      default:
        if (failed()) {
          return false;
        }
        return Fail(absl::StrCat("unknown constant pool tag ",
                                 static_cast<int>(tag), " at index ", i));
    }
    if (failed()) {
      return false;
    }
  }
  return true;
}

bool ClassReader::CheckIndex(uint16_t index, uint8_t tag) {
  if (failed()) {
    return false;
  }
  if (index == 0 || index >= pool_.size()) {
    return Fail(
        absl::StrCat("constant pool index ", index, " is out of range"));
  }
  if (pool_[index].tag != tag) {
    return Fail(absl::StrCat("constant pool entry ", index, " has tag ",
                             static_cast<int>(pool_[index].tag), ", expected ",
                             static_cast<int>(tag)));
  }
  return true;
}

bool ClassReader::Utf8At(uint16_t index, std::string *value) {
  if (!CheckIndex(index, CONSTANT_Utf8)) {
    return false;
  }
  size_t saved = pos_;
  pos_ = pool_[index].offset;
  uint16_t length = ReadU2();
  if (!Require(length)) {
    return false;
  }
  // Modified UTF-8 is kept as is; it is written back byte for byte.
  value->assign(reinterpret_cast<const char *>(data_ + pos_), length);
  pos_ = saved;
  return true;
}

bool ClassReader::ClassNameAt(uint16_t index, std::string *name) {
  if (!CheckIndex(index, CONSTANT_Class)) {
    return false;
  }
  size_t saved = pos_;
  pos_ = pool_[index].offset;
  uint16_t name_index = ReadU2();
  pos_ = saved;
  return Utf8At(name_index, name);
}

bool ClassReader::IntegerAt(uint16_t index, uint8_t tag, uint64_t *bits) {
  if (!CheckIndex(index, tag)) {
    return false;
  }
  size_t saved = pos_;
  pos_ = pool_[index].offset;
  if (tag == CONSTANT_Long || tag == CONSTANT_Double) {
    *bits = ReadU8();
  } else {
    *bits = ReadU4();
  }
  pos_ = saved;
  return !failed();
}

bool ClassReader::ConstantAt(uint16_t index, const std::string &descriptor,
                             Constant *value) {
  if (failed()) {
    return false;
  }
  if (index == 0 || index >= pool_.size()) {
    return Fail(
        absl::StrCat("constant pool index ", index, " is out of range"));
  }
  uint64_t bits;
  switch (pool_[index].tag) {
    case CONSTANT_Integer:
      if (!IntegerAt(index, CONSTANT_Integer, &bits)) {
        return false;
      }
      // The field type says whether the int is really a boolean, byte, char
      // or short.
      if (descriptor.empty() ||
          !Constant::FromIntegerTag(descriptor[0], static_cast<int32_t>(bits),
                                    value)) {
        *value = Constant::Int(static_cast<int32_t>(bits));
      }
      return true;
    case CONSTANT_Float:
      if (!IntegerAt(index, CONSTANT_Float, &bits)) {
        return false;
      }
      *value = Constant::FloatBits(static_cast<uint32_t>(bits));
      return true;
    case CONSTANT_Long:
      if (!IntegerAt(index, CONSTANT_Long, &bits)) {
        return false;
      }
      *value = Constant::Long(static_cast<int64_t>(bits));
      return true;
    case CONSTANT_Double:
      if (!IntegerAt(index, CONSTANT_Double, &bits)) {
        return false;
      }
      *value = Constant::DoubleBits(bits);
      return true;
    case CONSTANT_String: {
      size_t saved = pos_;
      pos_ = pool_[index].offset;
      uint16_t string_index = ReadU2();
      pos_ = saved;
      std::string text;
      if (!Utf8At(string_index, &text)) {
        return false;
      }
      *value = Constant::String(text);
      return true;
    }
    default:
      return Fail(absl::StrCat("constant pool entry ", index,
                               " is not a constant value"));
  }
}

bool ClassReader::ReadAttributes(Attributes *attributes) {
  uint16_t count = ReadU2();
  for (uint16_t i = 0; i < count; ++i) {
    uint16_t name_index = ReadU2();
    uint32_t length = ReadU4();
    std::string name;
    if (!Utf8At(name_index, &name) || !Require(length)) {
      return false;
    }
    size_t *offset = nullptr;
    size_t min_length = 0;
    if (name == "Signature") {
      offset = &attributes->signature;
      min_length = 2;
    } else if (name == "ConstantValue") {
      offset = &attributes->constant_value;
      min_length = 2;
    } else if (name == "Exceptions") {
      offset = &attributes->exceptions;
      min_length = 2;
    } else if (name == "AnnotationDefault") {
      offset = &attributes->annotation_default;
      min_length = 1;
    } else if (name == "RuntimeVisibleAnnotations") {
      offset = &attributes->visible_annotations;
      min_length = 2;
    } else if (name == "RuntimeInvisibleAnnotations") {
      offset = &attributes->invisible_annotations;
      min_length = 2;
    } else if (name == "RuntimeVisibleParameterAnnotations") {
      offset = &attributes->visible_parameter_annotations;
      min_length = 1;
    } else if (name == "RuntimeInvisibleParameterAnnotations") {
      offset = &attributes->invisible_parameter_annotations;
      min_length = 1;
    } else if (name == "Deprecated") {
      attributes->deprecated = true;
    }
    if (offset != nullptr) {
      if (length < min_length) {
        return Fail(absl::StrCat(name, " attribute at offset ", pos_,
                                 " is too short"));
      }
      *offset = pos_;
    }
    Skip(length);
  }
  return !failed();
}

bool ClassReader::SkipMembers() {
  uint16_t count = ReadU2();
  for (uint16_t i = 0; i < count; ++i) {
    Skip(6);  // access_flags, name_index, descriptor_index
    Attributes ignored;
    if (!ReadAttributes(&ignored)) {
      return false;
    }
  }
  return !failed();
}

bool ClassReader::ReadField(ClassVisitor *visitor) {
  uint32_t access = ReadU2();
  std::string name;
  std::string descriptor;
  if (!Utf8At(ReadU2(), &name) || !Utf8At(ReadU2(), &descriptor)) {
    return false;
  }
  Attributes attributes;
  if (!ReadAttributes(&attributes)) {
    return false;
  }
  size_t end = pos_;

  std::string signature;
  if (attributes.signature != 0) {
    pos_ = attributes.signature;
    if (!Utf8At(ReadU2(), &signature)) {
      return false;
    }
  }
  Constant value;
  if (attributes.constant_value != 0) {
    pos_ = attributes.constant_value;
    if (!ConstantAt(ReadU2(), descriptor, &value)) {
      return false;
    }
  }
  if (attributes.deprecated) {
    access |= kAccDeprecated;
  }

  FieldVisitor *field = visitor->VisitField(
      access, name, descriptor,
      attributes.signature != 0 ? &signature : nullptr,
      attributes.constant_value != 0 ? &value : nullptr);
  if (!ReadAnnotations(attributes.visible_annotations,
                       [field](const std::string &annotation) {
                         return field->VisitAnnotation(annotation, true);
                       }) ||
      !ReadAnnotations(attributes.invisible_annotations,
                       [field](const std::string &annotation) {
                         return field->VisitAnnotation(annotation, false);
                       })) {
    return false;
  }
  field->VisitEnd();
  pos_ = end;
  return true;
}

bool ClassReader::ReadMethod(ClassVisitor *visitor) {
  uint32_t access = ReadU2();
  std::string name;
  std::string descriptor;
  if (!Utf8At(ReadU2(), &name) || !Utf8At(ReadU2(), &descriptor)) {
    return false;
  }
  Attributes attributes;
  if (!ReadAttributes(&attributes)) {
    return false;
  }
  size_t end = pos_;

  std::string signature;
  if (attributes.signature != 0) {
    pos_ = attributes.signature;
    if (!Utf8At(ReadU2(), &signature)) {
      return false;
    }
  }
  std::vector<std::string> exceptions;
  if (attributes.exceptions != 0) {
    pos_ = attributes.exceptions;
    uint16_t count = ReadU2();
    exceptions.resize(count);
    for (uint16_t i = 0; i < count; ++i) {
      if (!ClassNameAt(ReadU2(), &exceptions[i])) {
        return false;
      }
    }
  }
  if (attributes.deprecated) {
    access |= kAccDeprecated;
  }

  MethodVisitor *method = visitor->VisitMethod(
      access, name, descriptor,
      attributes.signature != 0 ? &signature : nullptr,
      attributes.exceptions != 0 ? &exceptions : nullptr);
  if (attributes.annotation_default != 0) {
    pos_ = attributes.annotation_default;
    AnnotationVisitor *value = method->VisitAnnotationDefault();
    if (!ReadElementValue(value, std::string(), 0)) {
      return false;
    }
    value->VisitEnd();
  }
  if (!ReadAnnotations(attributes.visible_annotations,
                       [method](const std::string &annotation) {
                         return method->VisitAnnotation(annotation, true);
                       }) ||
      !ReadAnnotations(attributes.invisible_annotations,
                       [method](const std::string &annotation) {
                         return method->VisitAnnotation(annotation, false);
                       }) ||
      !ReadParameterAnnotations(attributes.visible_parameter_annotations,
                                true, method) ||
      !ReadParameterAnnotations(attributes.invisible_parameter_annotations,
                                false, method)) {
    return false;
  }
  method->VisitEnd();
  pos_ = end;
  return true;
}

template <typename Open>
bool ClassReader::ReadAnnotations(size_t offset, Open open) {
  if (offset == 0) {
    return true;
  }
  pos_ = offset;
  uint16_t count = ReadU2();
  for (uint16_t i = 0; i < count; ++i) {
    std::string descriptor;
    if (!Utf8At(ReadU2(), &descriptor)) {
      return false;
    }
    if (!ReadAnnotationValues(open(descriptor), 0)) {
      return false;
    }
  }
  return !failed();
}

bool ClassReader::ReadParameterAnnotations(size_t offset, bool visible,
                                           MethodVisitor *method) {
  if (offset == 0) {
    return true;
  }
  pos_ = offset;
  uint8_t parameters = ReadU1();
  if (failed()) {
    return false;
  }
  method->VisitAnnotableParameterCount(parameters, visible);
  for (int parameter = 0; parameter < parameters; ++parameter) {
    if (!ReadAnnotations(pos_, [method, parameter, visible](
                                   const std::string &descriptor) {
          return method->VisitParameterAnnotation(parameter, descriptor,
                                                  visible);
        })) {
      return false;
    }
  }
  return true;
}

bool ClassReader::ReadAnnotationValues(AnnotationVisitor *visitor, int depth) {
  uint16_t count = ReadU2();
  for (uint16_t i = 0; i < count; ++i) {
    std::string name;
    if (!Utf8At(ReadU2(), &name) || !ReadElementValue(visitor, name, depth)) {
      return false;
    }
  }
  if (failed()) {
    return false;
  }
  visitor->VisitEnd();
  return true;
}

bool ClassReader::ReadElementValue(AnnotationVisitor *visitor,
                                   const std::string &name, int depth) {
  if (depth > kMaxAnnotationDepth) {
    return Fail("annotation values are nested too deeply");
  }
  uint8_t tag = ReadU1();
  uint64_t bits;
  switch (tag) {
    case 'B':
    case 'C':
    case 'I':
    case 'S':
    case 'Z': {
      if (!IntegerAt(ReadU2(), CONSTANT_Integer, &bits)) {
        return false;
      }
      Constant value;
      Constant::FromIntegerTag(static_cast<char>(tag),
                               static_cast<int32_t>(bits), &value);
      visitor->Visit(name, value);
      return true;
    }
    case 'J':
      if (!IntegerAt(ReadU2(), CONSTANT_Long, &bits)) {
        return false;
      }
      visitor->Visit(name, Constant::Long(static_cast<int64_t>(bits)));
      return true;
    case 'F':
      if (!IntegerAt(ReadU2(), CONSTANT_Float, &bits)) {
        return false;
      }
      visitor->Visit(name, Constant::FloatBits(static_cast<uint32_t>(bits)));
      return true;
    case 'D':
      if (!IntegerAt(ReadU2(), CONSTANT_Double, &bits)) {
        return false;
      }
      visitor->Visit(name, Constant::DoubleBits(bits));
      return true;
    case 's':
    case 'c': {
      std::string text;
      if (!Utf8At(ReadU2(), &text)) {
        return false;
      }
      visitor->Visit(name, tag == 's' ? Constant::String(text)
                                      : Constant::Class(text));
      return true;
    }
    case 'e': {
      std::string descriptor;
      std::string value;
      if (!Utf8At(ReadU2(), &descriptor) || !Utf8At(ReadU2(), &value)) {
        return false;
      }
      visitor->VisitEnum(name, descriptor, value);
      return true;
    }
    case '@': {
      std::string descriptor;
      if (!Utf8At(ReadU2(), &descriptor)) {
        return false;
      }
      return ReadAnnotationValues(visitor->VisitAnnotation(name, descriptor),
                                  depth + 1);
    }
    case '[': {
      uint16_t count = ReadU2();
      if (failed()) {
        return false;
      }
      AnnotationVisitor *array = visitor->VisitArray(name);
      for (uint16_t i = 0; i < count; ++i) {
        if (!ReadElementValue(array, std::string(), depth + 1)) {
          return false;
        }
      }
      array->VisitEnd();
      return true;
    }
    default:
      if (failed()) {
        return false;
      }
      return Fail(absl::StrCat("unknown element value tag ",
                               static_cast<int>(tag), " at offset ",
                               pos_ - 1));
  }
}

}  // namespace abimirror

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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_READER_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_READER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/constant_pool.h"
#include "src/tools/abimirror/visitors.h"

namespace abimirror {

// Parses a class file and reports the declarations relevant to its ABI to a
// ClassVisitor. Method bodies, debug information and every attribute other
// than ConstantValue, Signature, Exceptions, AnnotationDefault, Deprecated,
// Runtime(In)VisibleAnnotations and Runtime(In)VisibleParameterAnnotations
// are skipped.
//
// The reader does not copy its input; `data` must outlive it.
class ClassReader {
 public:
  ClassReader(const uint8_t *data, size_t size);

  // Drives `visitor` through the class. Returns false and sets `error` if the
  // class file is malformed. Events delivered before the problem was found
  // are not retracted.
  bool Accept(ClassVisitor *visitor, std::string *error);

 private:
  // Location of a constant pool entry; `offset` points past its tag byte.
  struct PoolEntry {
    uint8_t tag;
    size_t offset;
  };

  // Locations of the attributes of one class or member.
  struct Attributes {
    Attributes()
        : signature(0),
          constant_value(0),
          exceptions(0),
          annotation_default(0),
          visible_annotations(0),
          invisible_annotations(0),
          visible_parameter_annotations(0),
          invisible_parameter_annotations(0),
          deprecated(false) {}
    // Each offset is that of the attribute's info, or 0 if absent.
    size_t signature;
    size_t constant_value;
    size_t exceptions;
    size_t annotation_default;
    size_t visible_annotations;
    size_t invisible_annotations;
    size_t visible_parameter_annotations;
    size_t invisible_parameter_annotations;
    bool deprecated;
  };

  bool ReadClass(ClassVisitor *visitor);

  bool Fail(const std::string &message);
  bool failed() const { return !error_.empty(); }
  bool Require(size_t count);

  uint8_t ReadU1();
  uint16_t ReadU2();
  uint32_t ReadU4();
  uint64_t ReadU8();
  void Skip(size_t count);

  bool ReadConstantPool();
  bool CheckIndex(uint16_t index, uint8_t tag);
  bool Utf8At(uint16_t index, std::string *value);
  bool ClassNameAt(uint16_t index, std::string *name);
  bool ConstantAt(uint16_t index, const std::string &descriptor,
                  Constant *value);
  bool IntegerAt(uint16_t index, uint8_t tag, uint64_t *bits);

  bool ReadAttributes(Attributes *attributes);
  bool SkipMembers();
  bool ReadField(ClassVisitor *visitor);
  bool ReadMethod(ClassVisitor *visitor);

  // Delivers the annotations stored at `offset` (0 means none) to the
  // visitors returned by `open`.
  template <typename Open>
  bool ReadAnnotations(size_t offset, Open open);
  bool ReadParameterAnnotations(size_t offset, bool visible,
                                MethodVisitor *method);
  bool ReadAnnotationValues(AnnotationVisitor *visitor, int depth);
  bool ReadElementValue(AnnotationVisitor *visitor, const std::string &name,
                        int depth);

  const uint8_t *data_;
  size_t size_;
  size_t pos_;
  std::string error_;
  std::vector<PoolEntry> pool_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_READER_H_

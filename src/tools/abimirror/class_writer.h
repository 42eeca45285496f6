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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_WRITER_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_WRITER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "src/tools/abimirror/byte_vector.h"
#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/constant_pool.h"
#include "src/tools/abimirror/visitors.h"

namespace abimirror {

// Writes annotation element values into a buffer shared with its parent.
// Nested annotations and arrays write into the same buffer, which works
// because the visitor protocol finishes a nested value before the next one
// starts.
class AnnotationWriter : public AnnotationVisitor {
 public:
  // Used for `count_offset` when no element count precedes the values, as
  // in an AnnotationDefault attribute.
  static const size_t kNoCount;

  // `named` is true for element_value_pairs and false for array elements
  // and annotation defaults. At VisitEnd the number of values written is
  // stored in the u2 at `count_offset` in `out`.
  AnnotationWriter(ConstantPool *pool, ByteVector *out, bool named,
                   size_t count_offset);

  void Visit(const std::string &name, const Constant &value) override;
  void VisitEnum(const std::string &name, const std::string &descriptor,
                 const std::string &value) override;
  AnnotationVisitor *VisitAnnotation(const std::string &name,
                                     const std::string &descriptor) override;
  AnnotationVisitor *VisitArray(const std::string &name) override;
  void VisitEnd() override;

 private:
  // Starts the next value: its name, if named, and nothing else.
  void BeginValue(const std::string &name);

  ConstantPool *pool_;
  ByteVector *out_;
  const bool named_;
  const size_t count_offset_;
  uint16_t count_;
  std::unique_ptr<AnnotationWriter> nested_;
};

// The visible and invisible annotations of one class, field or method.
class AnnotationSet {
 public:
  AnnotationVisitor *Add(ConstantPool *pool, const std::string &descriptor,
                         bool visible);
  // Number of attributes Put will write.
  int attribute_count() const;
  void Put(ConstantPool *pool, ByteVector *out) const;

  uint16_t count(bool visible) const {
    return visible ? visible_.count : invisible_.count;
  }
  // Writes one side as the num_annotations and annotations of a
  // parameter_annotations entry.
  void PutAnnotations(bool visible, ByteVector *out) const;

 private:
  struct Attribute {
    Attribute() : count(0) {}
    uint16_t count;
    ByteVector annotations;
  };

  static void PutAttribute(ConstantPool *pool, const char *name,
                           const Attribute &attribute, ByteVector *out);

  Attribute visible_;
  Attribute invisible_;
  std::unique_ptr<AnnotationWriter> current_;
};

class FieldWriter;
class MethodWriter;

// Builds a class file from ClassVisitor events. Only declarations are
// written: the output has no Code attributes, so every method is a
// signature without a body.
//
// A ClassWriter builds one class. ToByteArray is valid after VisitEnd.
class ClassWriter : public ClassVisitor {
 public:
  ClassWriter();
  ~ClassWriter() override;

  void Visit(uint32_t version, uint32_t access, const std::string &name,
             const std::string *signature, const std::string *super_name,
             const std::vector<std::string> *interfaces) override;
  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override;
  FieldVisitor *VisitField(uint32_t access, const std::string &name,
                           const std::string &descriptor,
                           const std::string *signature,
                           const Constant *value) override;
  MethodVisitor *VisitMethod(
      uint32_t access, const std::string &name, const std::string &descriptor,
      const std::string *signature,
      const std::vector<std::string> *exceptions) override;
  void VisitEnd() override;

  std::vector<uint8_t> ToByteArray();

 private:
  ConstantPool pool_;
  uint32_t version_;
  uint32_t access_;
  uint16_t this_class_;
  uint16_t super_class_;
  uint16_t signature_;
  std::vector<uint16_t> interfaces_;
  AnnotationSet annotations_;
  std::vector<std::unique_ptr<FieldWriter>> fields_;
  std::vector<std::unique_ptr<MethodWriter>> methods_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_WRITER_H_

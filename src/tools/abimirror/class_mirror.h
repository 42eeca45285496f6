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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_MIRROR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_MIRROR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/tools/abimirror/annotation_mirror.h"
#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/field_mirror.h"
#include "src/tools/abimirror/method_mirror.h"
#include "src/tools/abimirror/visitors.h"

namespace abimirror {

class AbiJarWriter;

// The ABI of one class file.
//
// A ClassMirror is populated by a single ClassReader pass. It drops private
// fields, private methods and bridge methods, keeps everything else that the
// reader delivers, and replays the class with its annotations, fields and
// methods each sorted by their own content, so the result does not depend on
// the order in which the compiler emitted them.
//
// Populating a mirror is not thread-safe; distinct mirrors are independent.
class ClassMirror : public ClassVisitor {
 public:
  // `file_name` is the entry name of the class in its jar, for example
  // "com/example/Foo.class".
  explicit ClassMirror(const std::string &file_name);

  ClassMirror(const ClassMirror &) = delete;
  ClassMirror &operator=(const ClassMirror &) = delete;

  const std::string &file_name() const { return file_name_; }
  uint32_t version() const { return version_; }
  uint32_t access() const { return access_; }
  const std::string &name() const { return name_; }
  const std::optional<std::string> &signature() const { return signature_; }
  const std::optional<std::string> &super_name() const { return super_name_; }
  const std::optional<std::vector<std::string>> &interfaces() const {
    return interfaces_;
  }

  // The retained members and annotations in canonical order.
  std::vector<const AnnotationMirror *> annotations() const;
  std::vector<const FieldMirror *> fields() const;
  std::vector<const MethodMirror *> methods() const;

  // ClassVisitor. Visit must come first and only once.
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
  void VisitEnd() override {}

  // Replays the header, then the annotations, fields and methods in
  // canonical order, then ends `visitor`.
  void Accept(ClassVisitor *visitor) const;

  // Returns the ABI class file.
  std::vector<uint8_t> ToByteArray() const;

  // Adds the ABI class file to `writer` as an entry named file_name().
  // Writing the same mirror again produces identical bytes.
  bool WriteTo(AbiJarWriter *writer) const;

  // Orders by file name.
  bool operator<(const ClassMirror &other) const {
    return file_name_ < other.file_name_;
  }

 private:
  const std::string file_name_;
  bool visited_;
  uint32_t version_;
  uint32_t access_;
  std::string name_;
  std::optional<std::string> signature_;
  std::optional<std::string> super_name_;
  std::optional<std::vector<std::string>> interfaces_;
  std::vector<std::unique_ptr<AnnotationMirror>> annotations_;
  std::vector<std::unique_ptr<FieldMirror>> fields_;
  std::vector<std::unique_ptr<MethodMirror>> methods_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_CLASS_MIRROR_H_

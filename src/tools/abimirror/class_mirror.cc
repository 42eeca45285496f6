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

#include "src/tools/abimirror/class_mirror.h"

#include <string>
#include <vector>

#include "src/main/cpp/util/logging.h"
#include "src/tools/abimirror/abi_jar_writer.h"
#include "src/tools/abimirror/canonical_order.h"
#include "src/tools/abimirror/class_writer.h"

namespace abimirror {

ClassMirror::ClassMirror(const std::string &file_name)
    : file_name_(file_name), visited_(false), version_(0), access_(0) {}

std::vector<const AnnotationMirror *> ClassMirror::annotations() const {
  return CanonicalOrder(annotations_);
}

std::vector<const FieldMirror *> ClassMirror::fields() const {
  return CanonicalOrder(fields_);
}

std::vector<const MethodMirror *> ClassMirror::methods() const {
  return CanonicalOrder(methods_);
}

void ClassMirror::Visit(uint32_t version, uint32_t access,
                        const std::string &name, const std::string *signature,
                        const std::string *super_name,
                        const std::vector<std::string> *interfaces) {
  ABIMIRROR_CHECK(!visited_) << file_name_ << ": class header visited twice";
  visited_ = true;
  version_ = version;
  access_ = access;
  name_ = name;
  if (signature != nullptr) {
    signature_ = *signature;
  }
  if (super_name != nullptr) {
    super_name_ = *super_name;
  }
  if (interfaces != nullptr) {
    interfaces_ = *interfaces;
  }
}

AnnotationVisitor *ClassMirror::VisitAnnotation(const std::string &descriptor,
                                                bool visible) {
  annotations_.emplace_back(new AnnotationMirror(descriptor, visible));
  return annotations_.back().get();
}

FieldVisitor *ClassMirror::VisitField(uint32_t access, const std::string &name,
                                      const std::string &descriptor,
                                      const std::string *signature,
                                      const Constant *value) {
  if (access & kAccPrivate) {
    return NullFieldVisitor::Instance();
  }
  fields_.emplace_back(
      new FieldMirror(access, name, descriptor, signature, value));
  return fields_.back().get();
}

MethodVisitor *ClassMirror::VisitMethod(
    uint32_t access, const std::string &name, const std::string &descriptor,
    const std::string *signature, const std::vector<std::string> *exceptions) {
  if ((access & kAccPrivate) || (access & kAccBridge)) {
    return NullMethodVisitor::Instance();
  }
  methods_.emplace_back(
      new MethodMirror(access, name, descriptor, signature, exceptions));
  return methods_.back().get();
}

void ClassMirror::Accept(ClassVisitor *visitor) const {
  ABIMIRROR_CHECK(visited_) << file_name_ << ": no class header to replay";
  visitor->Visit(version_, access_, name_,
                 signature_ ? &*signature_ : nullptr,
                 super_name_ ? &*super_name_ : nullptr,
                 interfaces_ ? &*interfaces_ : nullptr);
  for (const AnnotationMirror *annotation : annotations()) {
    annotation->AppendTo(visitor);
  }
  for (const FieldMirror *field : fields()) {
    field->AppendTo(visitor);
  }
  for (const MethodMirror *method : methods()) {
    method->AppendTo(visitor);
  }
  visitor->VisitEnd();
}

std::vector<uint8_t> ClassMirror::ToByteArray() const {
  ClassWriter writer;
  Accept(&writer);
  return writer.ToByteArray();
}

bool ClassMirror::WriteTo(AbiJarWriter *writer) const {
  std::vector<uint8_t> bytes = ToByteArray();
  return writer->WriteEntry(file_name_, bytes.data(), bytes.size());
}

}  // namespace abimirror

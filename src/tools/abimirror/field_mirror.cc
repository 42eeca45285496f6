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

#include "src/tools/abimirror/field_mirror.h"

#include <string>

#include "src/tools/abimirror/canonical_order.h"

namespace abimirror {

FieldMirror::FieldMirror(uint32_t access, const std::string &name,
                         const std::string &descriptor,
                         const std::string *signature, const Constant *value)
    : access_(access), name_(name), descriptor_(descriptor) {
  if (signature != nullptr) {
    signature_ = *signature;
  }
  if (value != nullptr) {
    value_ = *value;
  }
}

AnnotationVisitor *FieldMirror::VisitAnnotation(const std::string &descriptor,
                                                bool visible) {
  annotations_.emplace_back(new AnnotationMirror(descriptor, visible));
  return annotations_.back().get();
}

void FieldMirror::AppendTo(ClassVisitor *visitor) const {
  FieldVisitor *field = visitor->VisitField(
      access_, name_, descriptor_, signature_ ? &*signature_ : nullptr,
      value_ ? &*value_ : nullptr);
  for (const AnnotationMirror *annotation : CanonicalOrder(annotations_)) {
    annotation->AppendTo(field);
  }
  field->VisitEnd();
}

bool FieldMirror::operator<(const FieldMirror &other) const {
  if (name_ != other.name_) {
    return name_ < other.name_;
  }
  return descriptor_ < other.descriptor_;
}

}  // namespace abimirror

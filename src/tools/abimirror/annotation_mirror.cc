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

#include "src/tools/abimirror/annotation_mirror.h"

#include <memory>
#include <string>

namespace abimirror {

AnnotationValues::Value *AnnotationValues::Add(Value::Kind kind,
                                               const std::string &name) {
  values_.emplace_back();
  Value *value = &values_.back();
  value->kind = kind;
  value->name = name;
  return value;
}

void AnnotationValues::Visit(const std::string &name, const Constant &value) {
  Add(Value::kConstant, name)->constant = value;
}

void AnnotationValues::VisitEnum(const std::string &name,
                                 const std::string &descriptor,
                                 const std::string &value) {
  Value *added = Add(Value::kEnum, name);
  added->descriptor = descriptor;
  added->enum_value = value;
}

AnnotationVisitor *AnnotationValues::VisitAnnotation(
    const std::string &name, const std::string &descriptor) {
  Value *added = Add(Value::kAnnotation, name);
  added->descriptor = descriptor;
  added->nested.reset(new AnnotationValues());
  return added->nested.get();
}

AnnotationVisitor *AnnotationValues::VisitArray(const std::string &name) {
  Value *added = Add(Value::kArray, name);
  added->nested.reset(new AnnotationValues());
  return added->nested.get();
}

void AnnotationValues::Accept(AnnotationVisitor *visitor) const {
  for (const Value &value : values_) {
    switch (value.kind) {
      case Value::kConstant:
        visitor->Visit(value.name, value.constant);
        break;
      case Value::kEnum:
        visitor->VisitEnum(value.name, value.descriptor, value.enum_value);
        break;
      case Value::kAnnotation:
        value.nested->Accept(
            visitor->VisitAnnotation(value.name, value.descriptor));
        break;
      case Value::kArray:
        value.nested->Accept(visitor->VisitArray(value.name));
        break;
    }
  }
  visitor->VisitEnd();
}

void AnnotationMirror::AppendTo(ClassVisitor *visitor) const {
  Accept(visitor->VisitAnnotation(descriptor_, visible_));
}

void AnnotationMirror::AppendTo(FieldVisitor *visitor) const {
  Accept(visitor->VisitAnnotation(descriptor_, visible_));
}

void AnnotationMirror::AppendTo(MethodVisitor *visitor) const {
  Accept(visitor->VisitAnnotation(descriptor_, visible_));
}

void AnnotationMirror::AppendToParameter(MethodVisitor *visitor,
                                         int parameter) const {
  Accept(visitor->VisitParameterAnnotation(parameter, descriptor_, visible_));
}

bool AnnotationMirror::operator<(const AnnotationMirror &other) const {
  if (descriptor_ != other.descriptor_) {
    return descriptor_ < other.descriptor_;
  }
  return visible_ && !other.visible_;
}

}  // namespace abimirror

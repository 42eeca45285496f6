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

#include "src/tools/abimirror/method_mirror.h"

#include <string>
#include <vector>

#include "src/tools/abimirror/canonical_order.h"

namespace abimirror {

MethodMirror::MethodMirror(uint32_t access, const std::string &name,
                           const std::string &descriptor,
                           const std::string *signature,
                           const std::vector<std::string> *exceptions)
    : access_(access), name_(name), descriptor_(descriptor) {
  if (signature != nullptr) {
    signature_ = *signature;
  }
  if (exceptions != nullptr) {
    exceptions_ = *exceptions;
  }
}

AnnotationVisitor *MethodMirror::VisitAnnotationDefault() {
  annotation_default_.reset(new AnnotationValues());
  return annotation_default_.get();
}

AnnotationVisitor *MethodMirror::VisitAnnotation(const std::string &descriptor,
                                                 bool visible) {
  annotations_.emplace_back(new AnnotationMirror(descriptor, visible));
  return annotations_.back().get();
}

size_t MethodMirror::parameter_annotation_count(int parameter) const {
  if (parameter < 0 ||
      static_cast<size_t>(parameter) >= parameter_annotations_.size()) {
    return 0;
  }
  return parameter_annotations_[parameter].size();
}

void MethodMirror::VisitAnnotableParameterCount(int count, bool visible) {
  (visible ? visible_parameters_ : invisible_parameters_) = count;
}

AnnotationVisitor *MethodMirror::VisitParameterAnnotation(
    int parameter, const std::string &descriptor, bool visible) {
  if (parameter_annotations_.size() <= static_cast<size_t>(parameter)) {
    parameter_annotations_.resize(parameter + 1);
  }
  std::vector<std::unique_ptr<AnnotationMirror>> &annotations =
      parameter_annotations_[parameter];
  annotations.emplace_back(new AnnotationMirror(descriptor, visible));
  return annotations.back().get();
}

void MethodMirror::AppendParameterAnnotations(MethodVisitor *method,
                                              bool visible) const {
  const std::optional<int> &count =
      visible ? visible_parameters_ : invisible_parameters_;
  if (count) {
    method->VisitAnnotableParameterCount(*count, visible);
  }
  for (size_t i = 0; i < parameter_annotations_.size(); ++i) {
    for (const AnnotationMirror *annotation :
         CanonicalOrder(parameter_annotations_[i])) {
      if (annotation->visible() == visible) {
        annotation->AppendToParameter(method, static_cast<int>(i));
      }
    }
  }
}

void MethodMirror::AppendTo(ClassVisitor *visitor) const {
  MethodVisitor *method = visitor->VisitMethod(
      access_, name_, descriptor_, signature_ ? &*signature_ : nullptr,
      exceptions_ ? &*exceptions_ : nullptr);
  if (annotation_default_ != nullptr) {
    annotation_default_->Accept(method->VisitAnnotationDefault());
  }
  for (const AnnotationMirror *annotation : CanonicalOrder(annotations_)) {
    annotation->AppendTo(method);
  }
  AppendParameterAnnotations(method, true);
  AppendParameterAnnotations(method, false);
  method->VisitEnd();
}

bool MethodMirror::operator<(const MethodMirror &other) const {
  if (name_ != other.name_) {
    return name_ < other.name_;
  }
  return descriptor_ < other.descriptor_;
}

}  // namespace abimirror

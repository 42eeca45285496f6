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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_ANNOTATION_MIRROR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_ANNOTATION_MIRROR_H_

#include <memory>
#include <string>
#include <vector>

#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/visitors.h"

namespace abimirror {

// The element values of an annotation, an array value or an annotation
// default, recorded in the order they were visited.
class AnnotationValues : public AnnotationVisitor {
 public:
  AnnotationValues() {}
  AnnotationValues(const AnnotationValues &) = delete;
  AnnotationValues &operator=(const AnnotationValues &) = delete;

  void Visit(const std::string &name, const Constant &value) override;
  void VisitEnum(const std::string &name, const std::string &descriptor,
                 const std::string &value) override;
  AnnotationVisitor *VisitAnnotation(const std::string &name,
                                     const std::string &descriptor) override;
  AnnotationVisitor *VisitArray(const std::string &name) override;
  void VisitEnd() override {}

  // Replays the recorded values into `visitor`, then ends it.
  void Accept(AnnotationVisitor *visitor) const;

  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

 private:
  struct Value {
    enum Kind { kConstant, kEnum, kAnnotation, kArray };

    Kind kind;
    std::string name;
    Constant constant;
    // The annotation or enum type.
    std::string descriptor;
    std::string enum_value;
    // Values of a nested annotation or the elements of an array.
    std::unique_ptr<AnnotationValues> nested;
  };

  Value *Add(Value::Kind kind, const std::string &name);

  std::vector<Value> values_;
};

// An annotation declared on a class, field, method or method parameter.
class AnnotationMirror : public AnnotationValues {
 public:
  AnnotationMirror(const std::string &descriptor, bool visible)
      : descriptor_(descriptor), visible_(visible) {}

  const std::string &descriptor() const { return descriptor_; }
  bool visible() const { return visible_; }

  // Declares this annotation on the target and replays its values there.
  void AppendTo(ClassVisitor *visitor) const;
  void AppendTo(FieldVisitor *visitor) const;
  void AppendTo(MethodVisitor *visitor) const;
  void AppendToParameter(MethodVisitor *visitor, int parameter) const;

  // Orders by descriptor; a visible annotation precedes an invisible one of
  // the same type.
  bool operator<(const AnnotationMirror &other) const;

 private:
  const std::string descriptor_;
  const bool visible_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_ANNOTATION_MIRROR_H_

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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_METHOD_MIRROR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_METHOD_MIRROR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/tools/abimirror/annotation_mirror.h"
#include "src/tools/abimirror/visitors.h"

namespace abimirror {

// A method retained in an ABI class. Only the declaration is kept; the body
// was never delivered by the reader.
class MethodMirror : public MethodVisitor {
 public:
  MethodMirror(uint32_t access, const std::string &name,
               const std::string &descriptor, const std::string *signature,
               const std::vector<std::string> *exceptions);

  uint32_t access() const { return access_; }
  const std::string &name() const { return name_; }
  const std::string &descriptor() const { return descriptor_; }
  const std::optional<std::string> &signature() const { return signature_; }
  const std::optional<std::vector<std::string>> &exceptions() const {
    return exceptions_;
  }
  bool has_annotation_default() const { return annotation_default_ != nullptr; }
  size_t annotation_count() const { return annotations_.size(); }
  size_t parameter_annotation_count(int parameter) const;

  AnnotationVisitor *VisitAnnotationDefault() override;
  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override;
  void VisitAnnotableParameterCount(int count, bool visible) override;
  AnnotationVisitor *VisitParameterAnnotation(int parameter,
                                              const std::string &descriptor,
                                              bool visible) override;
  void VisitEnd() override {}

  // Declares this method on `visitor`: the header, the annotation default
  // if any, the annotations in canonical order, then for each visibility the
  // annotable parameter count and the parameter annotations, by parameter
  // and in canonical order.
  void AppendTo(ClassVisitor *visitor) const;

  // Orders by name, then descriptor, so overloads are ordered by their
  // parameter and return types.
  bool operator<(const MethodMirror &other) const;

 private:
  void AppendParameterAnnotations(MethodVisitor *method, bool visible) const;

  const uint32_t access_;
  const std::string name_;
  const std::string descriptor_;
  std::optional<std::string> signature_;
  std::optional<std::vector<std::string>> exceptions_;
  std::unique_ptr<AnnotationValues> annotation_default_;
  std::vector<std::unique_ptr<AnnotationMirror>> annotations_;
  std::optional<int> visible_parameters_;
  std::optional<int> invisible_parameters_;
  // Indexed by parameter.
  std::vector<std::vector<std::unique_ptr<AnnotationMirror>>>
      parameter_annotations_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_METHOD_MIRROR_H_

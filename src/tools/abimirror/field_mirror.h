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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_FIELD_MIRROR_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_FIELD_MIRROR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/tools/abimirror/annotation_mirror.h"
#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/visitors.h"

namespace abimirror {

// A field retained in an ABI class.
class FieldMirror : public FieldVisitor {
 public:
  FieldMirror(uint32_t access, const std::string &name,
              const std::string &descriptor, const std::string *signature,
              const Constant *value);

  uint32_t access() const { return access_; }
  const std::string &name() const { return name_; }
  const std::string &descriptor() const { return descriptor_; }
  const std::optional<std::string> &signature() const { return signature_; }
  const std::optional<Constant> &value() const { return value_; }
  size_t annotation_count() const { return annotations_.size(); }

  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override;
  void VisitEnd() override {}

  // Declares this field on `visitor` with its annotations in canonical
  // order.
  void AppendTo(ClassVisitor *visitor) const;

  // Orders by name, then descriptor.
  bool operator<(const FieldMirror &other) const;

 private:
  const uint32_t access_;
  const std::string name_;
  const std::string descriptor_;
  std::optional<std::string> signature_;
  std::optional<Constant> value_;
  std::vector<std::unique_ptr<AnnotationMirror>> annotations_;
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_FIELD_MIRROR_H_

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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_VISITORS_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_VISITORS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "src/tools/abimirror/constant.h"

// The event protocol between a class file parser and its consumers.
//
// A ClassReader calls ClassVisitor::Visit once, then VisitAnnotation for each
// class annotation, VisitField for each field, VisitMethod for each method and
// finally VisitEnd. Nested declarations are delivered to the visitor returned
// by the enclosing call, and every returned visitor receives VisitEnd before
// the next event is delivered to its parent. A returned visitor is owned by
// the visitor that returned it and never by the caller.
//
// Optional attributes are passed as pointers that are nullptr when absent.
// Access words carry the class file flags in their low 16 bits; a Deprecated
// attribute is reported as kAccDeprecated.

namespace abimirror {

// Access flags (JVMS 4.1, 4.5, 4.6).
const uint16_t kAccPublic = 0x0001;
const uint16_t kAccPrivate = 0x0002;
const uint16_t kAccProtected = 0x0004;
const uint16_t kAccStatic = 0x0008;
const uint16_t kAccFinal = 0x0010;
const uint16_t kAccSuper = 0x0020;
const uint16_t kAccVolatile = 0x0040;
const uint16_t kAccBridge = 0x0040;
const uint16_t kAccVarargs = 0x0080;
const uint16_t kAccInterface = 0x0200;
const uint16_t kAccAbstract = 0x0400;
const uint16_t kAccSynthetic = 0x1000;
const uint16_t kAccAnnotation = 0x2000;
const uint16_t kAccEnum = 0x4000;
// Not a class file flag: stands for the Deprecated attribute.
const uint32_t kAccDeprecated = 0x20000;

class AnnotationVisitor {
 public:
  virtual ~AnnotationVisitor() {}

  // A constant element value. `name` is empty for array elements.
  virtual void Visit(const std::string &name, const Constant &value) = 0;
  virtual void VisitEnum(const std::string &name,
                         const std::string &descriptor,
                         const std::string &value) = 0;
  virtual AnnotationVisitor *VisitAnnotation(const std::string &name,
                                             const std::string &descriptor) = 0;
  virtual AnnotationVisitor *VisitArray(const std::string &name) = 0;
  virtual void VisitEnd() = 0;
};

class FieldVisitor {
 public:
  virtual ~FieldVisitor() {}

  virtual AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                             bool visible) = 0;
  virtual void VisitEnd() = 0;
};

class MethodVisitor {
 public:
  virtual ~MethodVisitor() {}

  // The default value of an annotation interface element. The returned
  // visitor receives exactly one value, with an empty name.
  virtual AnnotationVisitor *VisitAnnotationDefault() = 0;
  virtual AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                             bool visible) = 0;
  // The num_parameters of a Runtime(In)VisibleParameterAnnotations
  // attribute, which may be less than the number of parameters in the
  // descriptor. Precedes the parameter annotations of that visibility.
  virtual void VisitAnnotableParameterCount(int count, bool visible) = 0;
  virtual AnnotationVisitor *VisitParameterAnnotation(
      int parameter, const std::string &descriptor, bool visible) = 0;
  virtual void VisitEnd() = 0;
};

class ClassVisitor {
 public:
  virtual ~ClassVisitor() {}

  // `version` is minor_version << 16 | major_version. Class names are internal
  // names such as "java/lang/Object".
  virtual void Visit(uint32_t version, uint32_t access, const std::string &name,
                     const std::string *signature,
                     const std::string *super_name,
                     const std::vector<std::string> *interfaces) = 0;
  virtual AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                             bool visible) = 0;
  virtual FieldVisitor *VisitField(uint32_t access, const std::string &name,
                                   const std::string &descriptor,
                                   const std::string *signature,
                                   const Constant *value) = 0;
  virtual MethodVisitor *VisitMethod(
      uint32_t access, const std::string &name, const std::string &descriptor,
      const std::string *signature,
      const std::vector<std::string> *exceptions) = 0;
  virtual void VisitEnd() = 0;
};

// Visitors that discard everything they are given. They hold no state, so a
// single shared instance of each serves any number of threads.
class NullAnnotationVisitor : public AnnotationVisitor {
 public:
  static NullAnnotationVisitor *Instance();

  void Visit(const std::string &name, const Constant &value) override {}
  void VisitEnum(const std::string &name, const std::string &descriptor,
                 const std::string &value) override {}
  AnnotationVisitor *VisitAnnotation(const std::string &name,
                                     const std::string &descriptor) override {
    return this;
  }
  AnnotationVisitor *VisitArray(const std::string &name) override {
    return this;
  }
  void VisitEnd() override {}
};

class NullFieldVisitor : public FieldVisitor {
 public:
  static NullFieldVisitor *Instance();

  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override {
    return NullAnnotationVisitor::Instance();
  }
  void VisitEnd() override {}
};

class NullMethodVisitor : public MethodVisitor {
 public:
  static NullMethodVisitor *Instance();

  AnnotationVisitor *VisitAnnotationDefault() override {
    return NullAnnotationVisitor::Instance();
  }
  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override {
    return NullAnnotationVisitor::Instance();
  }
  void VisitAnnotableParameterCount(int count, bool visible) override {}
  AnnotationVisitor *VisitParameterAnnotation(int parameter,
                                              const std::string &descriptor,
                                              bool visible) override {
    return NullAnnotationVisitor::Instance();
  }
  void VisitEnd() override {}
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_VISITORS_H_

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

#include "src/tools/abimirror/class_writer.h"

#include <memory>
#include <string>
#include <vector>

#include "src/main/cpp/util/logging.h"

namespace abimirror {

namespace {

const uint32_t kClassMagic = 0xCAFEBABE;

void PutSignature(ConstantPool *pool, uint16_t signature, ByteVector *out) {
  out->PutU2(pool->AddUtf8("Signature"));
  out->PutU4(2);
  out->PutU2(signature);
}

int DeprecatedCount(uint32_t access) {
  return (access & kAccDeprecated) != 0 ? 1 : 0;
}

void PutDeprecated(ConstantPool *pool, uint32_t access, ByteVector *out) {
  if ((access & kAccDeprecated) != 0) {
    out->PutU2(pool->AddUtf8("Deprecated"));
    out->PutU4(0);
  }
}

}  // namespace

const size_t AnnotationWriter::kNoCount = static_cast<size_t>(-1);

AnnotationWriter::AnnotationWriter(ConstantPool *pool, ByteVector *out,
                                   bool named, size_t count_offset)
    : pool_(pool),
      out_(out),
      named_(named),
      count_offset_(count_offset),
      count_(0) {}

void AnnotationWriter::BeginValue(const std::string &name) {
  ABIMIRROR_CHECK_LT(count_, 0xFFFF) << "too many annotation values";
  ++count_;
  if (named_) {
    out_->PutU2(pool_->AddUtf8(name));
  }
}

void AnnotationWriter::Visit(const std::string &name, const Constant &value) {
  BeginValue(name);
  out_->PutU1(static_cast<uint8_t>(value.tag()));
  switch (value.kind()) {
    case Constant::kLong:
      out_->PutU2(pool_->AddLong(value.long_value()));
      break;
    case Constant::kFloat:
      out_->PutU2(pool_->AddFloat(value.float_bits()));
      break;
    case Constant::kDouble:
      out_->PutU2(pool_->AddDouble(value.double_bits()));
      break;
    case Constant::kString:
    case Constant::kClass:
      // Element values refer to the Utf8 entry directly.
      out_->PutU2(pool_->AddUtf8(value.string_value()));
      break;
    default:
      out_->PutU2(pool_->AddInteger(value.int_value()));
      break;
  }
}

void AnnotationWriter::VisitEnum(const std::string &name,
                                 const std::string &descriptor,
                                 const std::string &value) {
  BeginValue(name);
  out_->PutU1('e');
  out_->PutU2(pool_->AddUtf8(descriptor));
  out_->PutU2(pool_->AddUtf8(value));
}

AnnotationVisitor *AnnotationWriter::VisitAnnotation(
    const std::string &name, const std::string &descriptor) {
  BeginValue(name);
  out_->PutU1('@');
  out_->PutU2(pool_->AddUtf8(descriptor));
  size_t count_offset = out_->size();
  out_->PutU2(0);
  nested_.reset(new AnnotationWriter(pool_, out_, true, count_offset));
  return nested_.get();
}

AnnotationVisitor *AnnotationWriter::VisitArray(const std::string &name) {
  BeginValue(name);
  out_->PutU1('[');
  size_t count_offset = out_->size();
  out_->PutU2(0);
  nested_.reset(new AnnotationWriter(pool_, out_, false, count_offset));
  return nested_.get();
}

void AnnotationWriter::VisitEnd() {
  if (count_offset_ != kNoCount) {
    out_->PatchU2(count_offset_, count_);
  }
}

AnnotationVisitor *AnnotationSet::Add(ConstantPool *pool,
                                      const std::string &descriptor,
                                      bool visible) {
  Attribute &attribute = visible ? visible_ : invisible_;
  ABIMIRROR_CHECK_LT(attribute.count, 0xFFFF) << "too many annotations";
  ++attribute.count;
  attribute.annotations.PutU2(pool->AddUtf8(descriptor));
  size_t count_offset = attribute.annotations.size();
  attribute.annotations.PutU2(0);
  current_.reset(
      new AnnotationWriter(pool, &attribute.annotations, true, count_offset));
  return current_.get();
}

int AnnotationSet::attribute_count() const {
  return (visible_.count > 0 ? 1 : 0) + (invisible_.count > 0 ? 1 : 0);
}

void AnnotationSet::Put(ConstantPool *pool, ByteVector *out) const {
  PutAttribute(pool, "RuntimeVisibleAnnotations", visible_, out);
  PutAttribute(pool, "RuntimeInvisibleAnnotations", invisible_, out);
}

void AnnotationSet::PutAnnotations(bool visible, ByteVector *out) const {
  const Attribute &attribute = visible ? visible_ : invisible_;
  out->PutU2(attribute.count);
  out->PutBytes(attribute.annotations);
}

void AnnotationSet::PutAttribute(ConstantPool *pool, const char *name,
                                 const Attribute &attribute, ByteVector *out) {
  if (attribute.count == 0) {
    return;
  }
  out->PutU2(pool->AddUtf8(name));
  out->PutU4(static_cast<uint32_t>(2 + attribute.annotations.size()));
  out->PutU2(attribute.count);
  out->PutBytes(attribute.annotations);
}

class FieldWriter : public FieldVisitor {
 public:
  FieldWriter(ConstantPool *pool, uint32_t access, const std::string &name,
              const std::string &descriptor, const std::string *signature,
              const Constant *value)
      : pool_(pool),
        access_(access),
        name_(pool->AddUtf8(name)),
        descriptor_(pool->AddUtf8(descriptor)),
        signature_(signature != nullptr ? pool->AddUtf8(*signature) : 0),
        value_(value != nullptr ? pool->AddConstant(*value) : 0) {}

  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override {
    return annotations_.Add(pool_, descriptor, visible);
  }

  void VisitEnd() override {}

  void Put(ByteVector *out) const {
    out->PutU2(static_cast<uint16_t>(access_));
    out->PutU2(name_);
    out->PutU2(descriptor_);
    out->PutU2(static_cast<uint16_t>(
        (value_ != 0 ? 1 : 0) + (signature_ != 0 ? 1 : 0) +
        DeprecatedCount(access_) + annotations_.attribute_count()));
    if (value_ != 0) {
      out->PutU2(pool_->AddUtf8("ConstantValue"));
      out->PutU4(2);
      out->PutU2(value_);
    }
    if (signature_ != 0) {
      PutSignature(pool_, signature_, out);
    }
    PutDeprecated(pool_, access_, out);
    annotations_.Put(pool_, out);
  }

 private:
  ConstantPool *pool_;
  const uint32_t access_;
  const uint16_t name_;
  const uint16_t descriptor_;
  const uint16_t signature_;
  const uint16_t value_;
  AnnotationSet annotations_;
};

class MethodWriter : public MethodVisitor {
 public:
  MethodWriter(ConstantPool *pool, uint32_t access, const std::string &name,
               const std::string &descriptor, const std::string *signature,
               const std::vector<std::string> *exceptions)
      : pool_(pool),
        access_(access),
        name_(pool->AddUtf8(name)),
        descriptor_(pool->AddUtf8(descriptor)),
        signature_(signature != nullptr ? pool->AddUtf8(*signature) : 0),
        has_exceptions_(exceptions != nullptr),
        visible_parameters_(-1),
        invisible_parameters_(-1) {
    if (exceptions != nullptr) {
      for (const std::string &exception : *exceptions) {
        exceptions_.push_back(pool->AddClass(exception));
      }
    }
  }

  AnnotationVisitor *VisitAnnotationDefault() override {
    default_writer_.reset(new AnnotationWriter(
        pool_, &default_value_, false, AnnotationWriter::kNoCount));
    return default_writer_.get();
  }

  AnnotationVisitor *VisitAnnotation(const std::string &descriptor,
                                     bool visible) override {
    return annotations_.Add(pool_, descriptor, visible);
  }

  void VisitAnnotableParameterCount(int count, bool visible) override {
    ABIMIRROR_CHECK(count >= 0 && count <= 0xFF)
        << "bad annotable parameter count " << count;
    (visible ? visible_parameters_ : invisible_parameters_) = count;
  }

  AnnotationVisitor *VisitParameterAnnotation(int parameter,
                                              const std::string &descriptor,
                                              bool visible) override {
    ABIMIRROR_CHECK(parameter >= 0 && parameter < 0xFF)
        << "bad parameter index " << parameter;
    while (parameters_.size() <= static_cast<size_t>(parameter)) {
      parameters_.emplace_back(new AnnotationSet());
    }
    return parameters_[parameter]->Add(pool_, descriptor, visible);
  }

  void VisitEnd() override {}

  void Put(ByteVector *out) const {
    bool has_default = default_value_.size() > 0;
    int visible_parameters = ParameterCount(true);
    int invisible_parameters = ParameterCount(false);
    out->PutU2(static_cast<uint16_t>(access_));
    out->PutU2(name_);
    out->PutU2(descriptor_);
    out->PutU2(static_cast<uint16_t>(
        (has_exceptions_ ? 1 : 0) + (signature_ != 0 ? 1 : 0) +
        DeprecatedCount(access_) + (has_default ? 1 : 0) +
        annotations_.attribute_count() + (visible_parameters >= 0 ? 1 : 0) +
        (invisible_parameters >= 0 ? 1 : 0)));
    if (has_exceptions_) {
      out->PutU2(pool_->AddUtf8("Exceptions"));
      out->PutU4(static_cast<uint32_t>(2 + 2 * exceptions_.size()));
      out->PutU2(static_cast<uint16_t>(exceptions_.size()));
      for (uint16_t exception : exceptions_) {
        out->PutU2(exception);
      }
    }
    if (signature_ != 0) {
      PutSignature(pool_, signature_, out);
    }
    PutDeprecated(pool_, access_, out);
    if (has_default) {
      out->PutU2(pool_->AddUtf8("AnnotationDefault"));
      out->PutU4(static_cast<uint32_t>(default_value_.size()));
      out->PutBytes(default_value_);
    }
    annotations_.Put(pool_, out);
    PutParameterAnnotations("RuntimeVisibleParameterAnnotations", true,
                            visible_parameters, out);
    PutParameterAnnotations("RuntimeInvisibleParameterAnnotations", false,
                            invisible_parameters, out);
  }

 private:
  // The num_parameters to write for one visibility, or -1 for no attribute.
  // Covers every annotated parameter even if no count was visited.
  int ParameterCount(bool visible) const {
    int count = visible ? visible_parameters_ : invisible_parameters_;
    for (size_t i = 0; i < parameters_.size(); ++i) {
      if (parameters_[i]->count(visible) > 0 &&
          count <= static_cast<int>(i)) {
        count = static_cast<int>(i) + 1;
      }
    }
    return count;
  }

  void PutParameterAnnotations(const char *name, bool visible, int count,
                               ByteVector *out) const {
    if (count < 0) {
      return;
    }
    ByteVector info;
    info.PutU1(static_cast<uint8_t>(count));
    for (int i = 0; i < count; ++i) {
      if (static_cast<size_t>(i) < parameters_.size()) {
        parameters_[i]->PutAnnotations(visible, &info);
      } else {
        info.PutU2(0);
      }
    }
    out->PutU2(pool_->AddUtf8(name));
    out->PutU4(static_cast<uint32_t>(info.size()));
    out->PutBytes(info);
  }

  ConstantPool *pool_;
  const uint32_t access_;
  const uint16_t name_;
  const uint16_t descriptor_;
  const uint16_t signature_;
  const bool has_exceptions_;
  std::vector<uint16_t> exceptions_;
  ByteVector default_value_;
  std::unique_ptr<AnnotationWriter> default_writer_;
  AnnotationSet annotations_;
  // Annotable parameter counts, -1 until visited.
  int visible_parameters_;
  int invisible_parameters_;
  std::vector<std::unique_ptr<AnnotationSet>> parameters_;
};

ClassWriter::ClassWriter()
    : version_(0),
      access_(0),
      this_class_(0),
      super_class_(0),
      signature_(0) {}

ClassWriter::~ClassWriter() {}

void ClassWriter::Visit(uint32_t version, uint32_t access,
                        const std::string &name, const std::string *signature,
                        const std::string *super_name,
                        const std::vector<std::string> *interfaces) {
  version_ = version;
  access_ = access;
  this_class_ = pool_.AddClass(name);
  super_class_ = super_name != nullptr ? pool_.AddClass(*super_name) : 0;
  signature_ = signature != nullptr ? pool_.AddUtf8(*signature) : 0;
  interfaces_.clear();
  if (interfaces != nullptr) {
    for (const std::string &interface_name : *interfaces) {
      interfaces_.push_back(pool_.AddClass(interface_name));
    }
  }
}

AnnotationVisitor *ClassWriter::VisitAnnotation(const std::string &descriptor,
                                                bool visible) {
  return annotations_.Add(&pool_, descriptor, visible);
}

FieldVisitor *ClassWriter::VisitField(uint32_t access, const std::string &name,
                                      const std::string &descriptor,
                                      const std::string *signature,
                                      const Constant *value) {
  fields_.emplace_back(
      new FieldWriter(&pool_, access, name, descriptor, signature, value));
  return fields_.back().get();
}

MethodVisitor *ClassWriter::VisitMethod(
    uint32_t access, const std::string &name, const std::string &descriptor,
    const std::string *signature, const std::vector<std::string> *exceptions) {
  methods_.emplace_back(
      new MethodWriter(&pool_, access, name, descriptor, signature,
                       exceptions));
  return methods_.back().get();
}

void ClassWriter::VisitEnd() {}

std::vector<uint8_t> ClassWriter::ToByteArray() {
  ABIMIRROR_CHECK_NE(this_class_, 0) << "ToByteArray called before Visit";
  ABIMIRROR_CHECK_LE(fields_.size(), 0xFFFFu) << "too many fields";
  ABIMIRROR_CHECK_LE(methods_.size(), 0xFFFFu) << "too many methods";

  // The body goes first: writing it may add attribute names to the pool.
  ByteVector body;
  body.PutU2(static_cast<uint16_t>(access_));
  body.PutU2(this_class_);
  body.PutU2(super_class_);
  body.PutU2(static_cast<uint16_t>(interfaces_.size()));
  for (uint16_t interface_index : interfaces_) {
    body.PutU2(interface_index);
  }
  body.PutU2(static_cast<uint16_t>(fields_.size()));
  for (const auto &field : fields_) {
    field->Put(&body);
  }
  body.PutU2(static_cast<uint16_t>(methods_.size()));
  for (const auto &method : methods_) {
    method->Put(&body);
  }
  body.PutU2(static_cast<uint16_t>((signature_ != 0 ? 1 : 0) +
                                   DeprecatedCount(access_) +
                                   annotations_.attribute_count()));
  if (signature_ != 0) {
    PutSignature(&pool_, signature_, &body);
  }
  PutDeprecated(&pool_, access_, &body);
  annotations_.Put(&pool_, &body);

  ByteVector out;
  out.PutU4(kClassMagic);
  out.PutU2(static_cast<uint16_t>(version_ >> 16));
  out.PutU2(static_cast<uint16_t>(version_));
  pool_.Put(&out);
  out.PutBytes(body);
  return out.bytes();
}

}  // namespace abimirror

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

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "src/tools/abimirror/class_reader.h"
#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/test_util.h"
#include "src/tools/abimirror/visitors.h"
#include "gtest/gtest.h"

namespace abimirror {
namespace {

using abimirror_test_util::RecordingVisitor;

// Delivers a class in the order ClassReader would deliver it.
void EmitClass(ClassVisitor *cv) {
  std::vector<std::string> interfaces = {"java/lang/Comparable"};
  std::string class_signature =
      "Ljava/lang/Object;Ljava/lang/Comparable<La/A;>;";
  std::string super_name = "java/lang/Object";
  cv->Visit(52, kAccPublic | kAccSuper, "a/A", &class_signature, &super_name,
            &interfaces);

  AnnotationVisitor *av = cv->VisitAnnotation("La/Ann;", true);
  av->Visit("i", Constant::Int(1));
  av->VisitEnum("e", "La/Color;", "RED");
  AnnotationVisitor *array = av->VisitArray("arr");
  array->Visit("", Constant::String("x"));
  array->Visit("", Constant::String("y"));
  array->VisitEnd();
  AnnotationVisitor *nested = av->VisitAnnotation("n", "La/Inner;");
  nested->Visit("c", Constant::Class("La/B;"));
  nested->VisitEnd();
  av->VisitEnd();
  cv->VisitAnnotation("La/Hidden;", false)->VisitEnd();

  Constant value = Constant::Long(1LL << 33);
  FieldVisitor *fv = cv->VisitField(kAccPublic | kAccStatic | kAccFinal,
                                    "BIG", "J", nullptr, &value);
  AnnotationVisitor *fa = fv->VisitAnnotation("La/F;", false);
  fa->Visit("d", Constant::Double(0.5));
  fa->VisitEnd();
  fv->VisitEnd();
  Constant letter = Constant::Char('q');
  fv = cv->VisitField(kAccPublic | kAccStatic | kAccFinal, "LETTER", "C",
                      nullptr, &letter);
  fv->VisitEnd();
  std::string field_signature = "Ljava/util/List<La/A;>;";
  fv = cv->VisitField(kAccProtected, "list", "Ljava/util/List;",
                      &field_signature, nullptr);
  fv->VisitEnd();

  std::vector<std::string> exceptions = {"java/io/IOException"};
  std::string method_signature = "(La/A;)I";
  MethodVisitor *mv = cv->VisitMethod(kAccPublic, "compareTo", "(La/A;)I",
                                      &method_signature, &exceptions);
  AnnotationVisitor *ma = mv->VisitAnnotation("La/M;", true);
  ma->Visit("b", Constant::Boolean(true));
  ma->VisitEnd();
  mv->VisitEnd();
  std::vector<std::string> no_exceptions;
  mv = cv->VisitMethod(kAccPublic | kAccAbstract, "value", "()[I", nullptr,
                       &no_exceptions);
  AnnotationVisitor *dv = mv->VisitAnnotationDefault();
  AnnotationVisitor *default_array = dv->VisitArray("");
  default_array->Visit("", Constant::Int(1));
  default_array->VisitEnd();
  dv->VisitEnd();
  mv->VisitEnd();
  mv = cv->VisitMethod(kAccPublic | kAccStatic, "main",
                       "([Ljava/lang/String;)V", nullptr, nullptr);
  mv->VisitEnd();
  cv->VisitEnd();
}

std::string Recorded(const std::vector<uint8_t> &bytes) {
  RecordingVisitor visitor;
  std::string error;
  ClassReader reader(bytes.data(), bytes.size());
  EXPECT_TRUE(reader.Accept(&visitor, &error)) << error;
  return visitor.ToString();
}

TEST(ClassWriterTest, MinimalClass) {
  std::vector<std::string> interfaces;
  std::string super_name = "java/lang/Object";
  ClassWriter writer;
  writer.Visit(52, kAccPublic | kAccSuper, "A", nullptr, &super_name,
               &interfaces);
  writer.VisitEnd();
  std::vector<uint8_t> expected = {
      0xCA, 0xFE, 0xBA, 0xBE,  // magic
      0, 0, 0, 52,             // minor_version, major_version
      0, 5,                    // constant_pool_count
      1, 0, 1, 'A',            // #1 Utf8 A
      7, 0, 1,                 // #2 Class #1
      1, 0, 16, 'j', 'a', 'v', 'a', '/', 'l', 'a', 'n', 'g', '/',
      'O', 'b', 'j', 'e', 'c', 't',  // #3 Utf8 java/lang/Object
      7, 0, 3,                       // #4 Class #3
      0, 0x21,                       // access_flags
      0, 2,                          // this_class
      0, 4,                          // super_class
      0, 0,                          // interfaces_count
      0, 0,                          // fields_count
      0, 0,                          // methods_count
      0, 0,                          // attributes_count
  };
  EXPECT_EQ(expected, writer.ToByteArray());
}

TEST(ClassWriterTest, ReaderSeesWhatWasWritten) {
  RecordingVisitor direct;
  EmitClass(&direct);
  ClassWriter writer;
  EmitClass(&writer);
  EXPECT_EQ(direct.ToString(), Recorded(writer.ToByteArray()));
}

TEST(ClassWriterTest, SameEventsSameBytes) {
  ClassWriter writer1;
  EmitClass(&writer1);
  ClassWriter writer2;
  EmitClass(&writer2);
  EXPECT_EQ(writer1.ToByteArray(), writer2.ToByteArray());
}

TEST(ClassWriterTest, NoMethodBodies) {
  ClassWriter writer;
  EmitClass(&writer);
  std::vector<uint8_t> bytes = writer.ToByteArray();
  const std::string code = "Code";
  EXPECT_EQ(bytes.end(),
            std::search(bytes.begin(), bytes.end(), code.begin(), code.end()));
}

TEST(ClassWriterTest, VersionKeepsMinor) {
  ClassWriter writer;
  writer.Visit(3u << 16 | 45, kAccPublic, "Old", nullptr, nullptr, nullptr);
  writer.VisitEnd();
  std::vector<uint8_t> bytes = writer.ToByteArray();
  ASSERT_LE(8u, bytes.size());
  EXPECT_EQ(0, bytes[4]);
  EXPECT_EQ(3, bytes[5]);
  EXPECT_EQ(0, bytes[6]);
  EXPECT_EQ(45, bytes[7]);
  EXPECT_EQ("class 196653 0x1 Old sig=- super=- interfaces=[]\nend class",
            Recorded(bytes));
}

TEST(ClassWriterTest, DeprecatedIsAnEmptyAttribute) {
  ClassWriter writer;
  writer.Visit(52, kAccPublic | kAccDeprecated, "A", nullptr, nullptr,
               nullptr);
  writer.VisitEnd();
  std::vector<uint8_t> expected = {
      0xCA, 0xFE, 0xBA, 0xBE,  // magic
      0, 0, 0, 52,             // minor_version, major_version
      0, 4,                    // constant_pool_count
      1, 0, 1, 'A',            // #1 Utf8 A
      7, 0, 1,                 // #2 Class #1
      1, 0, 10, 'D', 'e', 'p', 'r', 'e', 'c', 'a', 't', 'e',
      'd',         // #3 Utf8 Deprecated
      0, 1,        // access_flags
      0, 2,        // this_class
      0, 0,        // super_class
      0, 0,        // interfaces_count
      0, 0,        // fields_count
      0, 0,        // methods_count
      0, 1,        // attributes_count
      0, 3,        // attribute_name_index
      0, 0, 0, 0,  // attribute_length
  };
  EXPECT_EQ(expected, writer.ToByteArray());
}

TEST(ClassWriterTest, DeprecatedMembersAndParameterAnnotations) {
  RecordingVisitor direct;
  ClassWriter writer;
  for (ClassVisitor *cv : std::vector<ClassVisitor *>{&direct, &writer}) {
    std::string super_name = "java/lang/Object";
    std::vector<std::string> interfaces;
    cv->Visit(52, kAccPublic | kAccSuper | kAccDeprecated, "a/A", nullptr,
              &super_name, &interfaces);
    cv->VisitField(kAccPublic | kAccDeprecated, "old", "I", nullptr, nullptr)
        ->VisitEnd();
    MethodVisitor *mv = cv->VisitMethod(kAccPublic | kAccDeprecated, "m",
                                        "(IJLjava/lang/String;)V", nullptr,
                                        nullptr);
    mv->VisitAnnotation("La/M;", true)->VisitEnd();
    mv->VisitAnnotableParameterCount(3, true);
    AnnotationVisitor *pa = mv->VisitParameterAnnotation(0, "La/P;", true);
    pa->Visit("v", Constant::Int(2));
    pa->VisitEnd();
    mv->VisitParameterAnnotation(2, "La/Q;", true)->VisitEnd();
    mv->VisitAnnotableParameterCount(2, false);
    mv->VisitParameterAnnotation(1, "La/Hidden;", false)->VisitEnd();
    mv->VisitEnd();
    cv->VisitEnd();
  }
  EXPECT_EQ(direct.ToString(), Recorded(writer.ToByteArray()));
  EXPECT_EQ(
      "class 52 0x20021 a/A sig=- super=java/lang/Object interfaces=[]\n"
      "field 0x20001 old I sig=- value=-\n"
      "end field\n"
      "method 0x20001 m (IJLjava/lang/String;)V sig=- exceptions=-\n"
      "  annotation La/M; visible\n"
      "    end\n"
      "  parameters 3 visible\n"
      "  parameter 0 annotation La/P; visible\n"
      "    v=I:2\n"
      "    end\n"
      "  parameter 2 annotation La/Q; visible\n"
      "    end\n"
      "  parameters 2 invisible\n"
      "  parameter 1 annotation La/Hidden; invisible\n"
      "    end\n"
      "end method\n"
      "end class",
      direct.ToString());
}

TEST(ClassWriterTest, ParameterCountCoversAnnotatedParameters) {
  ClassWriter writer;
  writer.Visit(52, kAccPublic, "a/A", nullptr, nullptr, nullptr);
  MethodVisitor *mv =
      writer.VisitMethod(kAccPublic, "m", "(II)V", nullptr, nullptr);
  mv->VisitParameterAnnotation(1, "La/P;", false)->VisitEnd();
  mv->VisitEnd();
  writer.VisitEnd();
  EXPECT_EQ(
      "class 52 0x1 a/A sig=- super=- interfaces=[]\n"
      "method 0x1 m (II)V sig=- exceptions=-\n"
      "  parameters 2 invisible\n"
      "  parameter 1 annotation La/P; invisible\n"
      "    end\n"
      "end method\n"
      "end class",
      Recorded(writer.ToByteArray()));
}

}  // namespace
}  // namespace abimirror

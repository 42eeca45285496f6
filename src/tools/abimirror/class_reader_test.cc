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

#include "src/tools/abimirror/class_reader.h"

#include <cstdint>
#include <string>
#include <vector>

#include "src/tools/abimirror/byte_vector.h"
#include "src/tools/abimirror/constant.h"
#include "src/tools/abimirror/constant_pool.h"
#include "src/tools/abimirror/test_util.h"
#include "src/tools/abimirror/visitors.h"
#include "gtest/gtest.h"

namespace abimirror {
namespace {

using abimirror_test_util::ClassFileBuilder;
using abimirror_test_util::RecordingVisitor;

bool Read(const std::vector<uint8_t> &bytes, RecordingVisitor *visitor,
          std::string *error) {
  ClassReader reader(bytes.data(), bytes.size());
  return reader.Accept(visitor, error);
}

std::string ReadOrDie(const std::vector<uint8_t> &bytes) {
  RecordingVisitor visitor;
  std::string error;
  EXPECT_TRUE(Read(bytes, &visitor, &error)) << error;
  return visitor.ToString();
}

// Reads a class that is expected to be rejected and returns the error.
std::string ReadError(const std::vector<uint8_t> &bytes) {
  RecordingVisitor visitor;
  std::string error;
  EXPECT_FALSE(Read(bytes, &visitor, &error));
  return error;
}

// The start of a class file up to and including the constant pool count.
ByteVector ClassPrefix(uint16_t pool_count) {
  ByteVector out;
  out.PutU4(0xCAFEBABE);
  out.PutU2(0);
  out.PutU2(52);
  out.PutU2(pool_count);
  return out;
}

TEST(ClassReaderTest, HeaderFieldsAndMethods) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  builder.set_version(55, 3);
  builder.AddInterface("java/io/Serializable");
  builder.AddInterface("java/lang/Runnable");
  builder.AddAttribute(builder.SignatureAttribute(
      "<T:Ljava/lang/Object;>Ljava/lang/Object;Ljava/io/Serializable;"
      "Ljava/lang/Runnable;"));
  ClassFileBuilder::Attribute source_file;
  source_file.name = "SourceFile";
  source_file.info.PutU2(builder.pool()->AddUtf8("A.java"));
  builder.AddAttribute(source_file);

  builder.AddField(kAccPublic, "x", "I",
                   {builder.ConstantValueAttribute(Constant::Int(3))});
  builder.AddField(kAccPublic | kAccStatic | kAccFinal, "flag", "Z",
                   {builder.ConstantValueAttribute(Constant::Int(1))});
  builder.AddField(kAccPublic | kAccStatic | kAccFinal, "name",
                   "Ljava/lang/String;",
                   {builder.ConstantValueAttribute(Constant::String("hi"))});
  builder.AddField(kAccPrivate, "items", "Ljava/util/List;",
                   {builder.SignatureAttribute("Ljava/util/List<TT;>;")});
  builder.AddMethod(kAccPublic, "<init>", "()V", {builder.ReturnCode()});
  builder.AddMethod(kAccPublic, "run", "()V", {builder.ReturnCode()});

  EXPECT_EQ(
      "class 196663 0x21 a/A "
      "sig=<T:Ljava/lang/Object;>Ljava/lang/Object;Ljava/io/Serializable;"
      "Ljava/lang/Runnable; super=java/lang/Object "
      "interfaces=[java/io/Serializable,java/lang/Runnable]\n"
      "field 0x1 x I sig=- value=I:3\n"
      "end field\n"
      "field 0x19 flag Z sig=- value=Z:1\n"
      "end field\n"
      "field 0x19 name Ljava/lang/String; sig=- value=s:\"hi\"\n"
      "end field\n"
      "field 0x2 items Ljava/util/List; sig=Ljava/util/List<TT;>; value=-\n"
      "end field\n"
      "method 0x1 <init> ()V sig=- exceptions=-\n"
      "end method\n"
      "method 0x1 run ()V sig=- exceptions=-\n"
      "end method\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, ClassWithoutSuperclass) {
  ClassFileBuilder builder("java/lang/Object", "");
  EXPECT_EQ(
      "class 52 0x21 java/lang/Object sig=- super=- interfaces=[]\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, ClassAnnotationsComeBeforeMembers) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  builder.AddField(kAccPublic, "x", "I", {});
  builder.AddAttribute(builder.MarkerAnnotations({"La/Hidden;"}, false));
  builder.AddAttribute(
      builder.MarkerAnnotations({"La/Shown;", "La/Also;"}, true));
  EXPECT_EQ(
      "class 52 0x21 a/A sig=- super=java/lang/Object interfaces=[]\n"
      "annotation La/Shown; visible\n"
      "  end\n"
      "annotation La/Also; visible\n"
      "  end\n"
      "annotation La/Hidden; invisible\n"
      "  end\n"
      "field 0x1 x I sig=- value=-\n"
      "end field\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, ExceptionsAndAnnotationDefault) {
  ClassFileBuilder builder("a/Ann", "java/lang/Object");
  builder.set_access(kAccPublic | kAccInterface | kAccAbstract |
                     kAccAnnotation);
  ClassFileBuilder::Attribute exceptions;
  exceptions.name = "Exceptions";
  exceptions.info.PutU2(2);
  exceptions.info.PutU2(builder.pool()->AddClass("java/io/IOException"));
  exceptions.info.PutU2(builder.pool()->AddClass("a/Failure"));
  ClassFileBuilder::Attribute annotation_default;
  annotation_default.name = "AnnotationDefault";
  annotation_default.info.PutU1('I');
  annotation_default.info.PutU2(builder.pool()->AddInteger(5));
  builder.AddMethod(kAccPublic | kAccAbstract, "value", "()I",
                    {exceptions, annotation_default,
                     builder.MarkerAnnotations({"La/M;"}, true)});

  EXPECT_EQ(
      "class 52 0x2601 a/Ann sig=- super=java/lang/Object interfaces=[]\n"
      "method 0x401 value ()I sig=- "
      "exceptions=[java/io/IOException,a/Failure]\n"
      "  default\n"
      "    =I:5\n"
      "    end\n"
      "  annotation La/M; visible\n"
      "    end\n"
      "end method\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, DeprecatedAttributeSetsTheFlag) {
  ClassFileBuilder builder("a/Old", "java/lang/Object");
  builder.AddAttribute(builder.DeprecatedAttribute());
  builder.AddField(kAccPublic, "x", "I", {builder.DeprecatedAttribute()});
  builder.AddField(kAccPublic, "y", "I", {});
  builder.AddMethod(kAccPublic, "run", "()V",
                    {builder.ReturnCode(), builder.DeprecatedAttribute()});
  EXPECT_EQ(
      "class 52 0x20021 a/Old sig=- super=java/lang/Object interfaces=[]\n"
      "field 0x20001 x I sig=- value=-\n"
      "end field\n"
      "field 0x1 y I sig=- value=-\n"
      "end field\n"
      "method 0x20001 run ()V sig=- exceptions=-\n"
      "end method\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, ParameterAnnotationsFollowMethodAnnotations) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  builder.AddMethod(
      kAccPublic, "m", "(ILjava/lang/String;J)V",
      {builder.ParameterAnnotations({{}, {"La/Hidden;"}}, false),
       builder.ParameterAnnotations(
           {{"La/First;", "La/Second;"}, {}, {"La/Last;"}}, true),
       builder.MarkerAnnotations({"La/M;"}, false)});
  EXPECT_EQ(
      "class 52 0x21 a/A sig=- super=java/lang/Object interfaces=[]\n"
      "method 0x1 m (ILjava/lang/String;J)V sig=- exceptions=-\n"
      "  annotation La/M; invisible\n"
      "    end\n"
      "  parameters 3 visible\n"
      "  parameter 0 annotation La/First; visible\n"
      "    end\n"
      "  parameter 0 annotation La/Second; visible\n"
      "    end\n"
      "  parameter 2 annotation La/Last; visible\n"
      "    end\n"
      "  parameters 2 invisible\n"
      "  parameter 1 annotation La/Hidden; invisible\n"
      "    end\n"
      "end method\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, ElementValues) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  ConstantPool *pool = builder.pool();
  ClassFileBuilder::Attribute annotations;
  annotations.name = "RuntimeVisibleAnnotations";
  ByteVector &info = annotations.info;
  info.PutU2(1);
  info.PutU2(pool->AddUtf8("La/Ann;"));
  info.PutU2(9);
  info.PutU2(pool->AddUtf8("s"));
  info.PutU1('s');
  info.PutU2(pool->AddUtf8("text"));
  info.PutU2(pool->AddUtf8("c"));
  info.PutU1('c');
  info.PutU2(pool->AddUtf8("Ljava/lang/String;"));
  info.PutU2(pool->AddUtf8("b"));
  info.PutU1('B');
  info.PutU2(pool->AddInteger(-1));
  info.PutU2(pool->AddUtf8("ch"));
  info.PutU1('C');
  info.PutU2(pool->AddInteger('x'));
  info.PutU2(pool->AddUtf8("j"));
  info.PutU1('J');
  info.PutU2(pool->AddLong(1LL << 40));
  info.PutU2(pool->AddUtf8("d"));
  info.PutU1('D');
  info.PutU2(pool->AddDouble(0x4000000000000000));
  info.PutU2(pool->AddUtf8("e"));
  info.PutU1('e');
  info.PutU2(pool->AddUtf8("La/Color;"));
  info.PutU2(pool->AddUtf8("RED"));
  info.PutU2(pool->AddUtf8("arr"));
  info.PutU1('[');
  info.PutU2(2);
  info.PutU1('F');
  info.PutU2(pool->AddFloat(0x3F800000));
  info.PutU1('Z');
  info.PutU2(pool->AddInteger(0));
  info.PutU2(pool->AddUtf8("nested"));
  info.PutU1('@');
  info.PutU2(pool->AddUtf8("La/Inner;"));
  info.PutU2(1);
  info.PutU2(pool->AddUtf8("n"));
  info.PutU1('S');
  info.PutU2(pool->AddInteger(7));
  builder.AddAttribute(annotations);

  EXPECT_EQ(
      "class 52 0x21 a/A sig=- super=java/lang/Object interfaces=[]\n"
      "annotation La/Ann; visible\n"
      "  s=s:\"text\"\n"
      "  c=c:\"Ljava/lang/String;\"\n"
      "  b=B:-1\n"
      "  ch=C:120\n"
      "  j=J:1099511627776\n"
      "  d=D:0x4000000000000000\n"
      "  e=enum La/Color; RED\n"
      "  arr=[\n"
      "    =F:0x3f800000\n"
      "    =Z:0\n"
      "    end\n"
      "  nested=@La/Inner;\n"
      "    n=S:7\n"
      "    end\n"
      "  end\n"
      "end class",
      ReadOrDie(builder.Build()));
}

TEST(ClassReaderTest, BadMagic) {
  ByteVector bytes;
  bytes.PutU4(0xCAFEBABF);
  bytes.PutU4(52);
  EXPECT_EQ("bad magic number 0xcafebabf", ReadError(bytes.bytes()));
}

TEST(ClassReaderTest, EmptyInput) {
  EXPECT_NE(std::string::npos,
            ReadError(std::vector<uint8_t>()).find("truncated class file"));
}

TEST(ClassReaderTest, EveryTruncationIsRejected) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  builder.AddField(kAccPublic, "x", "J",
                   {builder.ConstantValueAttribute(Constant::Long(1))});
  builder.AddMethod(kAccPublic, "run", "()V", {builder.ReturnCode()});
  builder.AddMethod(kAccPublic, "take", "(I)V",
                    {builder.DeprecatedAttribute(),
                     builder.ParameterAnnotations({{"La/P;"}}, true)});
  builder.AddAttribute(builder.MarkerAnnotations({"La/M;"}, true));
  std::vector<uint8_t> bytes = builder.Build();
  for (size_t size = 0; size < bytes.size(); ++size) {
    RecordingVisitor visitor;
    std::string error;
    ClassReader reader(bytes.data(), size);
    EXPECT_FALSE(reader.Accept(&visitor, &error)) << "size " << size;
    EXPECT_FALSE(error.empty()) << "size " << size;
  }
}

TEST(ClassReaderTest, IndexOutOfRange) {
  ByteVector bytes = ClassPrefix(2);
  bytes.PutU1(CONSTANT_Utf8);
  bytes.PutU2(1);
  bytes.PutU1('A');
  bytes.PutU2(kAccPublic);
  bytes.PutU2(5);  // this_class
  EXPECT_EQ("constant pool index 5 is out of range",
            ReadError(bytes.bytes()));
}

TEST(ClassReaderTest, IndexOfTheWrongKind) {
  ByteVector bytes = ClassPrefix(2);
  bytes.PutU1(CONSTANT_Utf8);
  bytes.PutU2(1);
  bytes.PutU1('A');
  bytes.PutU2(kAccPublic);
  bytes.PutU2(1);  // this_class refers to a Utf8 entry
  EXPECT_EQ("constant pool entry 1 has tag 1, expected 7",
            ReadError(bytes.bytes()));
}

TEST(ClassReaderTest, UnknownConstantTag) {
  ByteVector bytes = ClassPrefix(3);
  bytes.PutU1(CONSTANT_Integer);
  bytes.PutU4(0);
  bytes.PutU1(2);
  bytes.PutU4(0);
  EXPECT_EQ("unknown constant pool tag 2 at index 2", ReadError(bytes.bytes()));
}

TEST(ClassReaderTest, LongInTheLastSlot) {
  ByteVector bytes = ClassPrefix(2);
  bytes.PutU1(CONSTANT_Long);
  bytes.PutU8(0);
  EXPECT_EQ("8-byte constant at index 1 overflows the constant pool",
            ReadError(bytes.bytes()));
}

TEST(ClassReaderTest, ModernConstantsAreSkipped) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  std::vector<uint8_t> bytes = builder.Build();
  // Splice a MethodHandle, a Dynamic and a Package entry onto the end of the
  // pool.
  ByteVector extra;
  extra.PutU1(CONSTANT_MethodHandle);
  extra.PutU1(6);
  extra.PutU2(1);
  extra.PutU1(CONSTANT_Dynamic);
  extra.PutU4(0x00010001);
  extra.PutU1(CONSTANT_Package);
  extra.PutU2(1);
  uint16_t count = static_cast<uint16_t>(bytes[8] << 8 | bytes[9]);
  ByteVector pool;
  builder.pool()->Put(&pool);
  size_t pool_end = 8 + pool.size();
  bytes.insert(bytes.begin() + pool_end, extra.bytes().begin(),
               extra.bytes().end());
  count += 3;
  bytes[8] = static_cast<uint8_t>(count >> 8);
  bytes[9] = static_cast<uint8_t>(count);
  EXPECT_EQ(
      "class 52 0x21 a/A sig=- super=java/lang/Object interfaces=[]\n"
      "end class",
      ReadOrDie(bytes));
}

TEST(ClassReaderTest, UnknownElementValueTagKeepsEarlierEvents) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  ClassFileBuilder::Attribute annotations;
  annotations.name = "RuntimeInvisibleAnnotations";
  annotations.info.PutU2(1);
  annotations.info.PutU2(builder.pool()->AddUtf8("La/Bad;"));
  annotations.info.PutU2(1);
  annotations.info.PutU2(builder.pool()->AddUtf8("v"));
  annotations.info.PutU1('X');
  annotations.info.PutU2(1);
  builder.AddMethod(kAccPublic, "m", "()V", {annotations});

  RecordingVisitor visitor;
  std::string error;
  std::vector<uint8_t> bytes = builder.Build();
  ASSERT_FALSE(Read(bytes, &visitor, &error));
  EXPECT_NE(std::string::npos, error.find("unknown element value tag 88"))
      << error;
  ASSERT_EQ(3u, visitor.events().size());
  EXPECT_EQ("method 0x1 m ()V sig=- exceptions=-", visitor.events()[1]);
  EXPECT_EQ("  annotation La/Bad; invisible", visitor.events()[2]);
}

TEST(ClassReaderTest, DeeplyNestedArraysAreRejected) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  ClassFileBuilder::Attribute annotations;
  annotations.name = "RuntimeVisibleAnnotations";
  annotations.info.PutU2(1);
  annotations.info.PutU2(builder.pool()->AddUtf8("La/Deep;"));
  annotations.info.PutU2(1);
  annotations.info.PutU2(builder.pool()->AddUtf8("v"));
  for (int i = 0; i < 200; ++i) {
    annotations.info.PutU1('[');
    annotations.info.PutU2(1);
  }
  annotations.info.PutU1('I');
  annotations.info.PutU2(builder.pool()->AddInteger(0));
  builder.AddAttribute(annotations);
  EXPECT_EQ("annotation values are nested too deeply",
            ReadError(builder.Build()));
}

TEST(ClassReaderTest, AttributeLongerThanTheFile) {
  ClassFileBuilder builder("a/A", "java/lang/Object");
  ClassFileBuilder::Attribute signature =
      builder.SignatureAttribute("La/B;");
  builder.AddAttribute(signature);
  std::vector<uint8_t> bytes = builder.Build();
  // The class ends with the Signature attribute: u2 name, u4 length, u2 index.
  size_t length_offset = bytes.size() - 6;
  bytes[length_offset + 3] = 0x20;
  EXPECT_NE(std::string::npos,
            ReadError(bytes).find("truncated class file"));
}

}  // namespace
}  // namespace abimirror

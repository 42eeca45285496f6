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

#include "src/tools/abimirror/input_jar.h"

#include <cstdint>
#include <string>
#include <vector>

#include "src/tools/abimirror/abi_jar_writer.h"
#include "src/tools/abimirror/test_util.h"
#include "gtest/gtest.h"

namespace abimirror {
namespace {

using abimirror_test_util::OutputFilePath;
using abimirror_test_util::ReadFile;
using abimirror_test_util::WriteFile;

const char kEntryName[] = "a/A.class";

// Writes a jar with two entries, one that deflates well and one that does
// not.
void CreateJar(const std::string &path, bool compress) {
  AbiJarWriter writer(compress);
  ASSERT_TRUE(writer.Open(path));
  std::vector<uint8_t> text(1000, 'a');
  const uint8_t magic[] = {0xCA, 0xFE, 0xBA, 0xBE};
  ASSERT_TRUE(writer.WriteEntry(kEntryName, text.data(), text.size()));
  ASSERT_TRUE(writer.WriteEntry("META-INF/x", magic, sizeof(magic)));
  ASSERT_TRUE(writer.Close());
}

std::vector<std::string> ReadAll(InputJar *jar) {
  std::vector<std::string> names;
  const CDH *cdh;
  const LH *lh;
  while ((cdh = jar->NextEntry(&lh)) != nullptr) {
    std::vector<uint8_t> contents;
    std::string error;
    EXPECT_TRUE(jar->ReadEntry(cdh, lh, &contents, &error)) << error;
    EXPECT_EQ(cdh->uncompressed_file_size32(), contents.size());
    names.push_back(cdh->file_name_string());
  }
  EXPECT_EQ("", jar->error());
  return names;
}

TEST(InputJarTest, ReadsDeflatedAndStoredEntries) {
  for (bool compress : {true, false}) {
    std::string path = OutputFilePath(compress ? "deflated.jar" : "stored.jar");
    CreateJar(path, compress);
    InputJar jar;
    std::string error;
    ASSERT_TRUE(jar.Open(path, &error)) << error;
    EXPECT_EQ(path, jar.path());

    const LH *lh;
    const CDH *cdh = jar.NextEntry(&lh);
    ASSERT_NE(nullptr, cdh);
    EXPECT_EQ(kEntryName, cdh->file_name_string());
    EXPECT_EQ(compress ? Z_DEFLATED : Z_NO_COMPRESSION,
              cdh->compression_method());
    std::vector<uint8_t> contents;
    ASSERT_TRUE(jar.ReadEntry(cdh, lh, &contents, &error)) << error;
    EXPECT_EQ(std::vector<uint8_t>(1000, 'a'), contents);

    cdh = jar.NextEntry(&lh);
    ASSERT_NE(nullptr, cdh);
    EXPECT_EQ("META-INF/x", cdh->file_name_string());
    ASSERT_TRUE(jar.ReadEntry(cdh, lh, &contents, &error)) << error;
    EXPECT_EQ((std::vector<uint8_t>{0xCA, 0xFE, 0xBA, 0xBE}), contents);

    EXPECT_EQ(nullptr, jar.NextEntry(&lh));
    EXPECT_EQ("", jar.error());
    jar.Close();
  }
}

TEST(InputJarTest, Preamble) {
  std::string jar_path = OutputFilePath("plain.jar");
  CreateJar(jar_path, true);
  std::vector<uint8_t> contents;
  ASSERT_TRUE(ReadFile(jar_path, &contents));
  std::string script = "#!/bin/sh\nexec java -jar \"$0\" \"$@\"\n";
  contents.insert(contents.begin(), script.begin(), script.end());
  std::string path = OutputFilePath("preambled.jar");
  ASSERT_TRUE(WriteFile(path, contents));

  InputJar jar;
  std::string error;
  ASSERT_TRUE(jar.Open(path, &error)) << error;
  EXPECT_EQ((std::vector<std::string>{kEntryName, "META-INF/x"}),
            ReadAll(&jar));
}

TEST(InputJarTest, MissingFile) {
  InputJar jar;
  std::string error;
  EXPECT_FALSE(jar.Open(OutputFilePath("no_such.jar"), &error));
  EXPECT_FALSE(error.empty());
}

TEST(InputJarTest, TooShort) {
  std::string path = OutputFilePath("short.jar");
  ASSERT_TRUE(WriteFile(path, std::string("PK\3\4")));
  InputJar jar;
  std::string error;
  EXPECT_FALSE(jar.Open(path, &error));
  EXPECT_NE(std::string::npos, error.find("file is only 4 bytes long"))
      << error;
}

TEST(InputJarTest, NotAZip) {
  std::string path = OutputFilePath("text.jar");
  ASSERT_TRUE(WriteFile(path, std::string(100, 'z')));
  InputJar jar;
  std::string error;
  EXPECT_FALSE(jar.Open(path, &error));
  EXPECT_NE(std::string::npos,
            error.find("cannot locate the End of Central Directory record"))
      << error;
}

TEST(InputJarTest, CorruptContents) {
  std::string jar_path = OutputFilePath("good.jar");
  CreateJar(jar_path, false);
  std::vector<uint8_t> contents;
  ASSERT_TRUE(ReadFile(jar_path, &contents));
  // The first entry's data follows its local header.
  contents[sizeof(LH) + sizeof(kEntryName) - 1] ^= 1;
  std::string path = OutputFilePath("corrupt.jar");
  ASSERT_TRUE(WriteFile(path, contents));

  InputJar jar;
  std::string error;
  ASSERT_TRUE(jar.Open(path, &error)) << error;
  const LH *lh;
  const CDH *cdh = jar.NextEntry(&lh);
  ASSERT_NE(nullptr, cdh);
  std::vector<uint8_t> entry;
  EXPECT_FALSE(jar.ReadEntry(cdh, lh, &entry, &error));
  EXPECT_NE(std::string::npos, error.find("CRC mismatch for a/A.class"))
      << error;
}

TEST(InputJarTest, BadLocalHeader) {
  std::string jar_path = OutputFilePath("good2.jar");
  CreateJar(jar_path, true);
  std::vector<uint8_t> contents;
  ASSERT_TRUE(ReadFile(jar_path, &contents));
  contents[0] = 'X';
  std::string path = OutputFilePath("bad_local_header.jar");
  ASSERT_TRUE(WriteFile(path, contents));

  InputJar jar;
  std::string error;
  ASSERT_TRUE(jar.Open(path, &error)) << error;
  const LH *lh;
  EXPECT_EQ(nullptr, jar.NextEntry(&lh));
  EXPECT_NE(std::string::npos,
            jar.error().find("expected local header signature"))
      << jar.error();
}

}  // namespace
}  // namespace abimirror

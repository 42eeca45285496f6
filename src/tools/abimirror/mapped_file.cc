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

#include "src/tools/abimirror/mapped_file.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include "absl/strings/str_cat.h"
#include "src/main/cpp/util/errors.h"

namespace abimirror {

MappedFile::MappedFile()
    : mapped_start_(nullptr), mapped_end_(nullptr), fd_(-1) {}

bool MappedFile::Open(const std::string &path, std::string *error) {
  if (is_open()) {
    *error = absl::StrCat("cannot open ", path, ": ", "already open");
    return false;
  }
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    *error = absl::StrCat("cannot open ", path, ": ",
                          abimirror_util::GetLastErrorString());
    return false;
  }
  struct stat st;
  if (fstat(fd, &st) != 0) {
    *error = absl::StrCat("cannot stat ", path, ": ",
                          abimirror_util::GetLastErrorString());
    close(fd);
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    *error = absl::StrCat(path, " is not a regular file");
    close(fd);
    return false;
  }
  size_t size = static_cast<size_t>(st.st_size);
  if (size > 0) {
    void *mapped = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapped == MAP_FAILED) {
      *error = absl::StrCat("cannot map ", path, ": ",
                            abimirror_util::GetLastErrorString());
      close(fd);
      return false;
    }
    mapped_start_ = static_cast<unsigned char *>(mapped);
    mapped_end_ = mapped_start_ + size;
  }
  fd_ = fd;
  return true;
}

void MappedFile::Close() {
  if (!is_open()) {
    return;
  }
  if (mapped_start_ != nullptr) {
    munmap(mapped_start_, mapped_end_ - mapped_start_);
  }
  close(fd_);
  mapped_start_ = mapped_end_ = nullptr;
  fd_ = -1;
}

}  // namespace abimirror

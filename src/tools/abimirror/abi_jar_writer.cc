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

#include "src/tools/abimirror/abi_jar_writer.h"

#include <stdio.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "src/main/cpp/util/errors.h"
#include "src/main/cpp/util/logging.h"
#include "src/tools/abimirror/zip_headers.h"

namespace abimirror {

AbiJarWriter::AbiJarWriter(bool compress)
    : compress_(compress),
      file_(nullptr),
      outpos_(0),
      failed_(false),
      entries_(0) {}

AbiJarWriter::~AbiJarWriter() {
  if (file_ != nullptr) {
    ABIMIRROR_LOG(WARNING) << path_ << " was not closed, deleting it";
    Abandon();
  }
}

bool AbiJarWriter::Open(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  ABIMIRROR_CHECK(file_ == nullptr) << "Cannot open output archive twice";
  file_ = fopen(path.c_str(), "wb");
  if (file_ == nullptr) {
    ABIMIRROR_LOG(ERROR) << "Cannot create " << path << ": "
                         << abimirror_util::GetLastErrorString();
    return false;
  }
  path_ = path;
  outpos_ = 0;
  failed_ = false;
  entries_ = 0;
  cen_.clear();
  names_.clear();
  return true;
}

void AbiJarWriter::Add(std::unique_ptr<ClassMirror> mirror) {
  std::lock_guard<std::mutex> lock(mutex_);
  mirrors_.push_back(std::move(mirror));
}

bool AbiJarWriter::Commit() {
  std::vector<std::unique_ptr<ClassMirror>> mirrors;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    mirrors.swap(mirrors_);
  }
  std::sort(mirrors.begin(), mirrors.end(),
            [](const std::unique_ptr<ClassMirror> &a,
               const std::unique_ptr<ClassMirror> &b) { return *a < *b; });
  for (const auto &mirror : mirrors) {
    if (!mirror->WriteTo(this)) {
      break;
    }
  }
  return Close();
}

bool AbiJarWriter::Fail(const std::string &message) {
  ABIMIRROR_LOG(ERROR) << path_ << ": " << message;
  failed_ = true;
  return false;
}

bool AbiJarWriter::WriteBytes(const void *buffer, size_t count) {
  if (count == 0) {
    return true;
  }
  size_t written = fwrite(buffer, 1, count, file_);
  outpos_ += written;
  return written == count;
}

bool AbiJarWriter::WriteEntry(const std::string &name, const uint8_t *data,
                              size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  ABIMIRROR_CHECK(file_ != nullptr) << "WriteEntry(" << name
                                    << ") on an archive that is not open";
  if (failed_) {
    return false;
  }
  if (name.empty() || name.size() > 0xFFFF) {
    return Fail(absl::StrCat("invalid entry name '", name, "'"));
  }
  if (!names_.insert(name).second) {
    return Fail(absl::StrCat("duplicate entry ", name));
  }
  // Past these limits the archive would need Zip64 records.
  if (entries_ >= 0xFFFF || size >= 0xFFFFFFFF || outpos_ >= 0xFFFFFFFF) {
    return Fail(absl::StrCat("cannot add ", name, ": archive too large"));
  }

  uint32_t crc = crc32(0, data, static_cast<uint32_t>(size));
  const uint8_t *payload = data;
  size_t payload_size = size;
  uint16_t method = Z_NO_COMPRESSION;
  std::vector<uint8_t> deflated;
  if (compress_ && size > 0) {
    deflater_.reset();
    deflated.resize(deflateBound(&deflater_, static_cast<uLong>(size)));
    deflater_.next_out = deflated.data();
    deflater_.avail_out = static_cast<uInt>(deflated.size());
    int rc = deflater_.Deflate(data, static_cast<uint32_t>(size), Z_FINISH);
    if (rc != Z_STREAM_END) {
      return Fail(absl::StrCat("cannot compress ", name, ": deflate returned ",
                               rc));
    }
    size_t deflated_size = deflated.size() - deflater_.avail_out;
    // Incompressible entries are stored.
    if (deflated_size < size) {
      payload = deflated.data();
      payload_size = deflated_size;
      method = Z_DEFLATED;
    }
  }

  std::vector<uint8_t> header(sizeof(LH) + name.size());
  LH *lh = reinterpret_cast<LH *>(header.data());
  lh->signature();
  lh->version(20);  // 2.0
  lh->bit_flag(0);
  lh->compression_method(method);
  lh->last_mod_file_time(kAbiEntryTime);
  lh->last_mod_file_date(kAbiEntryDate);
  lh->crc32(crc);
  lh->compressed_file_size32(static_cast<uint32_t>(payload_size));
  lh->uncompressed_file_size32(static_cast<uint32_t>(size));
  lh->file_name(name.c_str(), static_cast<uint16_t>(name.size()));
  lh->extra_fields_length(0);

  uint32_t lh_position = static_cast<uint32_t>(outpos_);
  if (!WriteBytes(header.data(), header.size()) ||
      !WriteBytes(payload, payload_size)) {
    return Fail(absl::StrCat("cannot write ", name, ": ",
                             abimirror_util::GetLastErrorString()));
  }
  AppendToDirectory(name, method, crc, static_cast<uint32_t>(payload_size),
                    static_cast<uint32_t>(size), lh_position);
  ++entries_;
  if (method == Z_NO_COMPRESSION) {
    ABIMIRROR_LOG(INFO) << name << ": stored " << size << " bytes";
  } else {
    ABIMIRROR_LOG(INFO) << name << ": compressed " << size << " bytes to "
                        << payload_size;
  }
  return true;
}

void AbiJarWriter::AppendToDirectory(const std::string &name, uint16_t method,
                                     uint32_t crc, uint32_t compressed_size,
                                     uint32_t uncompressed_size,
                                     uint32_t offset) {
  size_t cdh_offset = cen_.size();
  cen_.resize(cdh_offset + sizeof(CDH) + name.size());
  CDH *cdh = reinterpret_cast<CDH *>(cen_.data() + cdh_offset);
  cdh->signature();
  // Note: do not set the version to Unix 3.0 spec, otherwise
  // unzip will think that 'external_attributes' field contains access mode
  cdh->version(20);
  cdh->version_to_extract(20);  // 2.0
  cdh->bit_flag(0);
  cdh->compression_method(method);
  cdh->last_mod_file_time(kAbiEntryTime);
  cdh->last_mod_file_date(kAbiEntryDate);
  cdh->crc32(crc);
  cdh->compressed_file_size32(compressed_size);
  cdh->uncompressed_file_size32(uncompressed_size);
  cdh->file_name(name.c_str(), static_cast<uint16_t>(name.size()));
  cdh->extra_fields_length(0);
  cdh->comment_length(0);
  cdh->start_disk_nr(0);
  cdh->internal_attributes(0);
  cdh->external_attributes(0);
  cdh->local_header_offset32(offset);
}

bool AbiJarWriter::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_ == nullptr) {
    return !failed_;
  }
  if (!failed_) {
    if (outpos_ + cen_.size() >= 0xFFFFFFFF) {
      Fail("archive too large");
    } else {
      ECD ecd;
      ecd.signature();
      ecd.this_disk_nr(0);
      ecd.cen_disk_nr(0);
      ecd.this_disk_entries16(static_cast<uint16_t>(entries_));
      ecd.total_entries16(static_cast<uint16_t>(entries_));
      ecd.cen_size32(static_cast<uint32_t>(cen_.size()));
      ecd.cen_offset32(static_cast<uint32_t>(outpos_));
      ecd.comment_length(0);
      if (!WriteBytes(cen_.data(), cen_.size()) ||
          !WriteBytes(&ecd, sizeof(ecd))) {
        Fail(absl::StrCat("cannot write central directory: ",
                          abimirror_util::GetLastErrorString()));
      }
    }
  }
  if (failed_) {
    Abandon();
    return false;
  }
  if (fclose(file_) != 0) {
    file_ = nullptr;
    Fail(absl::StrCat("cannot close: ", abimirror_util::GetLastErrorString()));
    unlink(path_.c_str());
    return false;
  }
  file_ = nullptr;
  return true;
}

void AbiJarWriter::Discard() {
  std::lock_guard<std::mutex> lock(mutex_);
  mirrors_.clear();
  if (file_ != nullptr) {
    Abandon();
  }
}

void AbiJarWriter::Abandon() {
  fclose(file_);
  file_ = nullptr;
  if (unlink(path_.c_str()) != 0) {
    ABIMIRROR_LOG(WARNING) << "Cannot delete " << path_ << ": "
                           << abimirror_util::GetLastErrorString();
  }
}

}  // namespace abimirror

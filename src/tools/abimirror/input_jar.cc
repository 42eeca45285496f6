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

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "src/main/cpp/util/logging.h"
#include "src/tools/abimirror/zlib_interface.h"

namespace abimirror {

bool InputJar::Open(const std::string &path, std::string *error) {
  ABIMIRROR_CHECK(path_.empty())
      << "This instance is already handling " << path_;
  error_.clear();
  if (!mapped_file_.Open(path, error)) {
    return false;
  }
  path_ = path;
  if (mapped_file_.size() < sizeof(ECD)) {
    Corrupt(absl::StrCat("file is only ", mapped_file_.size(),
                         " bytes long, should be at least ", sizeof(ECD)));
    *error = error_;
    return false;
  }

  // The End of Central Directory record is at the end of the file, possibly
  // followed by a comment of up to 64K.
  const unsigned char *ecd_min = mapped_file_.end() - 65536 - sizeof(ECD);
  if (mapped_file_.size() < 65536 + sizeof(ECD)) {
    ecd_min = mapped_file_.start();
  }
  const ECD *ecd = nullptr;
  for (const unsigned char *ecd_ptr = mapped_file_.end() - sizeof(ECD);
       ecd_ptr >= ecd_min; --ecd_ptr) {
    if (reinterpret_cast<const ECD *>(ecd_ptr)->is()) {
      ecd = reinterpret_cast<const ECD *>(ecd_ptr);
      break;
    }
  }
  if (ecd == nullptr) {
    Corrupt("cannot locate the End of Central Directory record");
    *error = error_;
    return false;
  }

  uint32_t cen_position = ecd->cen_offset32();
  uint32_t cen_size = ecd->cen_size32();
  bool has_ecd64_locator =
      mapped_file_.offset(ecd) >= static_cast<off_t>(sizeof(ECD64Locator)) &&
      reinterpret_cast<const ECD64Locator *>(ziph::byte_ptr(ecd) -
                                             sizeof(ECD64Locator))
          ->is();
  if (has_ecd64_locator || ziph::zfield_has_ext64(cen_position) ||
      ziph::zfield_has_ext64(cen_size)) {
    Corrupt("Zip64 archives are not supported");
    *error = error_;
    return false;
  }
  if (cen_size > static_cast<uint64_t>(mapped_file_.offset(ecd))) {
    Corrupt(absl::StrCat("Central Directory size 0x", absl::Hex(cen_size),
                         " is too large"));
    *error = error_;
    return false;
  }

  // The Central Directory immediately precedes the ECD. Comparing where it
  // is with where the ECD says it is gives the size of any preamble (for
  // instance a launcher script) that was prepended without adjusting the
  // offsets.
  cdh_ = reinterpret_cast<const CDH *>(ziph::byte_ptr(ecd) - cen_size);
  if (static_cast<uint64_t>(mapped_file_.offset(cdh_)) < cen_position) {
    Corrupt(absl::StrCat("Central Directory location 0x",
                         absl::Hex(cen_position), " is invalid"));
    *error = error_;
    return false;
  }
  preamble_size_ = mapped_file_.offset(cdh_) - cen_position;
  if (cen_size != 0 && !cdh_->is()) {
    Corrupt(absl::StrCat("expected central file header signature at offset 0x",
                         absl::Hex(mapped_file_.offset(cdh_))));
    *error = error_;
    return false;
  }
  return true;
}

bool InputJar::Corrupt(const std::string &message) {
  if (error_.empty()) {
    error_ = absl::StrCat(path_, " is corrupt: ", message);
  }
  return false;
}

const CDH *InputJar::NextEntry(const LH **local_header_ptr) {
  ABIMIRROR_CHECK(!path_.empty()) << "call Open() first!";
  if (!error_.empty() || !cdh_->is()) {
    return nullptr;
  }
  const CDH *current_cdh = cdh_;
  const uint8_t *new_cdr = ziph::byte_ptr(cdh_) + cdh_->size();
  if (!mapped_file_.mapped(new_cdr)) {
    Corrupt(absl::StrCat("bad directory record at offset 0x",
                         absl::Hex(mapped_file_.offset(cdh_))));
    return nullptr;
  }
  if (ziph::zfield_has_ext64(current_cdh->local_header_offset32())) {
    Corrupt(absl::StrCat(current_cdh->file_name_string(),
                         " needs Zip64 records, which are not supported"));
    return nullptr;
  }
  uint64_t lh_offset = current_cdh->local_header_offset32() + preamble_size_;
  if (lh_offset + sizeof(LH) > mapped_file_.size()) {
    Corrupt(absl::StrCat("local header of ", current_cdh->file_name_string(),
                         " is out of bounds"));
    return nullptr;
  }
  const LH *lh =
      reinterpret_cast<const LH *>(mapped_file_.address(lh_offset));
  if (!lh->is()) {
    Corrupt(absl::StrCat("expected local header signature at offset 0x",
                         absl::Hex(lh_offset)));
    return nullptr;
  }
  cdh_ = reinterpret_cast<const CDH *>(new_cdr);
  *local_header_ptr = lh;
  return current_cdh;
}

bool InputJar::ReadEntry(const CDH *entry, const LH *local_header,
                         std::vector<uint8_t> *contents,
                         std::string *error) const {
  const std::string name = entry->file_name_string();
  uint32_t compressed_size = entry->compressed_file_size32();
  uint32_t uncompressed_size = entry->uncompressed_file_size32();
  if (ziph::zfield_has_ext64(compressed_size) ||
      ziph::zfield_has_ext64(uncompressed_size)) {
    *error = absl::StrCat(path_, ": ", name, " needs Zip64 records");
    return false;
  }
  const uint8_t *data = local_header->data();
  if (mapped_file_.offset(data) + static_cast<uint64_t>(compressed_size) >
      mapped_file_.size()) {
    *error = absl::StrCat(path_, ": data of ", name, " is out of bounds");
    return false;
  }

  contents->resize(uncompressed_size);
  switch (entry->compression_method()) {
    case Z_NO_COMPRESSION:
      if (compressed_size != uncompressed_size) {
        *error = absl::StrCat(path_, ": stored entry ", name,
                              " has mismatched sizes");
        return false;
      }
      if (uncompressed_size > 0) {
        std::copy(data, data + uncompressed_size, contents->begin());
      }
      break;
    case Z_DEFLATED: {
      Inflater inflater;
      inflater.DataToInflate(data, compressed_size);
      int rc = inflater.Inflate(contents->data(), uncompressed_size);
      if (rc != Z_STREAM_END || inflater.total_out() != uncompressed_size) {
        *error = absl::StrCat(path_, ": cannot inflate ", name, ": ",
                              rc == Z_STREAM_END ? "size mismatch"
                                                 : inflater.error_message());
        return false;
      }
      break;
    }
    default:
      *error = absl::StrCat(path_, ": ", name,
                            " uses unsupported compression method ",
                            entry->compression_method());
      return false;
  }

  uint32_t crc = crc32(0, contents->data(), uncompressed_size);
  if (crc != entry->crc32()) {
    *error = absl::StrCat(path_, ": CRC mismatch for ", name);
    return false;
  }
  return true;
}

void InputJar::Close() {
  mapped_file_.Close();
  path_.clear();
  cdh_ = nullptr;
  preamble_size_ = 0;
}

}  // namespace abimirror

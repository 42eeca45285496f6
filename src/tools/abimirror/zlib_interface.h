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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_ZLIB_INTERFACE_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_ZLIB_INTERFACE_H_

#include <cinttypes>

#include "src/main/cpp/util/exit_code.h"
#include "src/main/cpp/util/logging.h"
#include <zlib.h>

namespace abimirror {

// An interface to zlib's raw inflater. Usage:
//   Inflater inflater;
//   inflater.DataToInflate(data, data_size);
//   int rc = inflater.Inflate(out_buffer, out_buffer_size);
//   if (rc != Z_STREAM_END) { fail... }
// The sizes of zlib buffers are 32-bit entities.
class Inflater {
 public:
  Inflater() {
    zstream_.zalloc = Z_NULL;
    zstream_.zfree = Z_NULL;
    zstream_.opaque = Z_NULL;
    zstream_.avail_in = 0;
    zstream_.next_in = nullptr;
    int ret = inflateInit2(&zstream_, -MAX_WBITS);
    if (ret != Z_OK) {
      ABIMIRROR_DIE(abimirror_exit_code::INTERNAL_ERROR)
          << "inflateInit2 returned " << ret;
    }
  }

  ~Inflater() { inflateEnd(&zstream_); }

  void reset() { inflateReset(&zstream_); }

  void DataToInflate(const uint8_t *in_buffer, uint32_t in_buffer_length) {
    zstream_.next_in = const_cast<uint8_t *>(in_buffer);
    zstream_.avail_in = in_buffer_length;
  }

  int Inflate(uint8_t *out_buffer, uint32_t out_buffer_length) {
    zstream_.next_out = out_buffer;
    zstream_.avail_out = out_buffer_length;
    return inflate(&zstream_, Z_FINISH);
  }

  uint64_t total_out() const { return zstream_.total_out; }

  const char *error_message() const {
    return zstream_.msg != nullptr ? zstream_.msg : "unknown error";
  }

 private:
  z_stream zstream_;
};

// A little wrapper around zlib's raw deflater.
struct Deflater : z_stream {
  Deflater() {
    zalloc = Z_NULL;
    zfree = Z_NULL;
    opaque = Z_NULL;
    next_in = nullptr;
    avail_in = 0;
    next_out = nullptr;
    avail_out = 0;
    int ret = deflateInit2(this, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS,
                           8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
      ABIMIRROR_DIE(abimirror_exit_code::INTERNAL_ERROR)
          << "deflateInit2 returned " << ret;
    }
  }

  ~Deflater() { deflateEnd(this); }

  void reset() { deflateReset(this); }

  int Deflate(const uint8_t *data, uint32_t data_size, int flag) {
    next_in = const_cast<uint8_t *>(data);
    avail_in = data_size;
    return deflate(this, flag);
  }
};

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_ZLIB_INTERFACE_H_

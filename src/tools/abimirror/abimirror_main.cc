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

#include <memory>
#include <string>

#include "src/main/cpp/util/console_log_handler.h"
#include "src/main/cpp/util/exit_code.h"
#include "src/main/cpp/util/logging.h"
#include "src/tools/abimirror/abi_extractor.h"
#include "src/tools/abimirror/abi_jar_writer.h"
#include "src/tools/abimirror/options.h"

// Writes a jar with the ABI of the given classes.
//
// usage: --output <abi jar>
//        [--sources <jar or class file> ...]
//        [--class_root <directory of the loose class files>]
//        [--jobs <threads>] [--nocompress] [--verbose]
int main(int argc, char *argv[]) {
  abimirror::Options options;
  options.ParseCommandLine(argc - 1, argv + 1);
  if (options.verbose) {
    abimirror_util::SetLogHandler(
        std::unique_ptr<abimirror_util::LogHandler>(
            new abimirror_util::ConsoleLogHandler(
                abimirror_util::LOGLEVEL_INFO)));
  }

  abimirror::AbiJarWriter writer(!options.nocompress);
  if (!writer.Open(options.output_jar)) {
    return abimirror_exit_code::EXTRACTION_FAILED;
  }

  abimirror::AbiExtractor extractor;
  for (const std::string &source : options.sources) {
    if (!extractor.AddSource(source, options.class_root)) {
      writer.Discard();
      return abimirror_exit_code::EXTRACTION_FAILED;
    }
  }
  if (!extractor.Extract(&writer, options.jobs)) {
    return abimirror_exit_code::EXTRACTION_FAILED;
  }
  ABIMIRROR_LOG(INFO) << "Wrote " << writer.entries() << " classes to "
                      << options.output_jar;
  return abimirror_exit_code::SUCCESS;
}

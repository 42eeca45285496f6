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

#include "src/tools/abimirror/abi_extractor.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>  // NOLINT
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "src/main/cpp/util/logging.h"
#include "src/main/cpp/util/thrdpool.h"
#include "src/tools/abimirror/class_mirror.h"
#include "src/tools/abimirror/class_reader.h"
#include "src/tools/abimirror/mapped_file.h"

namespace abimirror {

namespace {

const char kClassSuffix[] = ".class";
const char kModuleInfo[] = "module-info.class";

std::string BaseName(const std::string &path) {
  size_t slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace

AbiExtractor::AbiExtractor() {}

AbiExtractor::~AbiExtractor() {}

bool AbiExtractor::IsClassEntry(const std::string &name) {
  return absl::EndsWith(name, kClassSuffix) && BaseName(name) != kModuleInfo;
}

bool AbiExtractor::EntryNameFor(const std::string &path,
                                const std::string &class_root,
                                std::string *entry_name, std::string *error) {
  if (class_root.empty()) {
    *entry_name = BaseName(path);
    return true;
  }
  std::string prefix = class_root;
  while (prefix.size() > 1 && prefix.back() == '/') {
    prefix.pop_back();
  }
  prefix.push_back('/');
  if (!absl::StartsWith(path, prefix) || path.size() == prefix.size()) {
    *error = absl::StrCat(path, " is not under --class_root ", class_root);
    return false;
  }
  *entry_name = path.substr(prefix.size());
  return true;
}

bool AbiExtractor::Claim(const std::string &entry_name,
                         const std::string &source) {
  auto inserted = sources_.emplace(entry_name, source);
  if (!inserted.second) {
    ABIMIRROR_LOG(WARNING) << "Ignoring " << entry_name << " from " << source
                           << ", already provided by "
                           << inserted.first->second;
    return false;
  }
  return true;
}

bool AbiExtractor::AddJar(const std::string &path) {
  std::unique_ptr<InputJar> jar(new InputJar());
  std::string error;
  if (!jar->Open(path, &error)) {
    ABIMIRROR_LOG(ERROR) << error;
    return false;
  }
  // Nothing is queued or claimed until the whole central directory has been
  // read, so a corrupt jar leaves the extractor as it was.
  std::vector<Task> tasks;
  absl::flat_hash_set<std::string> names;
  const CDH *cdh;
  const LH *local_header;
  while ((cdh = jar->NextEntry(&local_header)) != nullptr) {
    std::string name = cdh->file_name_string();
    if (!IsClassEntry(name)) {
      continue;
    }
    if (!names.insert(name).second) {
      ABIMIRROR_LOG(WARNING) << "Ignoring duplicate entry " << name << " in "
                             << path;
      continue;
    }
    tasks.push_back(Task{name, jar.get(), cdh, local_header, std::string()});
  }
  if (!jar->error().empty()) {
    ABIMIRROR_LOG(ERROR) << jar->error();
    return false;
  }
  size_t classes = 0;
  for (Task &task : tasks) {
    if (Claim(task.entry_name, path)) {
      tasks_.push_back(std::move(task));
      ++classes;
    }
  }
  ABIMIRROR_LOG(INFO) << path << ": " << classes << " classes";
  jars_.push_back(std::move(jar));
  return true;
}

bool AbiExtractor::AddClassFile(const std::string &path,
                                const std::string &class_root) {
  std::string entry_name;
  std::string error;
  if (!EntryNameFor(path, class_root, &entry_name, &error)) {
    ABIMIRROR_LOG(ERROR) << error;
    return false;
  }
  if (Claim(entry_name, path)) {
    tasks_.push_back(Task{entry_name, nullptr, nullptr, nullptr, path});
  }
  return true;
}

bool AbiExtractor::AddSource(const std::string &path,
                             const std::string &class_root) {
  if (absl::EndsWith(path, kClassSuffix)) {
    return AddClassFile(path, class_root);
  }
  return AddJar(path);
}

bool AbiExtractor::ExtractOne(const Task &task, AbiJarWriter *writer) const {
  std::string error;
  std::vector<uint8_t> contents;
  MappedFile file;
  const uint8_t *data;
  size_t size;
  if (task.jar != nullptr) {
    if (!task.jar->ReadEntry(task.cdh, task.local_header, &contents, &error)) {
      ABIMIRROR_LOG(ERROR) << error;
      return false;
    }
    data = contents.data();
    size = contents.size();
  } else {
    if (!file.Open(task.path, &error)) {
      ABIMIRROR_LOG(ERROR) << error;
      return false;
    }
    data = file.start();
    size = file.size();
  }

  std::unique_ptr<ClassMirror> mirror(new ClassMirror(task.entry_name));
  ClassReader reader(data, size);
  if (!reader.Accept(mirror.get(), &error)) {
    ABIMIRROR_LOG(ERROR) << (task.jar != nullptr ? task.jar->path()
                                                 : task.path)
                         << ": " << task.entry_name << ": " << error;
    return false;
  }
  writer->Add(std::move(mirror));
  return true;
}

bool AbiExtractor::Extract(AbiJarWriter *writer, size_t jobs) {
  if (jobs == 0) {
    jobs = std::thread::hardware_concurrency();
  }
  std::atomic<bool> failed(false);
  {
    abimirror_util::threads::ThreadPool pool(jobs);
    for (const Task &task : tasks_) {
      pool.Push([this, &task, writer, &failed]() {
        if (!ExtractOne(task, writer)) {
          failed = true;
        }
      });
    }
    pool.Join();
  }
  if (failed) {
    writer->Discard();
    return false;
  }
  return writer->Commit();
}

}  // namespace abimirror

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

#include "src/main/cpp/util/thrdpool.h"

#include "src/main/cpp/util/exit_code.h"
#include "src/main/cpp/util/logging.h"

namespace abimirror_util {
namespace threads {

ThreadPool::ThreadPool(size_t size) : accepting_(true) {
  if (size == 0) {
    size = 1;
  }
  workers_.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  }
}

ThreadPool::~ThreadPool() { Join(); }

void ThreadPool::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (!queue_.empty()) {
      std::function<void()> task = std::move(queue_.front());
      queue_.pop();
      lock.unlock();  // let other workers pop tasks, or Push() or Join()
      task();
      lock.lock();
    } else if (accepting_) {
      queue_changed_.wait(lock);
    } else {
      // Queue drained and no more tasks can arrive.
      return;
    }
  }
}

bool ThreadPool::Push(const std::function<void()>& task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return false;
    }
    queue_.push(task);
  }
  queue_changed_.notify_one();
  return true;
}

bool ThreadPool::Join() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return false;
    }
    accepting_ = false;
  }
  queue_changed_.notify_all();
  for (std::thread& worker : workers_) {
    worker.join();
  }
  if (!queue_.empty()) {
    // The workers only exit on an empty queue, so this is a bug.
    ABIMIRROR_DIE(abimirror_exit_code::INTERNAL_ERROR)
        << "ThreadPool error: " << queue_.size()
        << " task(s) remained in queue after Join()";
  }
  return true;
}

}  // namespace threads
}  // namespace abimirror_util

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

#ifndef ABIMIRROR_SRC_MAIN_CPP_UTIL_THRDPOOL_H_
#define ABIMIRROR_SRC_MAIN_CPP_UTIL_THRDPOOL_H_

#include <stddef.h>  // size_t

#include <condition_variable>  // NOLINT
#include <functional>
#include <mutex>  // NOLINT
#include <queue>
#include <thread>  // NOLINT
#include <vector>

namespace abimirror_util {
namespace threads {

// Fixed-size thread pool. Usage:
//   ThreadPool pool(4);
//   for (...) pool.Push([...]() { ... });
//   pool.Join();  // all pushed tasks have run once this returns
class ThreadPool {
 public:
  // Creates this ThreadPool, starting `size` worker threads (at least one).
  explicit ThreadPool(size_t size);

  // Destructor. Also Join()'s the pool.
  ~ThreadPool();

  // Queues a task for one of the worker threads.
  // Returns false, and drops the task, once Join() has been called.
  bool Push(const std::function<void()>& task);

  // Lets the workers drain the queue, then joins them. Returns true for the
  // call that actually joined the threads; later calls return false.
  bool Join();

  size_t size() const { return workers_.size(); }

 private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()> > queue_;
  std::mutex mutex_;
  std::condition_variable queue_changed_;
  bool accepting_;
};

}  // namespace threads
}  // namespace abimirror_util

#endif  // ABIMIRROR_SRC_MAIN_CPP_UTIL_THRDPOOL_H_

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

#ifndef ABIMIRROR_SRC_TOOLS_ABIMIRROR_CANONICAL_ORDER_H_
#define ABIMIRROR_SRC_TOOLS_ABIMIRROR_CANONICAL_ORDER_H_

#include <algorithm>
#include <memory>
#include <vector>

namespace abimirror {

// Returns the elements of `items` ordered by T::operator<. Of several
// elements with equal keys only the one that arrived first is kept.
template <typename T>
std::vector<const T *> CanonicalOrder(
    const std::vector<std::unique_ptr<T>> &items) {
  std::vector<const T *> sorted;
  sorted.reserve(items.size());
  for (const auto &item : items) {
    sorted.push_back(item.get());
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const T *a, const T *b) { return *a < *b; });
  sorted.erase(std::unique(sorted.begin(), sorted.end(),
                           [](const T *a, const T *b) {
                             return !(*a < *b) && !(*b < *a);
                           }),
               sorted.end());
  return sorted;
}

}  // namespace abimirror

#endif  // ABIMIRROR_SRC_TOOLS_ABIMIRROR_CANONICAL_ORDER_H_

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

#ifndef ABIMIRROR_SRC_MAIN_CPP_UTIL_ERRORS_H_
#define ABIMIRROR_SRC_MAIN_CPP_UTIL_ERRORS_H_

#include <string>

namespace abimirror_util {

// Returns the last error as a platform-specific error message.
// The string will also contain the error code itself (`errno`).
std::string GetLastErrorString();

}  // namespace abimirror_util

#endif  // ABIMIRROR_SRC_MAIN_CPP_UTIL_ERRORS_H_

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

#include "src/tools/abimirror/visitors.h"

namespace abimirror {

NullAnnotationVisitor *NullAnnotationVisitor::Instance() {
  static NullAnnotationVisitor *instance = new NullAnnotationVisitor();
  return instance;
}

NullFieldVisitor *NullFieldVisitor::Instance() {
  static NullFieldVisitor *instance = new NullFieldVisitor();
  return instance;
}

NullMethodVisitor *NullMethodVisitor::Instance() {
  static NullMethodVisitor *instance = new NullMethodVisitor();
  return instance;
}

}  // namespace abimirror

/*
 *
 * Copyright 2026 Veritas authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef VERITAS_UTIL_FUNCTION_DELETER_H_
#define VERITAS_UTIL_FUNCTION_DELETER_H_

#include <memory>

namespace veritas {

// A deleter struct that wraps a free()-like function whose pointer parameter
// has a non-void type. Can be used as the second template parameter to a
// std::unique_ptr<T, ...> for C types with custom free functions, such as the
// libcrypto EVP_* objects.
template <typename T, void (*FreeFunction)(T *)>
struct TypedFunctionDeleter {
  void operator()(T *ptr) { FreeFunction(ptr); }
};

// A std::unique_ptr that releases its object with |FreeFunction|.
template <typename T, void (*FreeFunction)(T *)>
using FunctionUniquePtr =
    std::unique_ptr<T, TypedFunctionDeleter<T, FreeFunction>>;

}  // namespace veritas

#endif  // VERITAS_UTIL_FUNCTION_DELETER_H_

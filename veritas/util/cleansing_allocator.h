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

#ifndef VERITAS_UTIL_CLEANSING_ALLOCATOR_H_
#define VERITAS_UTIL_CLEANSING_ALLOCATOR_H_

#include <openssl/crypto.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace veritas {

// An allocator that zeroes out memory before returning it to the underlying
// allocator |A|. Containers that hold key material use it so that no copy of
// a secret outlives the container.
template <typename T, typename A = std::allocator<T>>
class CleansingAllocator : public A {
 public:
  using value_type = T;
  using size_type = std::size_t;

  template <typename U>
  struct rebind {
    using other = CleansingAllocator<
        U, typename std::allocator_traits<A>::template rebind_alloc<U>>;
  };

  CleansingAllocator() = default;

  template <typename U, typename B>
  CleansingAllocator(const CleansingAllocator<U, B> &other) : A(other) {}

  void deallocate(T *ptr, size_type n) {
    OPENSSL_cleanse(ptr, n * sizeof(T));
    A::deallocate(ptr, n);
  }
};

template <typename T, typename A, typename U, typename B>
bool operator==(const CleansingAllocator<T, A> &,
                const CleansingAllocator<U, B> &) {
  return true;
}

template <typename T, typename A, typename U, typename B>
bool operator!=(const CleansingAllocator<T, A> &,
                const CleansingAllocator<U, B> &) {
  return false;
}

template <typename T>
using CleansingVector = std::vector<T, CleansingAllocator<T>>;

}  // namespace veritas

#endif  // VERITAS_UTIL_CLEANSING_ALLOCATOR_H_

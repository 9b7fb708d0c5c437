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

#ifndef VERITAS_UTIL_BYTE_CONTAINER_VIEW_H_
#define VERITAS_UTIL_BYTE_CONTAINER_VIEW_H_

#include <string.h>

#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <type_traits>

#include "absl/strings/string_view.h"
#include "veritas/util/logging.h"

namespace veritas {
namespace internal {

// Exposes a static constexpr boolean member called value, set to true if
// ByteContainerT has one-byte elements and provides data() and size().
template <typename ByteContainerT>
struct is_ro_byte_container_type {
 private:
  template <typename ByteContainerU,
            typename E = typename std::enable_if<
                sizeof(typename ByteContainerU::value_type) == 1>::type>
  static std::true_type CheckSize(const ByteContainerU *u);

  template <typename ByteContainerU>
  static std::false_type CheckSize(...);

  using size_type = decltype(
      CheckSize<ByteContainerT>(static_cast<const ByteContainerT *>(0)));

  template <typename ByteContainerU>
  static auto CheckApi(const ByteContainerU *u)
      -> decltype(u->data(), u->size(), u->begin(), u->end(),
                  std::true_type());

  template <typename ByteContainerU>
  static std::false_type CheckApi(...);

  using api_type = decltype(
      CheckApi<ByteContainerT>(static_cast<const ByteContainerT *>(0)));

 public:
  static constexpr bool value = api_type::value & size_type::value;
};

}  // namespace internal

// ByteContainerView is an immutable, non-owning view over any container of
// bytes (std::string, std::vector<uint8_t>, absl::string_view, raw buffers).
// It is constructed implicitly and cheaply; the caller must keep the
// underlying memory alive for the lifetime of the view.
class ByteContainerView {
 public:
  using value_type = const uint8_t;
  using const_iterator = const uint8_t *;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;
  using iterator = const_iterator;
  using reverse_iterator = const_reverse_iterator;

  ByteContainerView() = delete;

  ByteContainerView(const void *data, size_t size)
      : data_{reinterpret_cast<const uint8_t *>(data)}, size_{size} {}

  ByteContainerView(absl::string_view v)
      : data_{reinterpret_cast<const uint8_t *>(v.data())}, size_{v.size()} {}

  ByteContainerView(const char *cstr)
      : data_{reinterpret_cast<const uint8_t *>(cstr)},
        size_{cstr ? strlen(cstr) : 0} {}

  template <size_t kSize>
  constexpr ByteContainerView(const uint8_t (&data)[kSize])
      : data_{data}, size_{kSize} {}

  template <
      typename ByteContainerT,
      typename E = typename std::enable_if<
          internal::is_ro_byte_container_type<ByteContainerT>::value>::type>
  ByteContainerView(const ByteContainerT &container)
      : data_{reinterpret_cast<const uint8_t *>(container.data())},
        size_{container.size()} {}

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  const_iterator begin() const { return data_; }
  const_iterator end() const { return data_ + size_; }
  const_iterator cbegin() const { return data_; }
  const_iterator cend() const { return data_ + size_; }

  // Per the conventions of the Standard Library, operator[](size_t) does not
  // perform any bounds checks.
  const uint8_t &operator[](size_t offset) const { return data_[offset]; }

  const uint8_t &at(size_t offset) const {
    if (offset >= size_) {
      LOG(FATAL) << "Index out of bounds.";
    }
    return data_[offset];
  }

  bool operator==(ByteContainerView other) const {
    return (size_ == other.size_) &&
           (size_ == 0 || memcmp(data_, other.data_, size_) == 0);
  }

  bool operator!=(ByteContainerView other) const { return !operator==(other); }

 private:
  const uint8_t *data_;
  size_t size_;
};

}  // namespace veritas

#endif  // VERITAS_UTIL_BYTE_CONTAINER_VIEW_H_

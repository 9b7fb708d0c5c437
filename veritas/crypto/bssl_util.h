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

#ifndef VERITAS_CRYPTO_BSSL_UTIL_H_
#define VERITAS_CRYPTO_BSSL_UTIL_H_

#include <openssl/err.h>

#include <string>

namespace veritas {

// Returns a string description of the last error encountered by libcrypto and
// clears the thread's error queue.
std::string BsslLastErrorString();

}  // namespace veritas

#endif  // VERITAS_CRYPTO_BSSL_UTIL_H_

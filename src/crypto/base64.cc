/*
 * crypto/base64.cc
 * -------------------------------------------------------------------------
 * Base64 encoder (implementation).
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "crypto/base64.h"

#include <openssl/evp.h>

#include <vector>

namespace s3xfer {
namespace crypto {

std::string Base64::Encode(const uint8_t *input, size_t size) {
  // 4 output characters per 3 input bytes, plus a trailing null
  std::vector<unsigned char> out(4 * ((size + 2) / 3) + 1);
  const int len = EVP_EncodeBlock(out.data(), input, static_cast<int>(size));
  return std::string(reinterpret_cast<const char *>(out.data()), len);
}

}  // namespace crypto
}  // namespace s3xfer

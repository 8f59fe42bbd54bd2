/*
 * crypto/hmac_sha1.cc
 * -------------------------------------------------------------------------
 * HMAC-SHA1 signer (implementation).
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

#include "crypto/hmac_sha1.h"

#include <openssl/hmac.h>

#include <stdexcept>

namespace s3xfer {
namespace crypto {

void HmacSha1::Sign(const uint8_t *key, size_t key_len, const uint8_t *data,
                    size_t data_len, uint8_t *mac) {
  if (!HMAC(EVP_sha1(), key, static_cast<int>(key_len), data, data_len, mac,
            nullptr))
    throw std::runtime_error("HMAC() failed.");
}

}  // namespace crypto
}  // namespace s3xfer

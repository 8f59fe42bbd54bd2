/*
 * crypto/md5.cc
 * -------------------------------------------------------------------------
 * MD5 hasher (implementation).
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

#include "crypto/md5.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace s3xfer {
namespace crypto {

void Md5::Compute(const uint8_t *input, size_t size, uint8_t *hash) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);

  if (!ctx || !EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) ||
      !EVP_DigestUpdate(ctx.get(), input, size) ||
      !EVP_DigestFinal_ex(ctx.get(), hash, nullptr))
    throw std::runtime_error("error while computing md5.");
}

}  // namespace crypto
}  // namespace s3xfer

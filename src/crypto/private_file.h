/*
 * crypto/private_file.h
 * -------------------------------------------------------------------------
 * Opens files holding credentials.
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

#ifndef S3XFER_CRYPTO_PRIVATE_FILE_H
#define S3XFER_CRYPTO_PRIVATE_FILE_H

#include <fstream>
#include <string>

namespace s3xfer {
namespace crypto {
class PrivateFile {
 public:
  // Throws std::runtime_error if |file| can't be opened, or if anyone but its
  // owner has access to it (0400 and 0600 are fine).
  static void Open(const std::string &file, std::ifstream *f);
};
}  // namespace crypto
}  // namespace s3xfer

#endif

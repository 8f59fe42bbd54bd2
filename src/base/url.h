/*
 * base/url.h
 * -------------------------------------------------------------------------
 * URL-related functions.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2019, Tarick Bedeir.
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

#ifndef S3XFER_BASE_URL_H
#define S3XFER_BASE_URL_H

#include <string>

namespace s3xfer {
namespace base {

class Url {
 public:
  // Percent-encodes everything but ASCII alphanumerics, "_.-" and the
  // characters in |safe|.
  static std::string Encode(const std::string &url,
                            const std::string &safe = "/");
};
}  // namespace base
}  // namespace s3xfer

#endif

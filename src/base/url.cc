/*
 * base/url.cc
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

#include "base/url.h"

#include <cstdint>
#include <string>

namespace s3xfer {
namespace base {

std::string Url::Encode(const std::string &url, const std::string &safe) {
  constexpr char HEX[] = "0123456789ABCDEF";

  std::string ret;
  ret.reserve(url.length());

  for (const char c : url) {
    const auto u = static_cast<uint8_t>(c);

    // isalnum() is locale-dependent and accepts some high-bit characters, so
    // test the ASCII ranges directly
    if ((u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') ||
        (u >= 'A' && u <= 'Z') || c == '_' || c == '.' || c == '-' ||
        safe.find(c) != std::string::npos) {
      ret += c;
    } else {
      // spaces become "%20" rather than "+"
      ret += '%';
      ret += HEX[u / 16];
      ret += HEX[u % 16];
    }
  }

  return ret;
}

}  // namespace base
}  // namespace s3xfer

/*
 * fs/mime_types.h
 * -------------------------------------------------------------------------
 * MIME type lookup declaration.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2013, Tarick Bedeir.
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

#ifndef S3XFER_FS_MIME_TYPES_H
#define S3XFER_FS_MIME_TYPES_H

#include <string>

namespace s3xfer {
namespace fs {
class MimeTypes {
 public:
  // Loads built-in defaults, then the system mime.types files, then
  // Config::mime_types_file(). Later entries win. Safe to call more than
  // once, but not concurrently with lookups.
  static void Init();

  // Case-insensitive; returns "" when unknown.
  static std::string GetTypeByExtension(std::string ext);

  // Looks up the extension of the last component of |path|. Returns "" when
  // there is no extension or it is unknown.
  static std::string GuessType(const std::string &path);
};
}  // namespace fs
}  // namespace s3xfer

#endif

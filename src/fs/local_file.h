/*
 * fs/local_file.h
 * -------------------------------------------------------------------------
 * Whole-file reads and writes on the local file system.
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

#ifndef S3XFER_FS_LOCAL_FILE_H
#define S3XFER_FS_LOCAL_FILE_H

#include <time.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace s3xfer {
namespace fs {
class LocalFileError : public std::runtime_error {
 public:
  LocalFileError(const std::string &action, const std::string &path, int err);

  inline const std::string &path() const { return path_; }
  inline int error_number() const { return error_number_; }

 private:
  std::string path_;
  int error_number_;
};

class LocalFile {
 public:
  static std::vector<char> Read(const std::string &path);

  // Writes |data| to a temporary file next to |path| and renames it into
  // place, so |path| never holds a partial file. Missing parent directories
  // are created. atime and mtime are then set to |mtime|.
  static void Save(const std::string &path, const std::vector<char> &data,
                   time_t mtime);

  static void Remove(const std::string &path);

  // mkdir -p. A directory that already exists (or that another process
  // creates while we're at it) is not an error.
  static void MakeDirectories(const std::string &path);
};
}  // namespace fs
}  // namespace s3xfer

#endif

/*
 * tasks/file_info.h
 * -------------------------------------------------------------------------
 * Describes one unit of work: where it comes from and where it goes.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2014, Tarick Bedeir.
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

#ifndef S3XFER_TASKS_FILE_INFO_H
#define S3XFER_TASKS_FILE_INFO_H

#include <time.h>

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

namespace s3xfer {
namespace tasks {
enum class PathType { UNSET, LOCAL, S3 };

const char *PathTypeToString(PathType type);

// "bucket/a/b" -> ("bucket", "a/b"). A leading "s3://" is ignored. Either
// part may come back empty.
void SplitBucketKey(const std::string &path, std::string *bucket,
                    std::string *key);

// Local paths are absolute; S3 paths are "bucket/key".
struct FileInfo {
  std::string src;
  std::string dest;

  // Name relative to the directory or prefix being transferred. Not used by
  // the tasks themselves.
  std::string compare_key;

  boost::optional<uint64_t> size;

  // If set, a download uses this as the local mtime instead of the store's
  // Last-Modified.
  boost::optional<time_t> last_update;

  PathType src_type = PathType::UNSET;
  PathType dest_type = PathType::UNSET;

  // Descriptive only (e.g., "upload").
  std::string operation;
};
}  // namespace tasks
}  // namespace s3xfer

#endif

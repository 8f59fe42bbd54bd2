/*
 * tasks/file_info.cc
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

#include "tasks/file_info.h"

#include <stdexcept>

namespace s3xfer {
namespace tasks {

namespace {
const std::string S3_SCHEME = "s3://";
}  // namespace

const char *PathTypeToString(PathType type) {
  switch (type) {
    case PathType::UNSET:
      return "unset";
    case PathType::LOCAL:
      return "local";
    case PathType::S3:
      return "s3";
  }
  throw std::runtime_error("invalid path type.");
}

void SplitBucketKey(const std::string &path, std::string *bucket,
                    std::string *key) {
  std::string s3_path = path;

  if (s3_path.compare(0, S3_SCHEME.size(), S3_SCHEME) == 0)
    s3_path = s3_path.substr(S3_SCHEME.size());

  const size_t pos = s3_path.find('/');

  if (pos == std::string::npos) {
    *bucket = s3_path;
    key->clear();
  } else {
    *bucket = s3_path.substr(0, pos);
    *key = s3_path.substr(pos + 1);
  }
}

}  // namespace tasks
}  // namespace s3xfer

/*
 * tasks/bucket_task.h
 * -------------------------------------------------------------------------
 * Bucket-level tasks: listing, creation and removal.
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

#ifndef S3XFER_TASKS_BUCKET_TASK_H
#define S3XFER_TASKS_BUCKET_TASK_H

#include <memory>
#include <ostream>
#include <string>

#include "tasks/file_info.h"

namespace s3xfer {
namespace services {
class Service;
}

namespace tasks {
class BucketTask {
 public:
  // |src| is "bucket/prefix" (or empty to mean "all buckets"). Throws
  // std::invalid_argument if |service| is null.
  BucketTask(std::shared_ptr<services::Service> service, const std::string &src,
             PathType src_type = PathType::S3,
             const std::string &operation = "");

  inline const std::string &src() const { return src_; }
  inline PathType src_type() const { return src_type_; }
  inline const std::string &operation() const { return operation_; }

  // With no bucket, prints every bucket in the account. Otherwise prints the
  // objects and common prefixes directly under the prefix. Each line is
  // flushed as soon as it is written.
  void List(std::ostream *out);

  // Sends a location constraint unless the service's region is
  // Config::default_region().
  void MakeBucket();

  void RemoveBucket();

 private:
  void ListBuckets(std::ostream *out);
  void ListObjects(const std::string &bucket, const std::string &prefix,
                   std::ostream *out);

  std::shared_ptr<services::Service> service_;
  std::string src_;
  PathType src_type_;
  std::string operation_;
};
}  // namespace tasks
}  // namespace s3xfer

#endif

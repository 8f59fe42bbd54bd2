/*
 * tasks/task.h
 * -------------------------------------------------------------------------
 * A single work item: either a bucket task or a file task.
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

#ifndef S3XFER_TASKS_TASK_H
#define S3XFER_TASKS_TASK_H

#include <iostream>
#include <string>

#include <boost/optional.hpp>

#include "tasks/bucket_task.h"
#include "tasks/file_task.h"

namespace s3xfer {
namespace tasks {
class Task {
 public:
  enum class Kind { BUCKET, FILE };

  enum class Command {
    LIST,
    MAKE_BUCKET,
    REMOVE_BUCKET,
    UPLOAD,
    DOWNLOAD,
    COPY,
    MOVE,
    DELETE,
    CREATE_MULTIPART_UPLOAD
  };

  static const char *CommandToString(Command command);

  explicit Task(const BucketTask &task);
  explicit Task(const FileTask &task);

  inline Kind kind() const { return kind_; }

  // Throws std::logic_error if kind() doesn't match.
  const BucketTask &bucket_task() const;
  const FileTask &file_task() const;

  // |out| is only used by LIST. Throws ValidationError if |command| doesn't
  // apply to kind().
  void Run(Command command, std::ostream *out = &std::cout);

  // Set by a successful CREATE_MULTIPART_UPLOAD.
  inline const std::string &upload_id() const { return upload_id_; }

 private:
  Kind kind_;
  boost::optional<BucketTask> bucket_task_;
  boost::optional<FileTask> file_task_;
  std::string upload_id_;
};
}  // namespace tasks
}  // namespace s3xfer

#endif

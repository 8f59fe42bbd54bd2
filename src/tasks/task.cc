/*
 * tasks/task.cc
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

#include "tasks/task.h"

#include <stdexcept>
#include <string>

#include "tasks/errors.h"

namespace s3xfer {
namespace tasks {

namespace {
ValidationError InvalidCommand(Task::Command command, const char *kind) {
  return ValidationError(std::string("command ") +
                         Task::CommandToString(command) +
                         " does not apply to a " + kind + " task.");
}
}  // namespace

const char *Task::CommandToString(Command command) {
  switch (command) {
    case Command::LIST:
      return "list";
    case Command::MAKE_BUCKET:
      return "make_bucket";
    case Command::REMOVE_BUCKET:
      return "remove_bucket";
    case Command::UPLOAD:
      return "upload";
    case Command::DOWNLOAD:
      return "download";
    case Command::COPY:
      return "copy";
    case Command::MOVE:
      return "move";
    case Command::DELETE:
      return "delete";
    case Command::CREATE_MULTIPART_UPLOAD:
      return "create_multipart_upload";
  }
  throw std::runtime_error("invalid command.");
}

Task::Task(const BucketTask &task) : kind_(Kind::BUCKET), bucket_task_(task) {}

Task::Task(const FileTask &task) : kind_(Kind::FILE), file_task_(task) {}

const BucketTask &Task::bucket_task() const {
  if (!bucket_task_) throw std::logic_error("not a bucket task.");
  return *bucket_task_;
}

const FileTask &Task::file_task() const {
  if (!file_task_) throw std::logic_error("not a file task.");
  return *file_task_;
}

void Task::Run(Command command, std::ostream *out) {
  if (kind_ == Kind::BUCKET) {
    switch (command) {
      case Command::LIST:
        bucket_task_->List(out);
        return;
      case Command::MAKE_BUCKET:
        bucket_task_->MakeBucket();
        return;
      case Command::REMOVE_BUCKET:
        bucket_task_->RemoveBucket();
        return;
      default:
        throw InvalidCommand(command, "bucket");
    }
  }

  switch (command) {
    case Command::UPLOAD:
      file_task_->Upload();
      return;
    case Command::DOWNLOAD:
      file_task_->Download();
      return;
    case Command::COPY:
      file_task_->Copy();
      return;
    case Command::MOVE:
      file_task_->Move();
      return;
    case Command::DELETE:
      file_task_->Delete();
      return;
    case Command::CREATE_MULTIPART_UPLOAD:
      upload_id_ = file_task_->CreateMultipartUpload();
      return;
    default:
      throw InvalidCommand(command, "file");
  }
}

}  // namespace tasks
}  // namespace s3xfer

/*
 * tasks/file_task.h
 * -------------------------------------------------------------------------
 * Object-level tasks: upload, download, copy, delete and move.
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

#ifndef S3XFER_TASKS_FILE_TASK_H
#define S3XFER_TASKS_FILE_TASK_H

#include <memory>
#include <string>
#include <vector>

#include "services/operation.h"
#include "services/params.h"
#include "services/response.h"
#include "tasks/file_info.h"
#include "tasks/transfer_options.h"

namespace s3xfer {
namespace services {
class Service;
}

namespace tasks {
enum class TransferDirection { INVALID, UPLOAD, COPY, DOWNLOAD };

// local -> s3 is an upload, s3 -> s3 a copy, s3 -> local a download.
// Everything else is INVALID.
TransferDirection GetTransferDirection(PathType src, PathType dest);

// One object-level operation. A FileTask holds no state between calls and is
// meant to be run once, by one worker.
class FileTask {
 public:
  // Validates |options|. Throws ValidationError for malformed options and
  // std::invalid_argument if |service| is null.
  FileTask(std::shared_ptr<services::Service> service, const FileInfo &info,
           const TransferOptions &options = TransferOptions());

  inline const FileInfo &info() const { return info_; }
  inline const TransferOptions &options() const { return options_; }

  // Local src -> S3 dest. Throws IntegrityError if the returned ETag doesn't
  // match the bytes sent.
  void Upload();

  // S3 src -> local dest. The checksum is verified before anything is
  // written; on mismatch, dest is left untouched.
  void Download();

  // S3 src -> S3 dest, within the store.
  void Copy();

  // Removes src, locally or in the store depending on src_type.
  void Delete();

  // Transfer, then Delete(). src is removed only if the transfer succeeded.
  void Move();

  // Returns the upload id for dest.
  std::string CreateMultipartUpload();

 private:
  services::Response Call(services::Operation op,
                          const services::Params &params);

  services::Params GetParams(const std::string &path);

  std::shared_ptr<services::Service> service_;
  FileInfo info_;
  TransferOptions options_;
};
}  // namespace tasks
}  // namespace s3xfer

#endif

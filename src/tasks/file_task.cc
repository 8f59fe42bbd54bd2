/*
 * tasks/file_task.cc
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

#include "tasks/file_task.h"

#include <time.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "base/logger.h"
#include "base/timer.h"
#include "base/url.h"
#include "crypto/hash.h"
#include "crypto/hex_with_quotes.h"
#include "crypto/md5.h"
#include "fs/local_file.h"
#include "services/service.h"
#include "tasks/errors.h"

namespace s3xfer {
namespace tasks {

namespace {
std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return str;
}

// ETags for multipart objects ("<hex>-<parts>") aren't MD5 digests of the
// content, so they can't be checked.
void CheckEtag(const std::string &path, std::string etag,
               const std::vector<char> &data) {
  const std::string computed =
      crypto::Hash::Compute<crypto::Md5, crypto::HexWithQuotes>(data);

  if (etag.empty()) {
    S3XFER_LOG(LOG_ERR, "tasks::CheckEtag", "no ETag returned for [%s].\n",
               path.c_str());
    throw IntegrityError(path, etag, computed);
  }

  if (etag.front() != '"') etag = "\"" + etag + "\"";

  if (!crypto::Md5::IsValidQuotedHexHash(etag)) {
    S3XFER_LOG(LOG_DEBUG, "tasks::CheckEtag",
               "not checking non-MD5 ETag %s for [%s].\n", etag.c_str(),
               path.c_str());
    return;
  }

  if (ToLower(etag) != computed) {
    S3XFER_LOG(LOG_ERR, "tasks::CheckEtag",
               "checksum mismatch for [%s]: expected %s, computed %s.\n",
               path.c_str(), etag.c_str(), computed.c_str());
    throw IntegrityError(path, etag, computed);
  }
}
}  // namespace

TransferDirection GetTransferDirection(PathType src, PathType dest) {
  if (src == PathType::LOCAL && dest == PathType::S3)
    return TransferDirection::UPLOAD;
  if (src == PathType::S3 && dest == PathType::S3)
    return TransferDirection::COPY;
  if (src == PathType::S3 && dest == PathType::LOCAL)
    return TransferDirection::DOWNLOAD;

  return TransferDirection::INVALID;
}

FileTask::FileTask(std::shared_ptr<services::Service> service,
                   const FileInfo &info, const TransferOptions &options)
    : service_(service), info_(info), options_(options) {
  if (!service_) throw std::invalid_argument("service cannot be null.");

  options_.Validate();
}

services::Response FileTask::Call(services::Operation op,
                                  const services::Params &params) {
  S3XFER_LOG(LOG_DEBUG, "FileTask::Call", "%s on [%s/%s].\n",
             services::OperationToString(op), params.bucket().c_str(),
             params.key().c_str());

  try {
    return service_->Call(op, params);
  } catch (const std::exception &e) {
    S3XFER_LOG(LOG_WARNING, "FileTask::Call", "%s on [%s/%s] failed: %s\n",
               services::OperationToString(op), params.bucket().c_str(),
               params.key().c_str(), e.what());
    throw;
  }
}

services::Params FileTask::GetParams(const std::string &path) {
  std::string bucket, key;

  SplitBucketKey(path, &bucket, &key);

  return services::Params(bucket, key);
}

void FileTask::Upload() {
  std::vector<char> body = fs::LocalFile::Read(info_.src);
  services::Params params = GetParams(info_.dest);

  // zero-length objects are sent without a body
  if (!body.empty()) params.set_body(std::vector<char>(body));

  options_.ApplyTo(info_.src, &params);

  const services::Response response =
      Call(services::Operation::PUT_OBJECT, params);

  CheckEtag(info_.src, response.Value(services::DATA_ETAG), body);
}

void FileTask::Download() {
  const services::Response response =
      Call(services::Operation::GET_OBJECT, GetParams(info_.src));
  const std::vector<char> &data = response.raw().payload;
  time_t mtime = 0;

  CheckEtag(info_.src, response.Value(services::DATA_ETAG), data);

  if (info_.last_update) {
    mtime = *info_.last_update;
  } else if (response.HasValue(services::DATA_LAST_MODIFIED)) {
    mtime = base::Timer::ParseHttpTime(
        response.Value(services::DATA_LAST_MODIFIED));
  } else {
    S3XFER_LOG(LOG_DEBUG, "FileTask::Download",
               "no Last-Modified for [%s]. using current time.\n",
               info_.src.c_str());
    mtime = time(nullptr);
  }

  fs::LocalFile::Save(info_.dest, data, mtime);
}

void FileTask::Copy() {
  services::Params params = GetParams(info_.dest);

  params.Set(services::Field::COPY_SOURCE, base::Url::Encode(info_.src, "/~"));
  options_.ApplyTo(info_.src, &params);

  Call(services::Operation::COPY_OBJECT, params);
}

void FileTask::Delete() {
  if (info_.src_type == PathType::S3) {
    Call(services::Operation::DELETE_OBJECT, GetParams(info_.src));
  } else if (info_.src_type == PathType::LOCAL) {
    S3XFER_LOG(LOG_DEBUG, "FileTask::Delete", "removing [%s].\n",
               info_.src.c_str());
    fs::LocalFile::Remove(info_.src);
  } else {
    throw ValidationError("cannot delete [" + info_.src +
                          "]: source type not set.");
  }
}

void FileTask::Move() {
  switch (GetTransferDirection(info_.src_type, info_.dest_type)) {
    case TransferDirection::UPLOAD:
      Upload();
      break;

    case TransferDirection::COPY:
      Copy();
      break;

    case TransferDirection::DOWNLOAD:
      Download();
      break;

    case TransferDirection::INVALID:
      throw ValidationError(std::string("invalid path arguments for mv: ") +
                            PathTypeToString(info_.src_type) + " to " +
                            PathTypeToString(info_.dest_type) + ".");
  }

  Delete();
}

std::string FileTask::CreateMultipartUpload() {
  services::Params params = GetParams(info_.dest);

  options_.ApplyTo(info_.src, &params);

  return Call(services::Operation::CREATE_MULTIPART_UPLOAD, params)
      .Value(services::DATA_UPLOAD_ID);
}

}  // namespace tasks
}  // namespace s3xfer

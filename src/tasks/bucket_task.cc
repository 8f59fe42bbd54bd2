/*
 * tasks/bucket_task.cc
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

#include "tasks/bucket_task.h"

#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/timer.h"
#include "services/paginator.h"
#include "services/service.h"
#include "services/utils.h"

namespace s3xfer {
namespace tasks {

namespace {
constexpr int TIME_WIDTH = 19;
constexpr int LENGTH_WIDTH = 10;
constexpr int PRE_WIDTH = 30;

std::string RightJustify(const std::string &str, size_t width) {
  if (str.size() >= width) return str;
  return std::string(width - str.size(), ' ') + str;
}

std::string LeftJustify(const std::string &str, size_t width) {
  if (str.size() >= width) return str;
  return str + std::string(width - str.size(), ' ');
}

std::string FormatTime(const std::string &iso_time) {
  return LeftJustify(
      base::Timer::GetLocalTimeString(base::Timer::ParseIsoTime(iso_time)),
      TIME_WIDTH);
}

// "a/b/c" -> "c"
std::string GetLastComponent(const std::string &path) {
  const size_t pos = path.rfind('/');
  return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

void WriteLine(std::ostream *out, const std::string &line) {
  *out << line << "\n";
  out->flush();
}
}  // namespace

BucketTask::BucketTask(std::shared_ptr<services::Service> service,
                       const std::string &src, PathType src_type,
                       const std::string &operation)
    : service_(service),
      src_(src),
      src_type_(src_type),
      operation_(operation) {
  if (!service_) throw std::invalid_argument("service cannot be null.");
}

void BucketTask::List(std::ostream *out) {
  std::string bucket, prefix;

  SplitBucketKey(src_, &bucket, &prefix);

  if (bucket.empty())
    ListBuckets(out);
  else
    ListObjects(bucket, prefix, out);
}

void BucketTask::ListBuckets(std::ostream *out) {
  const services::Response response =
      service_->Call(services::Operation::LIST_BUCKETS, services::Params());

  *out << "\n";
  WriteLine(out, RightJustify("CreationTime", TIME_WIDTH) + " Bucket");
  WriteLine(out, RightJustify("------------", TIME_WIDTH) + " ------");

  for (const auto &bucket : response.List(services::DATA_BUCKETS))
    WriteLine(out, FormatTime(services::FindOrDefault(bucket, "CreationDate")) +
                       " " + services::FindOrDefault(bucket, "Name"));
}

void BucketTask::ListObjects(const std::string &bucket,
                             const std::string &prefix, std::ostream *out) {
  services::Params params(bucket, "");

  params.Set(services::Field::PREFIX, prefix);
  params.Set(services::Field::DELIMITER, "/");

  *out << "\nBucket: " << bucket << "\n";
  *out << "Prefix: " << prefix << "\n\n";
  WriteLine(out, RightJustify("LastWriteTime", TIME_WIDTH) + " " +
                     RightJustify("Length", LENGTH_WIDTH) + " Name");
  WriteLine(out, RightJustify("-------------", TIME_WIDTH) + " " +
                     RightJustify("------", LENGTH_WIDTH) + " ----");

  services::Paginate(
      service_.get(), params, [out](const services::Response &page) {
        for (const auto &common_prefix :
             page.List(services::DATA_COMMON_PREFIXES)) {
          std::string dir = services::FindOrDefault(common_prefix, "Prefix");

          if (!dir.empty() && dir.back() == '/') dir.pop_back();

          WriteLine(out, RightJustify("PRE", PRE_WIDTH) + " " +
                             GetLastComponent(dir) + "/");
        }

        for (const auto &content : page.List(services::DATA_CONTENTS)) {
          const std::string &modified =
              services::FindOrDefault(content, "LastModified");
          const std::string &size = services::FindOrDefault(content, "Size");
          const std::string &key = services::FindOrDefault(content, "Key");

          WriteLine(out, FormatTime(modified) + " " +
                             RightJustify(size, LENGTH_WIDTH) + " " +
                             GetLastComponent(key));
        }
      });
}

void BucketTask::MakeBucket() {
  std::string bucket, key;
  services::Params params;

  SplitBucketKey(src_, &bucket, &key);
  params.set_bucket(bucket);

  if (service_->region() != base::Config::default_region())
    params.Set(services::Field::LOCATION_CONSTRAINT, service_->region());

  S3XFER_LOG(LOG_DEBUG, "BucketTask::MakeBucket", "creating [%s] in [%s].\n",
             bucket.c_str(), service_->region().c_str());

  service_->Call(services::Operation::CREATE_BUCKET, params);
}

void BucketTask::RemoveBucket() {
  std::string bucket, key;
  services::Params params;

  SplitBucketKey(src_, &bucket, &key);
  params.set_bucket(bucket);

  S3XFER_LOG(LOG_DEBUG, "BucketTask::RemoveBucket", "removing [%s].\n",
             bucket.c_str());

  service_->Call(services::Operation::DELETE_BUCKET, params);
}

}  // namespace tasks
}  // namespace s3xfer

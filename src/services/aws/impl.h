/*
 * services/aws/impl.h
 * -------------------------------------------------------------------------
 * Service binding for Amazon S3 (path-style, signature version 2).
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

#ifndef S3XFER_SERVICES_AWS_IMPL_H
#define S3XFER_SERVICES_AWS_IMPL_H

#include <memory>
#include <string>

#include "base/request.h"
#include "base/request_hook.h"
#include "services/service.h"

namespace s3xfer {
namespace services {
namespace aws {
class Impl : public Service, public base::RequestHook {
 public:
  // Credentials come from Config::secret_file().
  explicit Impl(const std::string &region);
  Impl(const std::string &region, const std::string &key,
       const std::string &secret);

  ~Impl() override = default;

  // Headers for every field that travels as a header. Fields that become
  // query parameters or body content are skipped.
  static base::HeaderMap ParamsToHeaders(const Params &params);

  // Empty if |location_constraint| is empty.
  static std::string GetCreateBucketBody(
      const std::string &location_constraint);

  // "s3.amazonaws.com" stands for the default region; other regions get their
  // own host.
  static std::string GetEndpoint(const std::string &region);

  // BEGIN Service
  std::string region() const override;
  Response Call(Operation op, const Params &params) override;
  // END Service

  // BEGIN base::RequestHook
  std::string AdjustUrl(const std::string &url) override;
  void PreRun(base::Request *r, int iter) override;
  bool ShouldRetry(base::Request *r, int iter) override;
  // END base::RequestHook

 private:
  void Sign(base::Request *req);

  void Prepare(Operation op, const Params &params, base::Request *req);
  void Parse(Operation op, const base::Request &req, Response *response);
  void CheckForError(Operation op, const base::Request &req);

  std::string region_, key_, secret_, endpoint_;
};
}  // namespace aws
}  // namespace services
}  // namespace s3xfer

#endif

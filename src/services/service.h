/*
 * services/service.h
 * -------------------------------------------------------------------------
 * Bound service handle: invokes named operations on the object store.
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

#ifndef S3XFER_SERVICES_SERVICE_H
#define S3XFER_SERVICES_SERVICE_H

#include <memory>
#include <stdexcept>
#include <string>

#include "services/operation.h"
#include "services/params.h"
#include "services/response.h"

namespace s3xfer {
namespace services {
class ServiceError : public std::runtime_error {
 public:
  ServiceError(Operation op, const std::string &code,
               const std::string &message, int http_code = 0);

  inline Operation op() const { return op_; }
  inline const std::string &code() const { return code_; }
  inline const std::string &message() const { return message_; }
  inline int http_code() const { return http_code_; }

 private:
  Operation op_;
  std::string code_, message_;
  int http_code_;
};

class Service {
 public:
  // Reads credentials and endpoint settings from the configuration. The
  // returned handle is ready for Call().
  static std::shared_ptr<Service> Create(const std::string &region);

  virtual ~Service() = default;

  virtual std::string region() const = 0;

  // Throws ServiceError if the store rejects the request or cannot be
  // reached.
  virtual Response Call(Operation op, const Params &params) = 0;
};
}  // namespace services
}  // namespace s3xfer

#endif

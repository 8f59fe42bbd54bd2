/*
 * services/service.cc
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

#include "services/service.h"

#include <memory>

#include "services/aws/impl.h"

namespace s3xfer {
namespace services {

namespace {
std::string BuildMessage(Operation op, const std::string &code,
                         const std::string &message) {
  return std::string("An error occurred (") + code + ") when calling the " +
         OperationToString(op) + " operation: " + message;
}
}  // namespace

ServiceError::ServiceError(Operation op, const std::string &code,
                           const std::string &message, int http_code)
    : std::runtime_error(BuildMessage(op, code, message)),
      op_(op),
      code_(code),
      message_(message),
      http_code_(http_code) {}

std::shared_ptr<Service> Service::Create(const std::string &region) {
  return std::make_shared<aws::Impl>(region);
}

}  // namespace services
}  // namespace s3xfer

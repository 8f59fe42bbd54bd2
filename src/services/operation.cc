/*
 * services/operation.cc
 * -------------------------------------------------------------------------
 * Remote operations a service binding can perform.
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

#include "services/operation.h"

#include <stdexcept>

namespace s3xfer {
namespace services {

const char *OperationToString(Operation op) {
  switch (op) {
    case Operation::LIST_BUCKETS:
      return "ListBuckets";
    case Operation::LIST_OBJECTS:
      return "ListObjects";
    case Operation::CREATE_BUCKET:
      return "CreateBucket";
    case Operation::DELETE_BUCKET:
      return "DeleteBucket";
    case Operation::PUT_OBJECT:
      return "PutObject";
    case Operation::GET_OBJECT:
      return "GetObject";
    case Operation::COPY_OBJECT:
      return "CopyObject";
    case Operation::DELETE_OBJECT:
      return "DeleteObject";
    case Operation::CREATE_MULTIPART_UPLOAD:
      return "CreateMultipartUpload";
  }
  throw std::runtime_error("invalid operation.");
}

}  // namespace services
}  // namespace s3xfer

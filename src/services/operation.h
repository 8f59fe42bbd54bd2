/*
 * services/operation.h
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

#ifndef S3XFER_SERVICES_OPERATION_H
#define S3XFER_SERVICES_OPERATION_H

namespace s3xfer {
namespace services {
enum class Operation {
  LIST_BUCKETS,
  LIST_OBJECTS,
  CREATE_BUCKET,
  DELETE_BUCKET,
  PUT_OBJECT,
  GET_OBJECT,
  COPY_OBJECT,
  DELETE_OBJECT,
  CREATE_MULTIPART_UPLOAD
};

// API names, e.g. "PutObject".
const char *OperationToString(Operation op);
}  // namespace services
}  // namespace s3xfer

#endif

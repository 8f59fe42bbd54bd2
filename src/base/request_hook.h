/*
 * base/request_hook.h
 * -------------------------------------------------------------------------
 * Hook for signing, URL rewriting and retry decisions on requests.
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

#ifndef S3XFER_BASE_REQUEST_HOOK_H
#define S3XFER_BASE_REQUEST_HOOK_H

#include <string>

namespace s3xfer {
namespace base {
class Request;

class RequestHook {
 public:
  virtual ~RequestHook() = default;

  virtual std::string AdjustUrl(const std::string &url) = 0;
  virtual void PreRun(Request *req, int iter) = 0;
  virtual bool ShouldRetry(Request *req, int iter) = 0;
};
}  // namespace base
}  // namespace s3xfer

#endif

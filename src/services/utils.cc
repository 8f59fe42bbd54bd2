/*
 * services/utils.cc
 * -------------------------------------------------------------------------
 * Helpers shared by service bindings.
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

#include "services/utils.h"

#include "base/logger.h"
#include "base/request.h"
#include "base/xml.h"

namespace s3xfer {
namespace services {

namespace {
constexpr char REQ_TIMEOUT_XPATH[] = "/Error/Code[text() = 'RequestTimeout']";
}  // namespace

bool GenericShouldRetry(base::Request *r, int iter) {
  const int rc = r->response_code();

  if (rc == base::HTTP_SC_INTERNAL_SERVER_ERROR ||
      rc == base::HTTP_SC_SERVICE_UNAVAILABLE) {
    S3XFER_LOG(LOG_DEBUG, "services::GenericShouldRetry",
               "got %i for [%s] on attempt %i.\n", rc, r->url().c_str(), iter);
    return true;
  }

  if (rc == base::HTTP_SC_BAD_REQUEST) {
    auto xml = base::XmlDocument::Parse(r->GetOutputAsString());
    return xml && xml->Match(REQ_TIMEOUT_XPATH);
  }

  return false;
}

}  // namespace services
}  // namespace s3xfer

/*
 * services/paginator.cc
 * -------------------------------------------------------------------------
 * Walks every page of an object listing.
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

#include "services/paginator.h"

#include <stdexcept>
#include <string>

#include "base/logger.h"
#include "services/operation.h"
#include "services/service.h"
#include "services/utils.h"

namespace s3xfer {
namespace services {

namespace {
// Without NextMarker (no delimiter), the next page starts after the last key
// or prefix returned, whichever sorts later.
std::string GetLastMarker(const Response &page) {
  std::string marker;

  const auto &contents = page.List(DATA_CONTENTS);
  if (!contents.empty()) marker = FindOrDefault(contents.back(), "Key");

  const auto &prefixes = page.List(DATA_COMMON_PREFIXES);
  if (!prefixes.empty()) {
    const std::string &prefix = FindOrDefault(prefixes.back(), "Prefix");
    if (prefix > marker) marker = prefix;
  }

  return marker;
}
}  // namespace

void Paginate(Service *service, Params params, const PageCallback &on_page) {
  if (!service) throw std::invalid_argument("service cannot be null.");

  while (true) {
    const Response page = service->Call(Operation::LIST_OBJECTS, params);
    on_page(page);

    if (page.Value(DATA_IS_TRUNCATED) != "true") break;

    std::string marker = page.Value(DATA_NEXT_MARKER);
    if (marker.empty()) marker = GetLastMarker(page);

    if (marker.empty() || marker == params.Get(Field::MARKER)) {
      S3XFER_LOG(LOG_WARNING, "services::Paginate",
                 "truncated listing for [%s] did not advance. stopping.\n",
                 params.bucket().c_str());
      break;
    }

    params.Set(Field::MARKER, marker);
  }
}

}  // namespace services
}  // namespace s3xfer

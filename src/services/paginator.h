/*
 * services/paginator.h
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

#ifndef S3XFER_SERVICES_PAGINATOR_H
#define S3XFER_SERVICES_PAGINATOR_H

#include <functional>

#include "services/params.h"
#include "services/response.h"

namespace s3xfer {
namespace services {
class Service;

using PageCallback = std::function<void(const Response &page)>;

// Issues LIST_OBJECTS until the listing is no longer truncated, calling
// |on_page| once per page. Pages are not buffered.
void Paginate(Service *service, Params params, const PageCallback &on_page);
}  // namespace services
}  // namespace s3xfer

#endif

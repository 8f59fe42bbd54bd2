/*
 * services/params.cc
 * -------------------------------------------------------------------------
 * Request parameters for a service operation.
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

#include "services/params.h"

#include <stdexcept>

namespace s3xfer {
namespace services {

const char *FieldToString(Field field) {
  switch (field) {
    case Field::ACL:
      return "acl";
    case Field::GRANT_READ:
      return "grant_read";
    case Field::GRANT_FULL_CONTROL:
      return "grant_full_control";
    case Field::GRANT_READ_ACP:
      return "grant_read_acp";
    case Field::GRANT_WRITE_ACP:
      return "grant_write_acp";
    case Field::SERVER_SIDE_ENCRYPTION:
      return "server_side_encryption";
    case Field::STORAGE_CLASS:
      return "storage_class";
    case Field::WEBSITE_REDIRECT_LOCATION:
      return "website_redirect_location";
    case Field::CONTENT_TYPE:
      return "content_type";
    case Field::CACHE_CONTROL:
      return "cache_control";
    case Field::CONTENT_DISPOSITION:
      return "content_disposition";
    case Field::CONTENT_ENCODING:
      return "content_encoding";
    case Field::CONTENT_LANGUAGE:
      return "content_language";
    case Field::EXPIRES:
      return "expires";
    case Field::COPY_SOURCE:
      return "copy_source";
    case Field::PREFIX:
      return "prefix";
    case Field::DELIMITER:
      return "delimiter";
    case Field::MARKER:
      return "marker";
    case Field::LOCATION_CONSTRAINT:
      return "location_constraint";
  }
  throw std::runtime_error("invalid field.");
}

}  // namespace services
}  // namespace s3xfer

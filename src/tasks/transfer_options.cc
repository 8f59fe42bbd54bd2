/*
 * tasks/transfer_options.cc
 * -------------------------------------------------------------------------
 * Per-object options (ACLs, metadata) applied to outgoing requests.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2014, Tarick Bedeir.
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

#include "tasks/transfer_options.h"

#include <stdexcept>

#include "base/logger.h"
#include "fs/mime_types.h"
#include "services/params.h"
#include "tasks/errors.h"

namespace s3xfer {
namespace tasks {

namespace {
constexpr char SSE_ALGORITHM[] = "AES256";

void SetIfPresent(const boost::optional<std::string> &value,
                  services::Field field, services::Params *params) {
  if (value) params->Set(field, *value);
}
}  // namespace

Grants TransferOptions::ParseGrants(const std::vector<std::string> &grants) {
  Grants parsed;

  for (const auto &grant : grants) {
    const size_t pos = grant.find('=');

    if (pos == std::string::npos)
      throw ValidationError(
          "grants should be of the form permission=principal");

    const std::string permission = grant.substr(0, pos);
    const std::string grantee = grant.substr(pos + 1);

    if (permission == "read")
      parsed.read = grantee;
    else if (permission == "full")
      parsed.full = grantee;
    else if (permission == "readacl")
      parsed.readacl = grantee;
    else if (permission == "writeacl")
      parsed.writeacl = grantee;
    else
      throw ValidationError(
          "permission must be one of: read|readacl|writeacl|full");
  }

  return parsed;
}

void TransferOptions::Validate() {
  parsed_grants_ = ParseGrants(grants);
  validated_ = true;
}

void TransferOptions::ApplyTo(const std::string &source_path,
                              services::Params *params) const {
  if (!validated_)
    throw std::logic_error("call Validate() before applying options.");

  SetIfPresent(acl, services::Field::ACL, params);

  SetIfPresent(parsed_grants_.read, services::Field::GRANT_READ, params);
  SetIfPresent(parsed_grants_.full, services::Field::GRANT_FULL_CONTROL,
               params);
  SetIfPresent(parsed_grants_.readacl, services::Field::GRANT_READ_ACP,
               params);
  SetIfPresent(parsed_grants_.writeacl, services::Field::GRANT_WRITE_ACP,
               params);

  if (sse) params->Set(services::Field::SERVER_SIDE_ENCRYPTION, SSE_ALGORITHM);

  SetIfPresent(storage_class, services::Field::STORAGE_CLASS, params);
  SetIfPresent(website_redirect, services::Field::WEBSITE_REDIRECT_LOCATION,
               params);

  if (guess_mime_type) {
    const std::string type = fs::MimeTypes::GuessType(source_path);

    if (!type.empty()) {
      S3XFER_LOG(LOG_DEBUG, "TransferOptions::ApplyTo",
                 "guessed [%s] for [%s].\n", type.c_str(),
                 source_path.c_str());
      params->Set(services::Field::CONTENT_TYPE, type);
    }
  }

  SetIfPresent(content_type, services::Field::CONTENT_TYPE, params);
  SetIfPresent(cache_control, services::Field::CACHE_CONTROL, params);
  SetIfPresent(content_disposition, services::Field::CONTENT_DISPOSITION,
               params);
  SetIfPresent(content_encoding, services::Field::CONTENT_ENCODING, params);
  SetIfPresent(content_language, services::Field::CONTENT_LANGUAGE, params);
  SetIfPresent(expires, services::Field::EXPIRES, params);
}

}  // namespace tasks
}  // namespace s3xfer

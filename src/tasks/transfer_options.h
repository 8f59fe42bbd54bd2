/*
 * tasks/transfer_options.h
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

#ifndef S3XFER_TASKS_TRANSFER_OPTIONS_H
#define S3XFER_TASKS_TRANSFER_OPTIONS_H

#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace s3xfer {
namespace services {
class Params;
}

namespace tasks {
struct Grants {
  boost::optional<std::string> read;
  boost::optional<std::string> full;
  boost::optional<std::string> readacl;
  boost::optional<std::string> writeacl;
};

class TransferOptions {
 public:
  // Parses "permission=principal" strings. Throws ValidationError.
  static Grants ParseGrants(const std::vector<std::string> &grants);

  boost::optional<std::string> acl;
  std::vector<std::string> grants;
  bool sse = false;
  boost::optional<std::string> storage_class;
  boost::optional<std::string> website_redirect;
  bool guess_mime_type = false;
  boost::optional<std::string> content_type;
  boost::optional<std::string> cache_control;
  boost::optional<std::string> content_disposition;
  boost::optional<std::string> content_encoding;
  boost::optional<std::string> content_language;
  boost::optional<std::string> expires;

  // Throws ValidationError. Must be called before ApplyTo(), and again after
  // any change to |grants|.
  void Validate();

  inline bool is_validated() const { return validated_; }
  inline const Grants &parsed_grants() const { return parsed_grants_; }

  // Sets request fields in a fixed order. A guessed content type (from the
  // extension of |source_path|) is applied before, and therefore loses to,
  // an explicit |content_type|.
  void ApplyTo(const std::string &source_path, services::Params *params) const;

 private:
  bool validated_ = false;
  Grants parsed_grants_;
};
}  // namespace tasks
}  // namespace s3xfer

#endif

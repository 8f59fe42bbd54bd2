/*
 * services/params.h
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

#ifndef S3XFER_SERVICES_PARAMS_H
#define S3XFER_SERVICES_PARAMS_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

namespace s3xfer {
namespace services {
enum class Field {
  ACL,
  GRANT_READ,
  GRANT_FULL_CONTROL,
  GRANT_READ_ACP,
  GRANT_WRITE_ACP,
  SERVER_SIDE_ENCRYPTION,
  STORAGE_CLASS,
  WEBSITE_REDIRECT_LOCATION,
  CONTENT_TYPE,
  CACHE_CONTROL,
  CONTENT_DISPOSITION,
  CONTENT_ENCODING,
  CONTENT_LANGUAGE,
  EXPIRES,
  COPY_SOURCE,
  PREFIX,
  DELIMITER,
  MARKER,
  LOCATION_CONSTRAINT
};

// e.g., "grant_read".
const char *FieldToString(Field field);

class Params {
 public:
  using FieldMap = std::map<Field, std::string>;

  Params() = default;
  Params(const std::string &bucket, const std::string &key)
      : bucket_(bucket), key_(key) {}

  inline const std::string &bucket() const { return bucket_; }
  inline const std::string &key() const { return key_; }
  inline const FieldMap &fields() const { return fields_; }

  // An absent body and an empty body are distinct.
  inline const boost::optional<std::vector<char>> &body() const {
    return body_;
  }

  inline bool Has(Field field) const { return fields_.count(field) != 0; }

  inline std::string Get(Field field) const {
    auto iter = fields_.find(field);
    return (iter == fields_.end()) ? "" : iter->second;
  }

  inline void set_bucket(const std::string &bucket) { bucket_ = bucket; }
  inline void set_key(const std::string &key) { key_ = key; }

  inline void Set(Field field, const std::string &value) {
    fields_[field] = value;
  }

  inline void Clear(Field field) { fields_.erase(field); }

  inline void set_body(std::vector<char> &&body) { body_ = std::move(body); }

 private:
  std::string bucket_, key_;
  FieldMap fields_;
  boost::optional<std::vector<char>> body_;
};
}  // namespace services
}  // namespace s3xfer

#endif

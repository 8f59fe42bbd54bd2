/*
 * services/response.h
 * -------------------------------------------------------------------------
 * Result of a service operation.
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

#ifndef S3XFER_SERVICES_RESPONSE_H
#define S3XFER_SERVICES_RESPONSE_H

#include <list>
#include <map>
#include <string>
#include <vector>

#include "base/request.h"
#include "base/xml.h"

namespace s3xfer {
namespace services {
// Parsed values.
constexpr char DATA_ETAG[] = "ETag";
constexpr char DATA_UPLOAD_ID[] = "UploadId";
constexpr char DATA_LAST_MODIFIED[] = "LastModified";
constexpr char DATA_IS_TRUNCATED[] = "IsTruncated";
constexpr char DATA_NEXT_MARKER[] = "NextMarker";

// Parsed lists.
constexpr char DATA_BUCKETS[] = "Buckets";
constexpr char DATA_CONTENTS[] = "Contents";
constexpr char DATA_COMMON_PREFIXES[] = "CommonPrefixes";

using ElementList = std::list<base::XmlDocument::ElementMap>;

struct RawResponse {
  int code = 0;
  base::HeaderMap headers;
  std::vector<char> payload;
};

class Response {
 public:
  inline const RawResponse &raw() const { return raw_; }
  inline RawResponse *mutable_raw() { return &raw_; }

  // Empty if not present.
  inline std::string Value(const std::string &name) const {
    auto iter = values_.find(name);
    return (iter == values_.end()) ? "" : iter->second;
  }

  inline bool HasValue(const std::string &name) const {
    return values_.count(name) != 0;
  }

  inline const ElementList &List(const std::string &name) const {
    static const ElementList EMPTY;
    auto iter = lists_.find(name);
    return (iter == lists_.end()) ? EMPTY : iter->second;
  }

  inline void SetValue(const std::string &name, const std::string &value) {
    values_[name] = value;
  }

  inline ElementList *MutableList(const std::string &name) {
    return &lists_[name];
  }

 private:
  RawResponse raw_;
  std::map<std::string, std::string> values_;
  std::map<std::string, ElementList> lists_;
};
}  // namespace services
}  // namespace s3xfer

#endif

/*
 * base/xml.h
 * -------------------------------------------------------------------------
 * XML parsing and XPath queries.
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

#ifndef S3XFER_BASE_XML_H
#define S3XFER_BASE_XML_H

#include <list>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace s3xfer {
namespace base {
class XmlDocument {
 public:
  using ElementMap = std::map<std::string, std::string>;

  static constexpr char MAP_NAME_KEY[] = "__element_name__";

  static void Init();

  // Returns null (and logs) if |data| is not well-formed XML.
  static std::unique_ptr<XmlDocument> Parse(std::string data);

  inline static std::unique_ptr<XmlDocument> Parse(
      const std::vector<char> &in) {
    return Parse(std::string(in.begin(), in.end()));
  }

  virtual ~XmlDocument() = default;

  // Each returns 0 on success, -EINVAL for a bad XPath expression. The
  // single-element form returns -ENOENT if nothing matches; the list forms
  // leave the list untouched instead.
  virtual int Find(const std::string &xpath, std::string *element) = 0;
  virtual int Find(const std::string &xpath,
                   std::list<std::string> *elements) = 0;

  // One map per matching node, holding the text of each child element plus
  // the node's own name under MAP_NAME_KEY.
  virtual int Find(const std::string &xpath, std::list<ElementMap> *list) = 0;

  virtual bool Match(const std::string &xpath) = 0;
};
}  // namespace base
}  // namespace s3xfer

#endif

/*
 * base/xml.cc
 * -------------------------------------------------------------------------
 * XML parsing and XPath queries (libxml2).
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

#include "base/xml.h"

#include <errno.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>

#include <regex>
#include <stdexcept>

#include "base/logger.h"

namespace s3xfer {
namespace base {

namespace {
struct TransformPair {
  const std::regex expr;
  const std::string subst;
};

// strip out namespace declarations and prefixes so that XPath expressions
// don't need to know about them
const TransformPair TRANSFORMS[] = {
    {std::regex(" xmlns(:\\w*)?=\"[^\"]*\""), ""},
    {std::regex(" xmlns(:\\w*)?='[^']*'"), ""},
    {std::regex("<\\w*:"), "<"},
    {std::regex("</\\w*:"), "</"}};

std::string Transform(std::string in) {
  for (const auto &t : TRANSFORMS) in = std::regex_replace(in, t.expr, t.subst);
  return in;
}

void FreeXmlChar(xmlChar *p) { xmlFree(p); }

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XPathContextPtr =
    std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr =
    std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;
using XmlCharPtr = std::unique_ptr<xmlChar, decltype(&FreeXmlChar)>;

class XmlDocumentImpl : public XmlDocument {
 public:
  explicit XmlDocumentImpl(XmlDocPtr doc)
      : doc_(std::move(doc)),
        xpath_context_(xmlXPathNewContext(doc_.get()), &xmlXPathFreeContext) {
    if (!xpath_context_)
      throw std::runtime_error("failed to create xpath context.");
  }

  ~XmlDocumentImpl() override = default;

  int Find(const std::string &xpath, std::string *element) override {
    auto result = EvalXPath(xpath);
    if (!result) return -EINVAL;

    if (xmlXPathNodeSetIsEmpty(result->nodesetval)) return -ENOENT;

    auto text = NodeToString(result->nodesetval->nodeTab[0]);
    element->assign(text ? reinterpret_cast<const char *>(text.get()) : "");

    return 0;
  }

  int Find(const std::string &xpath,
           std::list<std::string> *elements) override {
    auto result = EvalXPath(xpath);
    if (!result) return -EINVAL;

    if (xmlXPathNodeSetIsEmpty(result->nodesetval)) return 0;

    for (int i = 0; i < result->nodesetval->nodeNr; i++) {
      auto text = NodeToString(result->nodesetval->nodeTab[i]);
      if (text) elements->push_back(reinterpret_cast<const char *>(text.get()));
    }

    return 0;
  }

  int Find(const std::string &xpath, std::list<ElementMap> *list) override {
    auto result = EvalXPath(xpath);
    if (!result) return -EINVAL;

    if (xmlXPathNodeSetIsEmpty(result->nodesetval)) return 0;

    for (int i = 0; i < result->nodesetval->nodeNr; i++) {
      xmlNodePtr node = result->nodesetval->nodeTab[i];
      ElementMap elements;

      for (xmlNodePtr child = node->children; child != nullptr;
           child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;

        auto text = NodeToString(child);
        if (text)
          elements[reinterpret_cast<const char *>(child->name)] =
              reinterpret_cast<const char *>(text.get());
      }

      if (elements.find(MAP_NAME_KEY) == elements.end())
        elements[MAP_NAME_KEY] = reinterpret_cast<const char *>(node->name);
      else
        S3XFER_LOG(LOG_WARNING, "XmlDocument::Find",
                   "unable to insert element name key.\n");

      list->push_back(elements);
    }

    return 0;
  }

  bool Match(const std::string &xpath) override {
    auto result = EvalXPath(xpath);
    return result && !xmlXPathNodeSetIsEmpty(result->nodesetval);
  }

 private:
  XPathObjectPtr EvalXPath(const std::string &xpath) {
    auto *result = xmlXPathEvalExpression(
        reinterpret_cast<const xmlChar *>(xpath.c_str()), xpath_context_.get());
    if (!result)
      S3XFER_LOG(LOG_WARNING, "XmlDocument::EvalXPath",
                 "invalid xpath expression [%s]\n", xpath.c_str());
    return {result, &xmlXPathFreeObject};
  }

  static XmlCharPtr NodeToString(xmlNodePtr node) {
    return {xmlXPathCastNodeToString(node), FreeXmlChar};
  }

  XmlDocPtr doc_;
  XPathContextPtr xpath_context_;
};

void SilenceErrors(void *context, const char *message, ...) {}
}  // namespace

constexpr char XmlDocument::MAP_NAME_KEY[];

void XmlDocument::Init() {
  xmlInitParser();
  LIBXML_TEST_VERSION;
  // parse and xpath errors are reported through return values
  xmlSetGenericErrorFunc(nullptr, SilenceErrors);
}

std::unique_ptr<XmlDocument> XmlDocument::Parse(std::string data) {
  data = Transform(data);

  XmlDocPtr doc(xmlReadMemory(data.c_str(), static_cast<int>(data.size()),
                              nullptr, nullptr, XML_PARSE_NONET),
                &xmlFreeDoc);

  if (!doc) {
    S3XFER_LOG(LOG_WARNING, "XmlDocument::Parse", "error while parsing xml.\n");
    return {};
  }

  if (!xmlDocGetRootElement(doc.get())) {
    S3XFER_LOG(LOG_WARNING, "XmlDocument::Parse",
               "document does not contain a root node.\n");
    return {};
  }

  return std::unique_ptr<XmlDocument>(new XmlDocumentImpl(std::move(doc)));
}

}  // namespace base
}  // namespace s3xfer

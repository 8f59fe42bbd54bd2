/*
 * services/aws/impl.cc
 * -------------------------------------------------------------------------
 * Service binding for Amazon S3 (path-style, signature version 2).
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

#include "services/aws/impl.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "base/paths.h"
#include "base/timer.h"
#include "base/url.h"
#include "base/xml.h"
#include "crypto/base64.h"
#include "crypto/encoder.h"
#include "crypto/hash.h"
#include "crypto/hmac_sha1.h"
#include "crypto/md5.h"
#include "crypto/private_file.h"
#include "services/utils.h"

namespace s3xfer {
namespace services {
namespace aws {

namespace {
const std::string HEADER_PREFIX = "x-amz-";
const std::string DEFAULT_ENDPOINT = "s3.amazonaws.com";
const std::string DEFAULT_ENDPOINT_REGION = "us-east-1";

constexpr char XML_NS[] = "http://s3.amazonaws.com/doc/2006-03-01/";

constexpr char ERROR_CODE_XPATH[] = "/Error/Code";
constexpr char ERROR_MESSAGE_XPATH[] = "/Error/Message";
constexpr char BUCKETS_XPATH[] = "/ListAllMyBucketsResult/Buckets/Bucket";
constexpr char IS_TRUNCATED_XPATH[] = "/ListBucketResult/IsTruncated";
constexpr char NEXT_MARKER_XPATH[] = "/ListBucketResult/NextMarker";
constexpr char CONTENTS_XPATH[] = "/ListBucketResult/Contents";
constexpr char COMMON_PREFIXES_XPATH[] = "/ListBucketResult/CommonPrefixes";
constexpr char COPY_ETAG_XPATH[] = "/CopyObjectResult/ETag";
constexpr char COPY_LAST_MODIFIED_XPATH[] = "/CopyObjectResult/LastModified";
constexpr char UPLOAD_ID_XPATH[] =
    "/InitiateMultipartUploadResult/UploadId";

const char *GetHeaderName(Field field) {
  switch (field) {
    case Field::ACL:
      return "x-amz-acl";
    case Field::GRANT_READ:
      return "x-amz-grant-read";
    case Field::GRANT_FULL_CONTROL:
      return "x-amz-grant-full-control";
    case Field::GRANT_READ_ACP:
      return "x-amz-grant-read-acp";
    case Field::GRANT_WRITE_ACP:
      return "x-amz-grant-write-acp";
    case Field::SERVER_SIDE_ENCRYPTION:
      return "x-amz-server-side-encryption";
    case Field::STORAGE_CLASS:
      return "x-amz-storage-class";
    case Field::WEBSITE_REDIRECT_LOCATION:
      return "x-amz-website-redirect-location";
    case Field::CONTENT_TYPE:
      return "Content-Type";
    case Field::CACHE_CONTROL:
      return "Cache-Control";
    case Field::CONTENT_DISPOSITION:
      return "Content-Disposition";
    case Field::CONTENT_ENCODING:
      return "Content-Encoding";
    case Field::CONTENT_LANGUAGE:
      return "Content-Language";
    case Field::EXPIRES:
      return "Expires";
    case Field::COPY_SOURCE:
      return "x-amz-copy-source";
    default:
      return nullptr;
  }
}

bool HasContentMetadata(const Params &params) {
  for (auto field : {Field::CONTENT_TYPE, Field::CACHE_CONTROL,
                     Field::CONTENT_DISPOSITION, Field::CONTENT_ENCODING,
                     Field::CONTENT_LANGUAGE, Field::EXPIRES})
    if (params.Has(field)) return true;

  return false;
}

std::string GetBucketUrl(const Params &params) {
  return std::string("/") + base::Url::Encode(params.bucket(), "");
}

std::string GetObjectUrl(const Params &params) {
  return GetBucketUrl(params) + "/" + base::Url::Encode(params.key());
}

std::string BuildListQuery(const Params &params) {
  std::string query;

  for (auto field : {Field::DELIMITER, Field::MARKER, Field::PREFIX}) {
    if (!params.Has(field)) continue;

    if (!query.empty()) query += "&";
    query += std::string(FieldToString(field)) + "=" +
             base::Url::Encode(params.Get(field), "");
  }

  return query;
}

bool IsSuccess(int code) {
  return code >= base::HTTP_SC_OK && code < base::HTTP_SC_MULTIPLE_CHOICES;
}
}  // namespace

Impl::Impl(const std::string &region) : region_(region) {
  std::ifstream f;
  std::string line;

  crypto::PrivateFile::Open(base::Paths::Transform(base::Config::secret_file()),
                            &f);
  std::getline(f, line);

  std::istringstream line_stream(line);
  std::vector<std::string> fields{
      std::istream_iterator<std::string>(line_stream),
      std::istream_iterator<std::string>()};

  if (fields.size() != 2) {
    S3XFER_LOG(LOG_ERR, "Impl::Impl",
               "expected 2 fields for secret_file, found %zu.\n",
               fields.size());
    throw std::runtime_error("error while parsing auth data for AWS.");
  }

  key_ = fields[0];
  secret_ = fields[1];

  endpoint_ = base::Config::use_ssl() ? "https://" : "http://";
  endpoint_ += GetEndpoint(region_);
}

Impl::Impl(const std::string &region, const std::string &key,
           const std::string &secret)
    : region_(region), key_(key), secret_(secret) {
  endpoint_ = base::Config::use_ssl() ? "https://" : "http://";
  endpoint_ += GetEndpoint(region_);
}

base::HeaderMap Impl::ParamsToHeaders(const Params &params) {
  base::HeaderMap headers;

  for (const auto &field : params.fields()) {
    const char *name = GetHeaderName(field.first);
    if (name) headers[name] = field.second;
  }

  return headers;
}

std::string Impl::GetCreateBucketBody(const std::string &location_constraint) {
  if (location_constraint.empty()) return "";

  return std::string("<CreateBucketConfiguration xmlns=\"") + XML_NS +
         "\"><LocationConstraint>" + location_constraint +
         "</LocationConstraint></CreateBucketConfiguration>";
}

std::string Impl::GetEndpoint(const std::string &region) {
  const std::string &endpoint = base::Config::service_endpoint();

  if (endpoint != DEFAULT_ENDPOINT || region.empty() ||
      region == DEFAULT_ENDPOINT_REGION)
    return endpoint;

  return std::string("s3.") + region + ".amazonaws.com";
}

std::string Impl::region() const { return region_; }

Response Impl::Call(Operation op, const Params &params) {
  auto req = base::RequestFactory::New(this);
  Response response;

  Prepare(op, params, req.get());

  try {
    if (op == Operation::PUT_OBJECT || op == Operation::GET_OBJECT ||
        op == Operation::COPY_OBJECT)
      req->Run(base::Config::transfer_timeout_in_s());
    else
      req->Run();
  } catch (const std::runtime_error &e) {
    S3XFER_LOG(LOG_WARNING, "Impl::Call", "%s on [%s] failed: %s\n",
               OperationToString(op), req->url().c_str(), e.what());
    throw ServiceError(op, "TransportError", e.what());
  }

  CheckForError(op, *req);
  Parse(op, *req, &response);

  return response;
}

void Impl::Prepare(Operation op, const Params &params, base::Request *req) {
  if (op != Operation::LIST_BUCKETS && params.bucket().empty())
    throw ServiceError(op, "InvalidParameter", "bucket name cannot be empty.");

  switch (op) {
    case Operation::LIST_BUCKETS:
      req->Init(base::HttpMethod::GET);
      req->SetUrl("/");
      break;

    case Operation::LIST_OBJECTS:
      req->Init(base::HttpMethod::GET);
      req->SetUrl(GetBucketUrl(params) + "/", BuildListQuery(params));
      break;

    case Operation::CREATE_BUCKET:
      req->Init(base::HttpMethod::PUT);
      req->SetUrl(GetBucketUrl(params));
      req->SetInputBuffer(
          GetCreateBucketBody(params.Get(Field::LOCATION_CONSTRAINT)));
      break;

    case Operation::DELETE_BUCKET:
      req->Init(base::HttpMethod::DELETE);
      req->SetUrl(GetBucketUrl(params));
      break;

    case Operation::PUT_OBJECT:
      req->Init(base::HttpMethod::PUT);
      req->SetUrl(GetObjectUrl(params));

      if (params.body()) {
        std::vector<char> body = *params.body();

        req->SetHeader(
            "Content-MD5",
            crypto::Hash::Compute<crypto::Md5, crypto::Base64>(body));
        req->SetInputBuffer(std::move(body));
      }
      break;

    case Operation::GET_OBJECT:
      req->Init(base::HttpMethod::GET);
      req->SetUrl(GetObjectUrl(params));
      break;

    case Operation::COPY_OBJECT:
      req->Init(base::HttpMethod::PUT);
      req->SetUrl(GetObjectUrl(params));
      req->SetHeader("x-amz-metadata-directive",
                     HasContentMetadata(params) ? "REPLACE" : "COPY");
      break;

    case Operation::DELETE_OBJECT:
      req->Init(base::HttpMethod::DELETE);
      req->SetUrl(GetObjectUrl(params));
      break;

    case Operation::CREATE_MULTIPART_UPLOAD:
      req->Init(base::HttpMethod::POST);
      req->SetUrl(GetObjectUrl(params) + "?uploads");
      break;
  }

  for (const auto &header : ParamsToHeaders(params))
    req->SetHeader(header.first, header.second);

  // keep curl from inventing a Content-Type (e.g., for POSTs)
  if (req->headers().find("Content-Type") == req->headers().end())
    req->SetHeader("Content-Type", "");
}

void Impl::CheckForError(Operation op, const base::Request &req) {
  const int rc = req.response_code();
  std::unique_ptr<base::XmlDocument> doc;

  // CopyObject can fail after the 200 has already been sent.
  if (IsSuccess(rc) && op != Operation::COPY_OBJECT) return;

  if (!req.output_buffer().empty())
    doc = base::XmlDocument::Parse(req.output_buffer());

  if (IsSuccess(rc) && !(doc && doc->Match(ERROR_CODE_XPATH))) return;

  std::string code, message;

  if (doc) {
    doc->Find(ERROR_CODE_XPATH, &code);
    doc->Find(ERROR_MESSAGE_XPATH, &message);
  }

  if (code.empty()) code = std::to_string(rc);
  if (message.empty()) message = "HTTP status " + std::to_string(rc);

  S3XFER_LOG(LOG_DEBUG, "Impl::CheckForError",
             "%s on [%s] failed with %i (%s): %s\n", OperationToString(op),
             req.url().c_str(), rc, code.c_str(), message.c_str());

  throw ServiceError(op, code, message, rc);
}

void Impl::Parse(Operation op, const base::Request &req, Response *response) {
  RawResponse *raw = response->mutable_raw();
  std::unique_ptr<base::XmlDocument> doc;

  raw->code = req.response_code();
  raw->headers = req.response_headers();
  raw->payload = req.output_buffer();

  if (op == Operation::LIST_BUCKETS || op == Operation::LIST_OBJECTS ||
      op == Operation::COPY_OBJECT ||
      op == Operation::CREATE_MULTIPART_UPLOAD) {
    doc = base::XmlDocument::Parse(req.output_buffer());

    if (!doc)
      throw ServiceError(op, "MalformedResponse",
                         "failed to parse response body.", raw->code);
  }

  switch (op) {
    case Operation::LIST_BUCKETS:
      doc->Find(BUCKETS_XPATH, response->MutableList(DATA_BUCKETS));
      break;

    case Operation::LIST_OBJECTS: {
      std::string value;

      if (doc->Find(IS_TRUNCATED_XPATH, &value) == 0)
        response->SetValue(DATA_IS_TRUNCATED, value);

      if (doc->Find(NEXT_MARKER_XPATH, &value) == 0)
        response->SetValue(DATA_NEXT_MARKER, value);

      doc->Find(CONTENTS_XPATH, response->MutableList(DATA_CONTENTS));
      doc->Find(COMMON_PREFIXES_XPATH,
                response->MutableList(DATA_COMMON_PREFIXES));
      break;
    }

    case Operation::PUT_OBJECT:
    case Operation::GET_OBJECT:
      if (!req.response_header("etag").empty())
        response->SetValue(DATA_ETAG, req.response_header("etag"));

      if (!req.response_header("last-modified").empty())
        response->SetValue(DATA_LAST_MODIFIED,
                           req.response_header("last-modified"));
      break;

    case Operation::COPY_OBJECT: {
      std::string value;

      if (doc->Find(COPY_ETAG_XPATH, &value) == 0)
        response->SetValue(DATA_ETAG, value);

      if (doc->Find(COPY_LAST_MODIFIED_XPATH, &value) == 0)
        response->SetValue(DATA_LAST_MODIFIED, value);
      break;
    }

    case Operation::CREATE_MULTIPART_UPLOAD: {
      std::string upload_id;

      if (doc->Find(UPLOAD_ID_XPATH, &upload_id) != 0 || upload_id.empty())
        throw ServiceError(op, "MalformedResponse",
                           "response did not include an upload id.",
                           raw->code);

      response->SetValue(DATA_UPLOAD_ID, upload_id);
      break;
    }

    default:
      break;
  }
}

std::string Impl::AdjustUrl(const std::string &url) { return endpoint_ + url; }

void Impl::PreRun(base::Request *r, int iter) { Sign(r); }

bool Impl::ShouldRetry(base::Request *r, int iter) {
  return GenericShouldRetry(r, iter);
}

void Impl::Sign(base::Request *req) {
  const std::string date = base::Timer::GetHttpTime();
  req->SetHeader("Date", date);

  const auto &headers = req->headers();
  std::string to_sign = std::string(base::HttpMethodToString(req->method())) +
                        "\n" + FindOrDefault(headers, "Content-MD5") + "\n" +
                        FindOrDefault(headers, "Content-Type") + "\n" + date +
                        "\n";

  for (const auto &header : headers)
    if (!header.second.empty() &&
        header.first.substr(0, HEADER_PREFIX.size()) == HEADER_PREFIX)
      to_sign += header.first + ":" + header.second + "\n";

  to_sign += req->url();

  uint8_t mac[crypto::HmacSha1::MAC_LEN];
  crypto::HmacSha1::Sign(secret_, to_sign, mac);
  req->SetHeader("Authorization", std::string("AWS ") + key_ + ":" +
                                      crypto::Encoder::Encode<crypto::Base64>(
                                          mac, crypto::HmacSha1::MAC_LEN));
}

}  // namespace aws
}  // namespace services
}  // namespace s3xfer

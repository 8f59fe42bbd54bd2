/*
 * base/request.h
 * -------------------------------------------------------------------------
 * HTTP request.
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

#ifndef S3XFER_BASE_REQUEST_H
#define S3XFER_BASE_REQUEST_H

#include <time.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace s3xfer {
namespace base {
enum class HttpMethod { INVALID, DELETE, GET, HEAD, POST, PUT };

enum HttpStatusCode {
  HTTP_SC_OK = 200,
  HTTP_SC_NO_CONTENT = 204,
  HTTP_SC_MULTIPLE_CHOICES = 300,
  HTTP_SC_BAD_REQUEST = 400,
  HTTP_SC_FORBIDDEN = 403,
  HTTP_SC_NOT_FOUND = 404,
  HTTP_SC_INTERNAL_SERVER_ERROR = 500,
  HTTP_SC_SERVICE_UNAVAILABLE = 503
};

const char *HttpMethodToString(HttpMethod method);

class Request;
class RequestHook;
class Transport;

using HeaderMap = std::map<std::string, std::string>;

class RequestFactory {
 public:
  static std::unique_ptr<Request> New(RequestHook *hook);
  static std::unique_ptr<Request> NewNoHook();
};

class Request {
 public:
  static constexpr int DEFAULT_REQUEST_TIMEOUT = -1;

  ~Request();

  void Init(HttpMethod method);

  inline HttpMethod method() const { return method_; }
  inline std::string url() const { return url_; }
  inline const HeaderMap &headers() const { return headers_; }
  inline const std::vector<char> &output_buffer() const {
    return output_buffer_;
  }
  inline std::vector<char> &output_buffer() { return output_buffer_; }
  // |key| must be lower-case.
  inline std::string response_header(const std::string &key) const {
    auto iter = response_headers_.find(key);
    return (iter == response_headers_.end()) ? "" : iter->second;
  }
  inline const HeaderMap &response_headers() const { return response_headers_; }
  inline int response_code() const { return static_cast<int>(response_code_); }

  std::string GetOutputAsString() const;

  void SetUrl(const std::string &url, const std::string &query_string = "");
  void SetHeader(const std::string &name, const std::string &value);
  void SetInputBuffer(std::vector<char> &&buffer);
  void SetInputBuffer(const std::string &str);

  // Throws std::runtime_error if the transport fails after all retries. HTTP
  // error codes are not exceptions; check response_code().
  void Run(int timeout_in_s = DEFAULT_REQUEST_TIMEOUT);

 private:
  friend class RequestFactory;  // for ctor.
  friend class Transport;       // for the curl callbacks.

  explicit Request(RequestHook *hook);

  void Rewind();
  bool TimedOut() const;

  // fixed for the lifetime of the request
  const std::unique_ptr<Transport> transport_;
  RequestHook *const hook_ = nullptr;

  // cleared by Init()
  HttpMethod method_ = HttpMethod::INVALID;
  std::string url_, transport_url_;
  HeaderMap headers_;  // one value per name
  std::vector<char> input_buffer_;

  // cleared before each attempt
  static constexpr size_t ERROR_BUFFER_SIZE = 256;
  char transport_error_[ERROR_BUFFER_SIZE];
  time_t deadline_ = 0;
  size_t input_offset_ = 0;
  long response_code_ = 0;
  HeaderMap response_headers_;
  std::vector<char> output_buffer_;
};
}  // namespace base
}  // namespace s3xfer

#endif

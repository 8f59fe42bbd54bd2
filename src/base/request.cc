/*
 * base/request.cc
 * -------------------------------------------------------------------------
 * HTTP request (libcurl transport).
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

#include "base/request.h"

#include <curl/curl.h>
#include <string.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/request_hook.h"
#include "base/timer.h"

#define TEST_OK(x)                                                           \
  do {                                                                       \
    if ((x) != CURLE_OK) throw std::runtime_error("call to " #x " failed."); \
  } while (0)

namespace s3xfer {
namespace base {

namespace {
constexpr char USER_AGENT[] = PACKAGE_NAME " " PACKAGE_VERSION;

class HeaderList {
 public:
  explicit HeaderList(const HeaderMap &headers) {
    for (const auto &header : headers) {
      // "Name:" with no value stops curl from sending its own default
      Append(header.second.empty() ? header.first + ":"
                                   : header.first + ": " + header.second);
    }
    // some stores reject "Expect: 100-continue"
    Append("Expect:");
  }

  ~HeaderList() {
    if (list_) curl_slist_free_all(list_);
  }

  inline const curl_slist *get() const { return list_; }

 private:
  inline void Append(const std::string &item) {
    list_ = curl_slist_append(list_, item.c_str());
  }

  curl_slist *list_ = nullptr;
};

// Errors worth another attempt with the same request.
bool IsRecoverable(CURLcode code) {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_PARTIAL_FILE:
    case CURLE_UPLOAD_FAILED:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_BAD_CONTENT_ENCODING:
    case CURLE_ABORTED_BY_CALLBACK:
      return true;

    default:
      return false;
  }
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](char c) {
                   return static_cast<char>(
                       std::tolower(static_cast<unsigned char>(c)));
                 });
  return str;
}
}  // namespace

// Owns the curl easy handle (and a reference on curl's global state) and
// moves bytes between curl and the Request that owns it.
class Transport {
 public:
  explicit Transport(Request *request) {
    {
      std::lock_guard<std::mutex> lock(s_mutex);

      if (s_refcount == 0) {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
          throw std::runtime_error("curl_global_init() failed.");

        const auto *ver = curl_version_info(CURLVERSION_NOW);
        if (!ver) throw std::runtime_error("curl_version_info() failed.");

        S3XFER_LOG(LOG_DEBUG, "Transport::Transport", "curl %s, ssl %s\n",
                   ver->version, ver->ssl_version ? ver->ssl_version : "none");
      }

      ++s_refcount;
    }

    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("curl_easy_init() failed.");

    static_assert(sizeof(request->transport_error_) >= CURL_ERROR_SIZE,
                  "error buffer is too small.");

    TEST_OK(curl_easy_setopt(curl_, CURLOPT_VERBOSE,
                             Config::verbose_requests() ? 1L : 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_USERAGENT, USER_AGENT));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER,
                             request->transport_error_));

    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, &OnHeader));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HEADERDATA, request));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &OnWrite));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_WRITEDATA, request));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_READFUNCTION, &OnRead));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_READDATA, request));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_SEEKFUNCTION, &OnSeek));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_SEEKDATA, request));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &OnProgress));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, request));
  }

  ~Transport() {
    curl_easy_cleanup(curl_);

    std::lock_guard<std::mutex> lock(s_mutex);
    if (--s_refcount == 0) curl_global_cleanup();
  }

  void SetMethod(HttpMethod method) {
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_UPLOAD, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOBODY, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_POST, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L));

    switch (method) {
      case HttpMethod::DELETE:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE"));
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L));
        break;
      case HttpMethod::HEAD:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L));
        break;
      case HttpMethod::POST:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_POST, 1L));
        break;
      case HttpMethod::PUT:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L));
        break;
      default:
        break;
    }
  }

  void SetTarget(HttpMethod method, const std::string &url,
                 size_t input_size) {
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_URL, url.c_str()));

    if (method == HttpMethod::PUT)
      TEST_OK(curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE,
                               static_cast<curl_off_t>(input_size)));
    else if (method == HttpMethod::POST)
      TEST_OK(curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                               static_cast<curl_off_t>(input_size)));
    else if (input_size)
      throw std::runtime_error(
          "can't set input data for non-POST/non-PUT request.");
  }

  CURLcode Perform(const HeaderMap &headers, long *response_code) {
    HeaderList list(headers);

    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, list.get()));

    const CURLcode r = curl_easy_perform(curl_);

    // the list is about to go away
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr));

    if (r == CURLE_OK)
      TEST_OK(curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, response_code));

    return r;
  }

 private:
  static size_t OnHeader(char *data, size_t size, size_t items,
                         void *context) {
    Request *request = static_cast<Request *>(context);
    const char *end = data + size * items;
    const char *colon = std::find(const_cast<const char *>(data), end, ':');

    // status line, or the blank line after the headers
    if (colon == end) return size * items;

    const char *value = colon + 1;
    while (value < end && *value == ' ') value++;

    const char *value_end = value;
    while (value_end < end && *value_end != '\r' && *value_end != '\n')
      value_end++;

    // HTTP/2 servers send lower-case names; store everything that way
    request->response_headers_[ToLower(std::string(data, colon - data))] =
        std::string(value, value_end);

    return size * items;
  }

  static size_t OnWrite(char *data, size_t size, size_t items,
                        void *context) {
    auto *output = &static_cast<Request *>(context)->output_buffer_;

    output->insert(output->end(), data, data + size * items);
    return size * items;
  }

  static size_t OnRead(char *data, size_t size, size_t items, void *context) {
    Request *request = static_cast<Request *>(context);
    const std::vector<char> &input = request->input_buffer_;
    const size_t count =
        std::min(size * items, input.size() - request->input_offset_);

    if (count) memcpy(data, input.data() + request->input_offset_, count);
    request->input_offset_ += count;

    return count;
  }

  static int OnSeek(void *context, curl_off_t offset, int origin) {
    // curl only ever rewinds to the start (on redirects and retries)
    if (origin != SEEK_SET || offset != 0) return CURL_SEEKFUNC_FAIL;

    static_cast<Request *>(context)->Rewind();
    return CURL_SEEKFUNC_OK;
  }

  static int OnProgress(void *context, curl_off_t, curl_off_t, curl_off_t,
                        curl_off_t) {
    return static_cast<Request *>(context)->TimedOut() ? 1 : 0;
  }

  static std::mutex s_mutex;
  static int s_refcount;

  CURL *curl_ = nullptr;
};

std::mutex Transport::s_mutex;
int Transport::s_refcount = 0;

const char *HttpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::INVALID:
      return "INVALID";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
  }
  throw std::runtime_error("invalid HTTP method.");
}

std::unique_ptr<Request> RequestFactory::New(RequestHook *hook) {
  return std::unique_ptr<Request>(new Request(hook));
}

std::unique_ptr<Request> RequestFactory::NewNoHook() {
  return std::unique_ptr<Request>(new Request(nullptr));
}

Request::Request(RequestHook *hook)
    : transport_(new Transport(this)), hook_(hook) {
  transport_error_[0] = '\0';
}

Request::~Request() = default;

void Request::Init(HttpMethod method) {
  transport_->SetMethod(method);

  method_ = method;
  url_.clear();
  transport_url_.clear();
  headers_.clear();
  input_buffer_.clear();
  response_code_ = 0;
  response_headers_.clear();
  output_buffer_.clear();
}

std::string Request::GetOutputAsString() const {
  return std::string(output_buffer_.begin(), output_buffer_.end());
}

void Request::SetUrl(const std::string &url, const std::string &query_string) {
  url_ = url;
  transport_url_ = hook_ ? hook_->AdjustUrl(url) : url;

  if (query_string.empty()) return;

  transport_url_ += (transport_url_.find('?') == std::string::npos) ? '?' : '&';
  transport_url_ += query_string;
}

void Request::SetHeader(const std::string &name, const std::string &value) {
  headers_[name] = value;
}

void Request::SetInputBuffer(std::vector<char> &&buffer) {
  input_buffer_ = std::move(buffer);
}

void Request::SetInputBuffer(const std::string &str) {
  input_buffer_.assign(str.begin(), str.end());
}

void Request::Run(int timeout_in_s) {
  if (method_ == HttpMethod::INVALID)
    throw std::runtime_error("call Init() first!");
  if (url_.empty()) throw std::runtime_error("call SetUrl() first!");

  const int timeout = (timeout_in_s == DEFAULT_REQUEST_TIMEOUT)
                          ? Config::request_timeout_in_s()
                          : timeout_in_s;
  CURLcode r = CURLE_OK;

  transport_->SetTarget(method_, transport_url_, input_buffer_.size());

  for (int iter = 0; iter <= Config::max_transfer_retries(); iter++) {
    if (hook_) hook_->PreRun(this, iter);

    Rewind();
    transport_error_[0] = '\0';
    response_code_ = 0;
    response_headers_.clear();
    output_buffer_.clear();
    deadline_ = time(nullptr) + timeout;

    r = transport_->Perform(headers_, &response_code_);

    if (r == CURLE_OK) {
      if (hook_ && hook_->ShouldRetry(this, iter)) continue;
      break;
    }

    if (!IsRecoverable(r)) break;

    S3XFER_LOG(LOG_WARNING, "Request::Run", "%s for [%s]: %s. retrying.\n",
               curl_easy_strerror(r), url_.c_str(), transport_error_);
    Timer::Sleep(1);
  }

  if (r != CURLE_OK)
    throw std::runtime_error(std::string(IsRecoverable(r) ? "Recoverable"
                                                          : "Unrecoverable") +
                             " error (" + curl_easy_strerror(r) + "): " +
                             transport_error_);

  if (response_code_ >= HTTP_SC_BAD_REQUEST &&
      response_code_ != HTTP_SC_NOT_FOUND)
    S3XFER_LOG(LOG_DEBUG, "Request::Run",
               "%s [%s] failed with code %li and response: %s\n",
               HttpMethodToString(method_), url_.c_str(), response_code_,
               GetOutputAsString().c_str());
}

void Request::Rewind() { input_offset_ = 0; }

bool Request::TimedOut() const {
  if (time(nullptr) <= deadline_) return false;

  S3XFER_LOG(LOG_DEBUG, "Request::TimedOut", "time out for [%s]\n",
             url_.c_str());
  return true;
}

}  // namespace base
}  // namespace s3xfer

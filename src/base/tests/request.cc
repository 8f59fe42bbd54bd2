#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <stdexcept>

#include "base/config.h"
#include "base/request.h"
#include "base/request_hook.h"

namespace s3xfer {
namespace base {
namespace tests {

namespace {
constexpr int REQUEST_TIMEOUT = 2;

class PrefixHook : public RequestHook {
 public:
  std::string AdjustUrl(const std::string &url) override {
    return "http://localhost.invalid" + url;
  }
  void PreRun(Request *r, int iter) override {}
  bool ShouldRetry(Request *r, int iter) override { return false; }
};
}  // namespace

TEST(Request, BadUrl) {
  auto r = RequestFactory::NewNoHook();

  base::Config::set_max_transfer_retries(0);
  r->Init(HttpMethod::GET);
  r->SetUrl("some:bad:url");

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
  base::Config::set_max_transfer_retries(5);
}

TEST(Request, RunWithoutInit) {
  auto r = RequestFactory::NewNoHook();

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
}

TEST(Request, RunWithoutUrl) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  ASSERT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
}

TEST(Request, InputOnlyForPutAndPost) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  r->SetUrl("http://localhost.invalid/");
  r->SetInputBuffer("body");

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
}

TEST(Request, HookKeepsUnadjustedUrl) {
  PrefixHook hook;
  auto r = RequestFactory::New(&hook);

  r->Init(HttpMethod::GET);
  r->SetUrl("/bucket/key", "prefix=a");

  EXPECT_EQ("/bucket/key", r->url());
}

TEST(Request, InitResetsHeaders) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::PUT);
  r->SetHeader("Content-Type", "text/plain");
  EXPECT_EQ(1u, r->headers().size());

  r->Init(HttpMethod::GET);
  EXPECT_TRUE(r->headers().empty());
  EXPECT_EQ(HttpMethod::GET, r->method());
}

TEST(Request, MethodNames) {
  EXPECT_STREQ("PUT", HttpMethodToString(HttpMethod::PUT));
  EXPECT_STREQ("DELETE", HttpMethodToString(HttpMethod::DELETE));
}

}  // namespace tests
}  // namespace base
}  // namespace s3xfer

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>

#include "base/config.h"
#include "services/aws/impl.h"

namespace s3xfer {
namespace services {
namespace aws {
namespace tests {

TEST(AwsImpl, ParamsToHeaders) {
  Params params("bucket", "key");

  params.Set(Field::ACL, "public-read");
  params.Set(Field::GRANT_READ, "emailaddress=alice@example.com");
  params.Set(Field::GRANT_FULL_CONTROL, "id=1234");
  params.Set(Field::SERVER_SIDE_ENCRYPTION, "AES256");
  params.Set(Field::STORAGE_CLASS, "REDUCED_REDUNDANCY");
  params.Set(Field::WEBSITE_REDIRECT_LOCATION, "/other");
  params.Set(Field::CONTENT_TYPE, "application/json");
  params.Set(Field::CACHE_CONTROL, "max-age=60");
  params.Set(Field::EXPIRES, "Sat, 01 Mar 2014 12:00:00 GMT");
  params.Set(Field::COPY_SOURCE, "src/a%20b");

  const auto headers = Impl::ParamsToHeaders(params);

  EXPECT_EQ("public-read", headers.at("x-amz-acl"));
  EXPECT_EQ("emailaddress=alice@example.com", headers.at("x-amz-grant-read"));
  EXPECT_EQ("id=1234", headers.at("x-amz-grant-full-control"));
  EXPECT_EQ("AES256", headers.at("x-amz-server-side-encryption"));
  EXPECT_EQ("REDUCED_REDUNDANCY", headers.at("x-amz-storage-class"));
  EXPECT_EQ("/other", headers.at("x-amz-website-redirect-location"));
  EXPECT_EQ("application/json", headers.at("Content-Type"));
  EXPECT_EQ("max-age=60", headers.at("Cache-Control"));
  EXPECT_EQ("Sat, 01 Mar 2014 12:00:00 GMT", headers.at("Expires"));
  EXPECT_EQ("src/a%20b", headers.at("x-amz-copy-source"));
  EXPECT_EQ(10u, headers.size());
}

TEST(AwsImpl, ListFieldsAreNotHeaders) {
  Params params("bucket", "");

  params.Set(Field::PREFIX, "dir/");
  params.Set(Field::DELIMITER, "/");
  params.Set(Field::MARKER, "dir/a");
  params.Set(Field::LOCATION_CONSTRAINT, "eu-west-1");

  EXPECT_TRUE(Impl::ParamsToHeaders(params).empty());
}

TEST(AwsImpl, CreateBucketBody) {
  EXPECT_EQ("", Impl::GetCreateBucketBody(""));
  EXPECT_THAT(Impl::GetCreateBucketBody("eu-west-1"),
              ::testing::HasSubstr(
                  "<LocationConstraint>eu-west-1</LocationConstraint>"));
}

TEST(AwsImpl, Endpoint) {
  EXPECT_EQ("s3.amazonaws.com", Impl::GetEndpoint("us-east-1"));
  EXPECT_EQ("s3.eu-west-1.amazonaws.com", Impl::GetEndpoint("eu-west-1"));

  base::Config::set_service_endpoint("localhost:9000");
  EXPECT_EQ("localhost:9000", Impl::GetEndpoint("eu-west-1"));
  base::Config::set_service_endpoint("s3.amazonaws.com");
}

TEST(AwsImpl, EmptyBucketIsRejectedBeforeSending) {
  Impl impl("us-east-1", "key", "secret");

  try {
    impl.Call(Operation::GET_OBJECT, Params("", "key"));
    FAIL() << "expected ServiceError";
  } catch (const ServiceError &e) {
    EXPECT_EQ("InvalidParameter", e.code());
    EXPECT_EQ(Operation::GET_OBJECT, e.op());
  }
}

}  // namespace tests
}  // namespace aws
}  // namespace services
}  // namespace s3xfer

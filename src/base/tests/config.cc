#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "base/config.h"

namespace s3xfer {
namespace base {
namespace tests {

namespace {
const char *TEMP_FILE = "/tmp/" PACKAGE_NAME ".test-config";

void WriteConfig(const std::string &contents) {
  std::ofstream f(TEMP_FILE, std::ofstream::out | std::ofstream::trunc);
  f << contents;
}

class ConfigFile : public ::testing::Test {
 protected:
  void TearDown() override {
    unlink(TEMP_FILE);

    Config::set_region("us-east-1");
    Config::set_use_ssl(true);
    Config::set_request_timeout_in_s(30);
    Config::set_max_transfer_retries(5);
  }
};
}  // namespace

TEST(Config, LoadFromInvalidFile) {
  EXPECT_THROW(Config::Init("/tmp/this shouldn't be a file"),
               std::runtime_error);
}

TEST_F(ConfigFile, LoadEmptyFileKeepsDefaults) {
  WriteConfig("");
  Config::Init(TEMP_FILE);

  EXPECT_EQ("us-east-1", Config::region());
  EXPECT_EQ("s3.amazonaws.com", Config::service_endpoint());
  EXPECT_TRUE(Config::use_ssl());
  EXPECT_EQ(30, Config::request_timeout_in_s());
}

TEST_F(ConfigFile, ParsesValuesAndComments) {
  WriteConfig(
      "# comment line\n"
      "region = eu-west-1   # trailing comment\n"
      "\n"
      "use_ssl=no\n"
      "request_timeout_in_s=12\n");
  Config::Init(TEMP_FILE);

  EXPECT_EQ("eu-west-1", Config::region());
  EXPECT_FALSE(Config::use_ssl());
  EXPECT_EQ(12, Config::request_timeout_in_s());
}

TEST_F(ConfigFile, UnknownKeyThrows) {
  WriteConfig("not_a_real_key=1\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigFile, MissingEqualsThrows) {
  WriteConfig("region\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigFile, BadIntegerThrows) {
  WriteConfig("max_transfer_retries=lots\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigFile, BadBooleanThrows) {
  WriteConfig("use_ssl=perhaps\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigFile, ConstraintViolationThrows) {
  WriteConfig("request_timeout_in_s=0\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

}  // namespace tests
}  // namespace base
}  // namespace s3xfer

#include <string>

#include <gtest/gtest.h>

#include "tasks/file_info.h"
#include "tasks/file_task.h"

namespace s3xfer {
namespace tasks {
namespace tests {

namespace {
void ExpectSplit(const std::string &path, const std::string &bucket,
                 const std::string &key) {
  std::string b, k;

  SplitBucketKey(path, &b, &k);
  EXPECT_EQ(bucket, b) << "for path = " << path;
  EXPECT_EQ(key, k) << "for path = " << path;
}
}  // namespace

TEST(SplitBucketKey, BucketAndKey) {
  ExpectSplit("bucket/a/b/c.txt", "bucket", "a/b/c.txt");
  ExpectSplit("bucket/key", "bucket", "key");
}

TEST(SplitBucketKey, BucketOnly) {
  ExpectSplit("bucket", "bucket", "");
  ExpectSplit("bucket/", "bucket", "");
}

TEST(SplitBucketKey, Empty) { ExpectSplit("", "", ""); }

TEST(SplitBucketKey, IgnoresScheme) {
  ExpectSplit("s3://bucket/dir/", "bucket", "dir/");
  ExpectSplit("s3://", "", "");
}

TEST(PathType, Names) {
  EXPECT_STREQ("local", PathTypeToString(PathType::LOCAL));
  EXPECT_STREQ("s3", PathTypeToString(PathType::S3));
  EXPECT_STREQ("unset", PathTypeToString(PathType::UNSET));
}

TEST(TransferDirection, AllCombinations) {
  EXPECT_EQ(TransferDirection::UPLOAD,
            GetTransferDirection(PathType::LOCAL, PathType::S3));
  EXPECT_EQ(TransferDirection::COPY,
            GetTransferDirection(PathType::S3, PathType::S3));
  EXPECT_EQ(TransferDirection::DOWNLOAD,
            GetTransferDirection(PathType::S3, PathType::LOCAL));
  EXPECT_EQ(TransferDirection::INVALID,
            GetTransferDirection(PathType::LOCAL, PathType::LOCAL));
  EXPECT_EQ(TransferDirection::INVALID,
            GetTransferDirection(PathType::UNSET, PathType::S3));
}

}  // namespace tests
}  // namespace tasks
}  // namespace s3xfer

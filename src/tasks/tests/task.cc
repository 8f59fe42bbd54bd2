#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "services/tests/fake_service.h"
#include "tasks/errors.h"
#include "tasks/task.h"

namespace s3xfer {
namespace tasks {
namespace tests {

namespace {
using services::Operation;
using services::tests::FakeService;

FileInfo RemoteCopy(const std::string &src, const std::string &dest) {
  FileInfo info;

  info.src = src;
  info.src_type = PathType::S3;
  info.dest = dest;
  info.dest_type = PathType::S3;
  return info;
}
}  // namespace

TEST(Task, CommandNames) {
  EXPECT_STREQ("list", Task::CommandToString(Task::Command::LIST));
  EXPECT_STREQ("make_bucket",
               Task::CommandToString(Task::Command::MAKE_BUCKET));
  EXPECT_STREQ("remove_bucket",
               Task::CommandToString(Task::Command::REMOVE_BUCKET));
  EXPECT_STREQ("move", Task::CommandToString(Task::Command::MOVE));
  EXPECT_STREQ("create_multipart_upload",
               Task::CommandToString(Task::Command::CREATE_MULTIPART_UPLOAD));
}

TEST(Task, BucketKind) {
  auto service = std::make_shared<FakeService>();
  Task task{BucketTask(service, "mybucket")};

  EXPECT_EQ(Task::Kind::BUCKET, task.kind());
  EXPECT_EQ("mybucket", task.bucket_task().src());
  EXPECT_THROW(task.file_task(), std::logic_error);
}

TEST(Task, FileKind) {
  auto service = std::make_shared<FakeService>();
  Task task{FileTask(service, RemoteCopy("b/src", "b/dest"))};

  EXPECT_EQ(Task::Kind::FILE, task.kind());
  EXPECT_EQ("b/src", task.file_task().info().src);
  EXPECT_THROW(task.bucket_task(), std::logic_error);
}

TEST(Task, RunsBucketCommands) {
  auto service = std::make_shared<FakeService>();
  Task task{BucketTask(service, "mybucket")};
  std::ostringstream out;

  task.Run(Task::Command::MAKE_BUCKET);
  task.Run(Task::Command::REMOVE_BUCKET);
  service->AddListPage(services::Response());
  task.Run(Task::Command::LIST, &out);

  EXPECT_EQ(1u, service->CountCalls(Operation::CREATE_BUCKET));
  EXPECT_EQ(1u, service->CountCalls(Operation::DELETE_BUCKET));
  EXPECT_EQ(1u, service->CountCalls(Operation::LIST_OBJECTS));
  EXPECT_NE(std::string::npos, out.str().find("Bucket: mybucket\n"));
}

TEST(Task, RunsFileCommands) {
  auto service = std::make_shared<FakeService>();
  Task task{FileTask(service, RemoteCopy("b/src", "b/dest"))};

  service->AddObject("b/src", "data");

  task.Run(Task::Command::COPY);
  EXPECT_TRUE(service->HasObject("b/dest"));

  task.Run(Task::Command::DELETE);
  EXPECT_FALSE(service->HasObject("b/src"));
}

TEST(Task, StartsMultipartUpload) {
  auto service = std::make_shared<FakeService>();
  FileInfo info;

  info.src = "/tmp/big.bin";
  info.src_type = PathType::LOCAL;
  info.dest = "b/big.bin";
  info.dest_type = PathType::S3;

  Task task{FileTask(service, info)};

  EXPECT_TRUE(task.upload_id().empty());
  task.Run(Task::Command::CREATE_MULTIPART_UPLOAD);

  EXPECT_EQ("upload-1", task.upload_id());
  ASSERT_EQ(1u, service->calls().size());
  EXPECT_EQ(Operation::CREATE_MULTIPART_UPLOAD, service->calls()[0].op);
  EXPECT_EQ("big.bin", service->calls()[0].params.key());
}

TEST(Task, BucketTaskRejectsFileCommands) {
  auto service = std::make_shared<FakeService>();
  Task task{BucketTask(service, "mybucket")};

  EXPECT_THROW(task.Run(Task::Command::UPLOAD), ValidationError);
  EXPECT_THROW(task.Run(Task::Command::MOVE), ValidationError);
  EXPECT_THROW(task.Run(Task::Command::CREATE_MULTIPART_UPLOAD),
               ValidationError);
  EXPECT_TRUE(service->calls().empty());
}

TEST(Task, FileTaskRejectsBucketCommands) {
  auto service = std::make_shared<FakeService>();
  Task task{FileTask(service, RemoteCopy("b/src", "b/dest"))};

  EXPECT_THROW(task.Run(Task::Command::LIST), ValidationError);
  EXPECT_THROW(task.Run(Task::Command::MAKE_BUCKET), ValidationError);
  EXPECT_TRUE(service->calls().empty());
}

}  // namespace tests
}  // namespace tasks
}  // namespace s3xfer

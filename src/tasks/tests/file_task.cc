#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fs/local_file.h"
#include "fs/mime_types.h"
#include "services/tests/fake_service.h"
#include "tasks/errors.h"
#include "tasks/file_task.h"

namespace s3xfer {
namespace tasks {
namespace tests {

namespace {
constexpr time_t FAKE_MTIME = 1393675200;  // FAKE_LAST_MODIFIED
constexpr char WRONG_ETAG[] = "\"00000000000000000000000000000000\"";

using services::Operation;
using services::tests::FakeService;

class FileTaskTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char templ[] = "/tmp/" PACKAGE_NAME ".test-XXXXXX";
    ASSERT_TRUE(mkdtemp(templ));
    dir_ = templ;

    service_ = std::make_shared<FakeService>();
    fs::MimeTypes::Init();
  }

  void TearDown() override {
    const std::string cmd = "rm -rf '" + dir_ + "'";
    EXPECT_EQ(0, system(cmd.c_str()));
  }

  std::string WriteLocal(const std::string &name, const std::string &data) {
    const std::string path = dir_ + "/" + name;
    std::ofstream f(path, std::ofstream::out | std::ofstream::trunc |
                              std::ofstream::binary);
    f << data;
    return path;
  }

  bool Exists(const std::string &path) {
    struct stat s;
    return stat(path.c_str(), &s) == 0;
  }

  std::string ReadLocal(const std::string &path) {
    const auto data = fs::LocalFile::Read(path);
    return std::string(data.begin(), data.end());
  }

  FileInfo Upload(const std::string &src, const std::string &dest) {
    FileInfo info;
    info.src = src;
    info.src_type = PathType::LOCAL;
    info.dest = dest;
    info.dest_type = PathType::S3;
    return info;
  }

  FileInfo Download(const std::string &src, const std::string &dest) {
    FileInfo info;
    info.src = src;
    info.src_type = PathType::S3;
    info.dest = dest;
    info.dest_type = PathType::LOCAL;
    return info;
  }

  FileInfo Copy(const std::string &src, const std::string &dest) {
    FileInfo info;
    info.src = src;
    info.src_type = PathType::S3;
    info.dest = dest;
    info.dest_type = PathType::S3;
    return info;
  }

  std::string dir_;
  std::shared_ptr<FakeService> service_;
};
}  // namespace

TEST_F(FileTaskTest, NullServiceIsRejected) {
  EXPECT_THROW(FileTask(nullptr, FileInfo()), std::invalid_argument);
}

TEST_F(FileTaskTest, MalformedGrantFailsBeforeAnyCall) {
  TransferOptions options;
  options.grants = {"badformat"};

  EXPECT_THROW(FileTask(service_, Upload(WriteLocal("f", "x"), "b/f"), options),
               ValidationError);
  EXPECT_TRUE(service_->calls().empty());
}

TEST_F(FileTaskTest, Upload) {
  const std::string src = WriteLocal("file.txt", "hello world!");

  FileTask(service_, Upload(src, "bucket/dir/file.txt")).Upload();

  ASSERT_TRUE(service_->HasObject("bucket/dir/file.txt"));
  const auto &obj = service_->GetObject("bucket/dir/file.txt");
  EXPECT_EQ("hello world!", std::string(obj.data.begin(), obj.data.end()));
  EXPECT_EQ("bucket", obj.params.bucket());
  EXPECT_EQ("dir/file.txt", obj.params.key());
  ASSERT_TRUE(obj.params.body());
}

TEST_F(FileTaskTest, UploadEmptyFileOmitsBody) {
  const std::string src = WriteLocal("empty", "");

  FileTask(service_, Upload(src, "bucket/empty")).Upload();

  ASSERT_EQ(1u, service_->calls().size());
  EXPECT_EQ(Operation::PUT_OBJECT, service_->calls()[0].op);
  EXPECT_FALSE(service_->calls()[0].params.body());
  EXPECT_TRUE(service_->GetObject("bucket/empty").data.empty());
}

TEST_F(FileTaskTest, UploadAppliesOptions) {
  const std::string src = WriteLocal("data.json", "{}");
  TransferOptions options;

  options.guess_mime_type = true;
  options.acl = std::string("public-read");

  FileTask(service_, Upload(src, "bucket/data.json"), options).Upload();

  const auto &params = service_->GetObject("bucket/data.json").params;
  EXPECT_EQ("application/json", params.Get(services::Field::CONTENT_TYPE));
  EXPECT_EQ("public-read", params.Get(services::Field::ACL));
}

TEST_F(FileTaskTest, UploadChecksumMismatch) {
  const std::string src = WriteLocal("file.txt", "hello world!");

  service_->OverrideEtag(WRONG_ETAG);

  try {
    FileTask(service_, Upload(src, "bucket/file.txt")).Upload();
    FAIL() << "expected IntegrityError";
  } catch (const IntegrityError &e) {
    EXPECT_EQ(WRONG_ETAG, e.expected());
    EXPECT_EQ("\"fc3ff98e8c6a0d3087d515c0473f8677\"", e.actual());
  }
}

TEST_F(FileTaskTest, UploadMissingEtag) {
  const std::string src = WriteLocal("file.txt", "hello world!");

  service_->OverrideEtag("");

  EXPECT_THROW(FileTask(service_, Upload(src, "bucket/file.txt")).Upload(),
               IntegrityError);
}

TEST_F(FileTaskTest, UploadAcceptsMultipartEtag) {
  const std::string src = WriteLocal("file.txt", "hello world!");

  service_->OverrideEtag("\"fc3ff98e8c6a0d3087d515c0473f8677-2\"");

  EXPECT_NO_THROW(FileTask(service_, Upload(src, "bucket/file.txt")).Upload());
}

TEST_F(FileTaskTest, UploadAcceptsUpperCaseEtag) {
  const std::string src = WriteLocal("file.txt", "hello world!");

  service_->OverrideEtag("\"FC3FF98E8C6A0D3087D515C0473F8677\"");

  EXPECT_NO_THROW(FileTask(service_, Upload(src, "bucket/file.txt")).Upload());
}

TEST_F(FileTaskTest, UploadAcceptsEtagWithHighBitBytes) {
  const std::string src = WriteLocal("file.txt", "hello world!");

  service_->OverrideEtag("\"\xc3\xa9\xff" + std::string(29, '0') + "\"");

  EXPECT_NO_THROW(FileTask(service_, Upload(src, "bucket/file.txt")).Upload());
}

TEST_F(FileTaskTest, UploadMissingSourceMakesNoCall) {
  EXPECT_THROW(
      FileTask(service_, Upload(dir_ + "/missing", "bucket/missing")).Upload(),
      fs::LocalFileError);
  EXPECT_TRUE(service_->calls().empty());
}

TEST_F(FileTaskTest, RoundTrip) {
  std::string payload;
  for (int i = 0; i < 100000; i++) payload += static_cast<char>(i % 256);

  const std::string src = WriteLocal("in.bin", payload);
  const std::string dest = dir_ + "/out/nested/out.bin";

  FileTask(service_, Upload(src, "bucket/blob")).Upload();
  FileTask(service_, Download("bucket/blob", dest)).Download();

  // before reading, which may move atime
  struct stat s;
  ASSERT_EQ(0, stat(dest.c_str(), &s));
  EXPECT_EQ(FAKE_MTIME, s.st_mtime);
  EXPECT_EQ(FAKE_MTIME, s.st_atime);

  EXPECT_EQ(payload, ReadLocal(dest));
}

TEST_F(FileTaskTest, DownloadUsesLastUpdateWhenKnown) {
  const std::string dest = dir_ + "/out.txt";
  FileInfo info = Download("bucket/key", dest);

  service_->AddObject("bucket/key", "data");
  info.last_update = 1000000000;

  FileTask(service_, info).Download();

  struct stat s;
  ASSERT_EQ(0, stat(dest.c_str(), &s));
  EXPECT_EQ(1000000000, s.st_mtime);
}

TEST_F(FileTaskTest, DownloadChecksumMismatchWritesNothing) {
  const std::string dest = dir_ + "/sub/out.txt";

  service_->AddObject("bucket/key", "data");
  service_->OverrideEtag(WRONG_ETAG);

  EXPECT_THROW(FileTask(service_, Download("bucket/key", dest)).Download(),
               IntegrityError);
  EXPECT_FALSE(Exists(dest));
}

TEST_F(FileTaskTest, DownloadMissingObject) {
  EXPECT_THROW(
      FileTask(service_, Download("bucket/nope", dir_ + "/nope")).Download(),
      services::ServiceError);
  EXPECT_FALSE(Exists(dir_ + "/nope"));
}

TEST_F(FileTaskTest, DownloadIntoExistingDirectories) {
  service_->AddObject("bucket/a", "first");
  service_->AddObject("bucket/b", "second");

  FileTask(service_, Download("bucket/a", dir_ + "/x/a")).Download();
  FileTask(service_, Download("bucket/b", dir_ + "/x/b")).Download();

  EXPECT_EQ("first", ReadLocal(dir_ + "/x/a"));
  EXPECT_EQ("second", ReadLocal(dir_ + "/x/b"));
}

TEST_F(FileTaskTest, CopyEscapesSource) {
  service_->AddObject("bucket/dir/my file~1.txt", "data");

  FileTask(service_, Copy("bucket/dir/my file~1.txt", "other/copy.txt"))
      .Copy();

  ASSERT_EQ(1u, service_->calls().size());
  const auto &params = service_->calls()[0].params;
  EXPECT_EQ(Operation::COPY_OBJECT, service_->calls()[0].op);
  EXPECT_EQ("bucket/dir/my%20file~1.txt",
            params.Get(services::Field::COPY_SOURCE));
  EXPECT_EQ("other", params.bucket());
  EXPECT_EQ("copy.txt", params.key());
  EXPECT_TRUE(service_->HasObject("other/copy.txt"));
  EXPECT_TRUE(service_->HasObject("bucket/dir/my file~1.txt"));
}

TEST_F(FileTaskTest, CopyAppliesOptionsToDestination) {
  TransferOptions options;

  service_->AddObject("bucket/page.html", "<html/>");
  options.guess_mime_type = true;
  options.storage_class = std::string("STANDARD_IA");

  FileTask(service_, Copy("bucket/page.html", "bucket/copy"), options).Copy();

  const auto &params = service_->GetObject("bucket/copy").params;
  EXPECT_EQ("text/html", params.Get(services::Field::CONTENT_TYPE));
  EXPECT_EQ("STANDARD_IA", params.Get(services::Field::STORAGE_CLASS));
}

TEST_F(FileTaskTest, DeleteRemote) {
  FileInfo info;

  service_->AddObject("bucket/key", "data");
  info.src = "bucket/key";
  info.src_type = PathType::S3;

  FileTask(service_, info).Delete();

  EXPECT_FALSE(service_->HasObject("bucket/key"));
  EXPECT_EQ(1u, service_->CountCalls(Operation::DELETE_OBJECT));
}

TEST_F(FileTaskTest, DeleteLocal) {
  FileInfo info;

  info.src = WriteLocal("file", "x");
  info.src_type = PathType::LOCAL;

  FileTask(service_, info).Delete();

  EXPECT_FALSE(Exists(info.src));
  EXPECT_TRUE(service_->calls().empty());
}

TEST_F(FileTaskTest, DeleteWithoutSourceType) {
  FileInfo info;
  info.src = "bucket/key";

  EXPECT_THROW(FileTask(service_, info).Delete(), ValidationError);
  EXPECT_TRUE(service_->calls().empty());
}

TEST_F(FileTaskTest, MoveUpload) {
  const std::string src = WriteLocal("file.txt", "moving");

  FileTask(service_, Upload(src, "bucket/file.txt")).Move();

  EXPECT_TRUE(service_->HasObject("bucket/file.txt"));
  EXPECT_FALSE(Exists(src));
}

TEST_F(FileTaskTest, MoveDownload) {
  const std::string dest = dir_ + "/file.txt";

  service_->AddObject("bucket/file.txt", "moving");

  FileTask(service_, Download("bucket/file.txt", dest)).Move();

  EXPECT_EQ("moving", ReadLocal(dest));
  EXPECT_FALSE(service_->HasObject("bucket/file.txt"));
}

TEST_F(FileTaskTest, MoveCopyDeletesAfterCopy) {
  service_->AddObject("bucket/old", "moving");

  FileTask(service_, Copy("bucket/old", "bucket/new")).Move();

  EXPECT_TRUE(service_->HasObject("bucket/new"));
  EXPECT_FALSE(service_->HasObject("bucket/old"));

  ASSERT_EQ(2u, service_->calls().size());
  EXPECT_EQ(Operation::COPY_OBJECT, service_->calls()[0].op);
  EXPECT_EQ(Operation::DELETE_OBJECT, service_->calls()[1].op);
  EXPECT_EQ("old", service_->calls()[1].params.key());
}

TEST_F(FileTaskTest, MoveKeepsSourceWhenUploadFails) {
  const std::string src = WriteLocal("file.txt", "precious");

  service_->Fail(Operation::PUT_OBJECT);

  EXPECT_THROW(FileTask(service_, Upload(src, "bucket/file.txt")).Move(),
               services::ServiceError);
  EXPECT_EQ("precious", ReadLocal(src));
}

TEST_F(FileTaskTest, MoveKeepsSourceWhenUploadIsCorrupted) {
  const std::string src = WriteLocal("file.txt", "precious");

  service_->OverrideEtag(WRONG_ETAG);

  EXPECT_THROW(FileTask(service_, Upload(src, "bucket/file.txt")).Move(),
               IntegrityError);
  EXPECT_EQ("precious", ReadLocal(src));
}

TEST_F(FileTaskTest, MoveKeepsRemoteSourceWhenCopyFails) {
  service_->AddObject("bucket/old", "precious");
  service_->Fail(Operation::COPY_OBJECT);

  EXPECT_THROW(FileTask(service_, Copy("bucket/old", "bucket/new")).Move(),
               services::ServiceError);
  EXPECT_TRUE(service_->HasObject("bucket/old"));
  EXPECT_EQ(0u, service_->CountCalls(Operation::DELETE_OBJECT));
}

TEST_F(FileTaskTest, MoveKeepsRemoteSourceWhenDownloadIsCorrupted) {
  const std::string dest = dir_ + "/file.txt";

  service_->AddObject("bucket/file.txt", "precious");
  service_->OverrideEtag(WRONG_ETAG);

  EXPECT_THROW(FileTask(service_, Download("bucket/file.txt", dest)).Move(),
               IntegrityError);
  EXPECT_TRUE(service_->HasObject("bucket/file.txt"));
  EXPECT_EQ(0u, service_->CountCalls(Operation::DELETE_OBJECT));
  EXPECT_FALSE(Exists(dest));
}

TEST_F(FileTaskTest, MoveLocalToLocalHasNoSideEffects) {
  FileInfo info;

  info.src = WriteLocal("a", "stay");
  info.src_type = PathType::LOCAL;
  info.dest = dir_ + "/b";
  info.dest_type = PathType::LOCAL;

  EXPECT_THROW(FileTask(service_, info).Move(), ValidationError);
  EXPECT_EQ("stay", ReadLocal(info.src));
  EXPECT_FALSE(Exists(info.dest));
  EXPECT_TRUE(service_->calls().empty());
}

TEST_F(FileTaskTest, CreateMultipartUpload) {
  TransferOptions options;
  options.storage_class = std::string("REDUCED_REDUNDANCY");

  const std::string id =
      FileTask(service_, Upload(dir_ + "/big.bin", "bucket/big.bin"), options)
          .CreateMultipartUpload();

  EXPECT_EQ("upload-1", id);
  ASSERT_EQ(1u, service_->calls().size());

  const auto &call = service_->calls()[0];
  EXPECT_EQ(Operation::CREATE_MULTIPART_UPLOAD, call.op);
  EXPECT_EQ("bucket", call.params.bucket());
  EXPECT_EQ("big.bin", call.params.key());
  EXPECT_EQ("REDUCED_REDUNDANCY",
            call.params.Get(services::Field::STORAGE_CLASS));
}

}  // namespace tests
}  // namespace tasks
}  // namespace s3xfer

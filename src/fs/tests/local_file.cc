#include <dirent.h>
#include <errno.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fs/local_file.h"

namespace s3xfer {
namespace fs {
namespace tests {

namespace {
constexpr time_t MTIME = 1393675200;  // 2014-03-01 12:00:00 UTC

class LocalFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char templ[] = "/tmp/" PACKAGE_NAME ".test-XXXXXX";
    ASSERT_TRUE(mkdtemp(templ));
    dir_ = templ;
  }

  void TearDown() override {
    const std::string cmd = "rm -rf '" + dir_ + "'";
    EXPECT_EQ(0, system(cmd.c_str()));
  }

  std::vector<std::string> ListDirectory(const std::string &path) {
    std::vector<std::string> names;
    DIR *dir = opendir(path.c_str());

    if (!dir) return names;

    while (dirent *entry = readdir(dir)) {
      const std::string name = entry->d_name;
      if (name != "." && name != "..") names.push_back(name);
    }

    closedir(dir);
    return names;
  }

  std::string dir_;
};

std::vector<char> ToVector(const std::string &str) {
  return std::vector<char>(str.begin(), str.end());
}
}  // namespace

TEST_F(LocalFileTest, SaveThenRead) {
  const std::string path = dir_ + "/file.txt";

  LocalFile::Save(path, ToVector("hello world!"), MTIME);
  EXPECT_EQ(ToVector("hello world!"), LocalFile::Read(path));
}

TEST_F(LocalFileTest, SaveSetsTimes) {
  const std::string path = dir_ + "/file.txt";
  struct stat s;

  LocalFile::Save(path, ToVector("x"), MTIME);

  ASSERT_EQ(0, stat(path.c_str(), &s));
  EXPECT_EQ(MTIME, s.st_mtime);
  EXPECT_EQ(MTIME, s.st_atime);
}

TEST_F(LocalFileTest, SaveCreatesParentDirectories) {
  const std::string path = dir_ + "/a/b/c/file.bin";

  LocalFile::Save(path, ToVector("nested"), MTIME);
  EXPECT_EQ(ToVector("nested"), LocalFile::Read(path));
}

TEST_F(LocalFileTest, SaveEmptyFile) {
  const std::string path = dir_ + "/empty";

  LocalFile::Save(path, std::vector<char>(), MTIME);
  EXPECT_TRUE(LocalFile::Read(path).empty());
}

TEST_F(LocalFileTest, SaveReplacesExistingFileAndLeavesNoTemporaries) {
  const std::string path = dir_ + "/file.txt";

  LocalFile::Save(path, ToVector("first version, longer"), MTIME);
  LocalFile::Save(path, ToVector("second"), MTIME);

  EXPECT_EQ(ToVector("second"), LocalFile::Read(path));

  const auto names = ListDirectory(dir_);
  ASSERT_EQ(1u, names.size());
  EXPECT_EQ("file.txt", names.front());
}

TEST_F(LocalFileTest, SaveOverDirectoryFailsCleanly) {
  const std::string path = dir_ + "/target";

  LocalFile::MakeDirectories(path + "/inner");

  EXPECT_THROW(LocalFile::Save(path, ToVector("data"), MTIME),
               LocalFileError);

  // only the directory we created
  const auto names = ListDirectory(dir_);
  ASSERT_EQ(1u, names.size());
  EXPECT_EQ("target", names.front());
}

TEST_F(LocalFileTest, ReadMissingFile) {
  try {
    LocalFile::Read(dir_ + "/missing");
    FAIL() << "expected LocalFileError";
  } catch (const LocalFileError &e) {
    EXPECT_EQ(ENOENT, e.error_number());
    EXPECT_EQ(dir_ + "/missing", e.path());
  }
}

TEST_F(LocalFileTest, Remove) {
  const std::string path = dir_ + "/file.txt";

  LocalFile::Save(path, ToVector("x"), MTIME);
  LocalFile::Remove(path);

  EXPECT_TRUE(ListDirectory(dir_).empty());
  EXPECT_THROW(LocalFile::Remove(path), LocalFileError);
}

TEST_F(LocalFileTest, MakeDirectoriesIsIdempotent) {
  const std::string path = dir_ + "/x/y/z";

  LocalFile::MakeDirectories(path);
  LocalFile::MakeDirectories(path);

  struct stat s;
  ASSERT_EQ(0, stat(path.c_str(), &s));
  EXPECT_TRUE(S_ISDIR(s.st_mode));
}

TEST_F(LocalFileTest, MakeDirectoriesThroughFileFails) {
  const std::string file = dir_ + "/file";

  LocalFile::Save(file, ToVector("x"), MTIME);

  try {
    LocalFile::MakeDirectories(file + "/sub");
    FAIL() << "expected LocalFileError";
  } catch (const LocalFileError &e) {
    EXPECT_EQ(ENOTDIR, e.error_number());
  }
}

TEST_F(LocalFileTest, ConcurrentSavesIntoSameNewDirectory) {
  constexpr int WORKERS = 16;
  const std::string sub = dir_ + "/shared/deeper";
  std::vector<std::thread> threads;
  std::vector<int> failures(WORKERS, 0);

  for (int i = 0; i < WORKERS; i++) {
    threads.emplace_back([&, i]() {
      try {
        LocalFile::Save(sub + "/file-" + std::to_string(i),
                        ToVector(std::to_string(i)), MTIME);
      } catch (const LocalFileError &) {
        failures[i] = 1;
      }
    });
  }

  for (auto &t : threads) t.join();

  for (int i = 0; i < WORKERS; i++) {
    EXPECT_EQ(0, failures[i]) << "for worker " << i;
    EXPECT_EQ(ToVector(std::to_string(i)),
              LocalFile::Read(sub + "/file-" + std::to_string(i)));
  }
}

}  // namespace tests
}  // namespace fs
}  // namespace s3xfer

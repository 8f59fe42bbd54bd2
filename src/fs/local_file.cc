/*
 * fs/local_file.cc
 * -------------------------------------------------------------------------
 * Whole-file reads and writes on the local file system.
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

#include "fs/local_file.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utime.h>

#include <atomic>

#include "base/logger.h"
#include "base/paths.h"

namespace s3xfer {
namespace fs {

namespace {
constexpr mode_t NEW_FILE_MODE = 0666;      // before umask
constexpr mode_t NEW_DIRECTORY_MODE = 0777;  // before umask
constexpr int MAX_TEMP_FILE_ATTEMPTS = 16;

std::atomic_uint s_temp_counter(0);

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ != -1) close(fd_);
  }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  inline int get() const { return fd_; }

  int Close() {
    const int r = close(fd_);
    fd_ = -1;
    return r;
  }

 private:
  int fd_;
};

int OpenTempFile(const std::string &path, std::string *temp_path) {
  const std::string dir = base::Paths::DirName(path);
  const std::string prefix =
      (dir.empty() ? std::string() : dir + "/") + "." +
      base::Paths::BaseName(path) + "." PACKAGE_NAME "-" +
      std::to_string(getpid()) + "-";

  for (int i = 0; i < MAX_TEMP_FILE_ATTEMPTS; i++) {
    *temp_path = prefix + std::to_string(++s_temp_counter);

    const int fd = open(temp_path->c_str(),
                        O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, NEW_FILE_MODE);
    if (fd != -1) return fd;
    if (errno != EEXIST) throw LocalFileError("create", *temp_path, errno);
  }

  throw LocalFileError("create temporary file for", path, EEXIST);
}

void WriteAll(int fd, const std::vector<char> &data,
              const std::string &temp_path) {
  size_t offset = 0;

  while (offset < data.size()) {
    const ssize_t r = write(fd, data.data() + offset, data.size() - offset);

    if (r == -1) {
      if (errno == EINTR) continue;
      throw LocalFileError("write", temp_path, errno);
    }

    offset += static_cast<size_t>(r);
  }
}
}  // namespace

LocalFileError::LocalFileError(const std::string &action,
                               const std::string &path, int err)
    : std::runtime_error("unable to " + action + " [" + path +
                         "]: " + strerror(err)),
      path_(path),
      error_number_(err) {}

std::vector<char> LocalFile::Read(const std::string &path) {
  FileDescriptor fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) throw LocalFileError("open", path, errno);

  struct stat s;
  if (fstat(fd.get(), &s) == -1) throw LocalFileError("stat", path, errno);

  std::vector<char> data;
  data.reserve(static_cast<size_t>(s.st_size));

  char buf[64 * 1024];
  while (true) {
    const ssize_t r = read(fd.get(), buf, sizeof(buf));

    if (r == -1) {
      if (errno == EINTR) continue;
      throw LocalFileError("read", path, errno);
    }

    if (r == 0) break;
    data.insert(data.end(), buf, buf + r);
  }

  return data;
}

void LocalFile::Save(const std::string &path, const std::vector<char> &data,
                     time_t mtime) {
  const std::string dir = base::Paths::DirName(path);
  if (!dir.empty()) MakeDirectories(dir);

  std::string temp_path;
  FileDescriptor fd(OpenTempFile(path, &temp_path));

  try {
    WriteAll(fd.get(), data, temp_path);

    if (fd.Close() == -1) throw LocalFileError("close", temp_path, errno);

    if (rename(temp_path.c_str(), path.c_str()) == -1)
      throw LocalFileError("rename temporary file to", path, errno);
  } catch (const LocalFileError &) {
    if (unlink(temp_path.c_str()) == -1 && errno != ENOENT)
      S3XFER_LOG(LOG_WARNING, "LocalFile::Save",
                 "failed to clean up [%s]: %s\n", temp_path.c_str(),
                 strerror(errno));
    throw;
  }

  struct utimbuf times;
  times.actime = mtime;
  times.modtime = mtime;

  if (utime(path.c_str(), &times) == -1)
    throw LocalFileError("set modification time of", path, errno);
}

void LocalFile::Remove(const std::string &path) {
  if (unlink(path.c_str()) == -1) throw LocalFileError("remove", path, errno);
}

void LocalFile::MakeDirectories(const std::string &path) {
  struct stat s;

  if (stat(path.c_str(), &s) == 0) {
    if (S_ISDIR(s.st_mode)) return;
    throw LocalFileError("create directory", path, ENOTDIR);
  }

  const std::string parent = base::Paths::DirName(path);
  if (!parent.empty() && parent != path) MakeDirectories(parent);

  // another worker may have created it since we checked
  if (mkdir(path.c_str(), NEW_DIRECTORY_MODE) == -1 && errno != EEXIST)
    throw LocalFileError("create directory", path, errno);
}

}  // namespace fs
}  // namespace s3xfer

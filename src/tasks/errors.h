/*
 * tasks/errors.h
 * -------------------------------------------------------------------------
 * Error classes raised by transfer and bucket tasks.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2014, Tarick Bedeir.
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

#ifndef S3XFER_TASKS_ERRORS_H
#define S3XFER_TASKS_ERRORS_H

#include <stdexcept>
#include <string>

namespace s3xfer {
namespace tasks {
// Bad options or path combinations. Raised before anything is sent to the
// store or touched on disk.
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string &message)
      : std::invalid_argument(message) {}
};

// The checksum reported by the store doesn't match the bytes we hold.
class IntegrityError : public std::runtime_error {
 public:
  IntegrityError(const std::string &path, const std::string &expected,
                 const std::string &actual);

  inline const std::string &path() const { return path_; }
  inline const std::string &expected() const { return expected_; }
  inline const std::string &actual() const { return actual_; }

 private:
  std::string path_, expected_, actual_;
};
}  // namespace tasks
}  // namespace s3xfer

#endif

/*
 * tasks/errors.cc
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

#include "tasks/errors.h"

namespace s3xfer {
namespace tasks {

namespace {
std::string BuildMessage(const std::string &path, const std::string &expected,
                         const std::string &actual) {
  if (expected.empty())
    return "no checksum returned for [" + path + "]; computed " + actual + ".";

  return "checksum mismatch for [" + path + "]: store reported " + expected +
         ", computed " + actual + ".";
}
}  // namespace

IntegrityError::IntegrityError(const std::string &path,
                               const std::string &expected,
                               const std::string &actual)
    : std::runtime_error(BuildMessage(path, expected, actual)),
      path_(path),
      expected_(expected),
      actual_(actual) {}

}  // namespace tasks
}  // namespace s3xfer

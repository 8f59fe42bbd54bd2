/*
 * base/paths.cc
 * -------------------------------------------------------------------------
 * Path transformations.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2013, Tarick Bedeir.
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

#include "base/paths.h"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <stdexcept>
#include <vector>

namespace s3xfer {
namespace base {

std::string Paths::Transform(const std::string &path) {
  if (path.empty() || path[0] != '~') return path;

  const char *home = getenv("HOME");
  if (!home) throw std::runtime_error("HOME is not set, cannot expand '~'.");

  return std::string(home) + (path.c_str() + 1);
}

std::string Paths::Absolute(const std::string &path) {
  const std::string transformed = Transform(path);
  if (!transformed.empty() && transformed[0] == '/') return transformed;

  std::vector<char> cwd(PATH_MAX);
  if (!getcwd(&cwd[0], cwd.size()))
    throw std::runtime_error(std::string("getcwd() failed: ") +
                             strerror(errno));

  std::string ret(&cwd[0]);
  if (ret.back() != '/') ret += '/';
  return ret + transformed;
}

std::string Paths::DirName(const std::string &path) {
  const size_t pos = path.rfind('/');
  if (pos == std::string::npos) return "";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

std::string Paths::BaseName(const std::string &path) {
  const size_t pos = path.rfind('/');
  return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

}  // namespace base
}  // namespace s3xfer

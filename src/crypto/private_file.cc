/*
 * crypto/private_file.cc
 * -------------------------------------------------------------------------
 * Opens files holding credentials.
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

#include "crypto/private_file.h"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <stdexcept>

namespace s3xfer {
namespace crypto {

void PrivateFile::Open(const std::string &file, std::ifstream *f) {
  struct stat s;

  if (stat(file.c_str(), &s) == -1)
    throw std::runtime_error("unable to stat private file [" + file + "].");

  // group and others get nothing; the owner must at least be able to read
  if ((s.st_mode & (S_IRWXG | S_IRWXO)) || !(s.st_mode & S_IRUSR) ||
      (s.st_mode & S_IXUSR))
    throw std::runtime_error("private file [" + file +
                             "] must be readable/writeable only by owner.");

  f->open(file.c_str(), std::ios::in);

  if (!f->good())
    throw std::runtime_error("unable to open private file [" + file + "].");
}

}  // namespace crypto
}  // namespace s3xfer

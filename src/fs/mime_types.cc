/*
 * fs/mime_types.cc
 * -------------------------------------------------------------------------
 * MIME type lookup implementation.
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

#include "fs/mime_types.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <iterator>
#include <map>
#include <sstream>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "base/paths.h"

namespace s3xfer {
namespace fs {

namespace {
const char *MAP_FILES[] = {"/etc/httpd/mime.types", "/etc/mime.types",
                           "~/.mime.types"};

// enough to guess sensibly on hosts without a mime.types file
const std::pair<const char *, const char *> BUILT_IN_TYPES[] = {
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"txt", "text/plain"},
    {"xml", "application/xml"},
    {"zip", "application/zip"}};

std::map<std::string, std::string> s_map;

void LoadFromFile(const std::string &path) {
  std::ifstream f(base::Paths::Transform(path).c_str(), std::ifstream::in);
  if (!f.is_open()) return;

  S3XFER_LOG(LOG_DEBUG, "MimeTypes::Init", "loading [%s]\n", path.c_str());

  while (f.good()) {
    std::string line;
    std::getline(f, line);

    size_t pos = line.find('#');
    if (pos == 0)
      continue;
    else if (pos != std::string::npos)
      line = line.substr(0, pos);

    std::istringstream line_stream(line);
    std::vector<std::string> fields{
        std::istream_iterator<std::string>(line_stream),
        std::istream_iterator<std::string>()};

    for (size_t i = 1; i < fields.size(); i++) s_map[fields[i]] = fields[0];
  }
}
}  // namespace

void MimeTypes::Init() {
  s_map.clear();

  for (const auto &type : BUILT_IN_TYPES) s_map[type.first] = type.second;
  for (const auto *file : MAP_FILES) LoadFromFile(file);

  if (!base::Config::mime_types_file().empty())
    LoadFromFile(base::Config::mime_types_file());
}

std::string MimeTypes::GetTypeByExtension(std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](char c) {
                   return static_cast<char>(
                       std::tolower(static_cast<unsigned char>(c)));
                 });
  const auto iter = s_map.find(ext);
  return (iter == s_map.end()) ? "" : iter->second;
}

std::string MimeTypes::GuessType(const std::string &path) {
  const std::string name = base::Paths::BaseName(path);
  const size_t pos = name.rfind('.');

  // no extension, or a dot-file like ".profile"
  if (pos == std::string::npos || pos == 0 || pos == name.size() - 1)
    return "";

  return GetTypeByExtension(name.substr(pos + 1));
}

}  // namespace fs
}  // namespace s3xfer

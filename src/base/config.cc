/*
 * base/config.cc
 * -------------------------------------------------------------------------
 * Configuration file parsing.
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

#include "base/config.h"

#include <strings.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include <boost/lexical_cast.hpp>

#include "base/logger.h"
#include "base/paths.h"

namespace s3xfer {
namespace base {

namespace {
const char *DEFAULT_CONFIG_FILES[] = {"~/.s3xfer/s3xfer.conf",
                                      SYSCONFDIR "/s3xfer.conf"};

template <typename T>
struct OptionParserWorker {
  static void Parse(const std::string &str, T *out) {
    *out = boost::lexical_cast<T>(str);
  }
};

template <>
struct OptionParserWorker<std::string> {
  static void Parse(const std::string &str, std::string *out) { *out = str; }
};

template <>
struct OptionParserWorker<bool> {
  static void Parse(const std::string &str, bool *out) {
    const char *s = str.c_str();

    if (!strcasecmp(s, "yes") || !strcasecmp(s, "true") ||
        !strcasecmp(s, "1") || !strcasecmp(s, "on")) {
      *out = true;
      return;
    }

    if (!strcasecmp(s, "no") || !strcasecmp(s, "false") ||
        !strcasecmp(s, "0") || !strcasecmp(s, "off")) {
      *out = false;
      return;
    }

    throw std::runtime_error("cannot parse.");
  }
};

template <typename T>
void ParseOption(int line_number, const char *key, const char *type,
                 const std::string &str, T *out) {
  try {
    OptionParserWorker<T>::Parse(str, out);
  } catch (const std::exception &e) {
    S3XFER_LOG(LOG_ERR, "Config::Init",
               "error at line %i: cannot parse [%s] for key [%s] of type %s.\n",
               line_number, str.c_str(), key, type);
    throw std::runtime_error("malformed config file");
  }
}

std::string Trim(const std::string &s) {
  const char *WHITESPACE = " \t\r";
  const size_t begin = s.find_first_not_of(WHITESPACE);
  if (begin == std::string::npos) return "";
  return s.substr(begin, s.find_last_not_of(WHITESPACE) - begin + 1);
}
}  // namespace

#define CONFIG(type, name, def, desc) type Config::s_##name = (def);
#define CONFIG_REQUIRED(type, name, def, desc) CONFIG(type, name, def, desc)
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

void Config::Init(const std::string &file) {
  std::ifstream ifs;
  int line_number = 0;

  if (file.empty()) {
    for (const auto *f : DEFAULT_CONFIG_FILES) {
      ifs.open(Paths::Transform(f).c_str());
      if (ifs.good()) break;
      ifs.clear();
    }

    if (!ifs.is_open()) {
      for (const auto *f : DEFAULT_CONFIG_FILES)
        S3XFER_LOG(LOG_ERR, "Config::Init",
                   "unable to open configuration in [%s]\n", f);

      throw std::runtime_error("cannot open any default config files");
    }
  } else {
    ifs.open(Paths::Transform(file).c_str());

    if (ifs.fail()) {
      S3XFER_LOG(LOG_ERR, "Config::Init", "cannot open file [%s].\n",
                 file.c_str());
      throw std::runtime_error("cannot open specified config file");
    }
  }

  while (ifs.good()) {
    std::string line;

    std::getline(ifs, line);
    line_number++;

    size_t pos = line.find('#');
    if (pos != std::string::npos) line = line.substr(0, pos);

    line = Trim(line);
    if (line.empty()) continue;

    pos = line.find('=');

    if (pos == std::string::npos) {
      S3XFER_LOG(LOG_ERR, "Config::Init", "error at line %i: missing '='.\n",
                 line_number);
      throw std::runtime_error("malformed config file");
    }

    const std::string key = Trim(line.substr(0, pos));
    const std::string value = Trim(line.substr(pos + 1));

#define CONFIG(type, name, def, desc)                                   \
  if (key == #name) {                                                   \
    ParseOption<type>(line_number, #name, #type, value, &s_##name);     \
    continue;                                                           \
  }

#define CONFIG_REQUIRED(type, name, def, desc) CONFIG(type, name, def, desc)
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

    S3XFER_LOG(LOG_ERR, "Config::Init",
               "error at line %i: unknown directive '%s'\n", line_number,
               key.c_str());
    throw std::runtime_error("malformed config file");
  }

#define CONFIG(type, name, def, desc)

#define CONFIG_REQUIRED(type, name, def, desc)                            \
  if (s_##name == (def)) {                                                \
    S3XFER_LOG(LOG_ERR, "Config::Init", "required key '%s' not defined.\n", \
               #name);                                                    \
    throw std::runtime_error("malformed config file");                    \
  }

#define CONFIG_CONSTRAINT(test, message)                   \
  if (!(test)) {                                           \
    S3XFER_LOG(LOG_ERR, "Config::Init", "%s\n", message);  \
    throw std::runtime_error("malformed config file");     \
  }

#define CONFIG_KEY(key) s_##key

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
}

}  // namespace base
}  // namespace s3xfer

/*
 * base/timer.cc
 * -------------------------------------------------------------------------
 * Time parsing and formatting.
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

#include "base/timer.h"

#include <stdio.h>
#include <string.h>

#include <stdexcept>

namespace s3xfer {
namespace base {

time_t Timer::ParseIsoTime(const std::string &str) {
  tm t;
  int consumed = 0;

  memset(&t, 0, sizeof(t));

  if (sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &t.tm_year, &t.tm_mon,
             &t.tm_mday, &t.tm_hour, &t.tm_min, &t.tm_sec, &consumed) != 6)
    throw std::runtime_error("malformed timestamp: " + str);

  t.tm_year -= 1900;
  t.tm_mon -= 1;

  const char *p = str.c_str() + consumed;

  if (*p == '.') {
    ++p;
    while (*p >= '0' && *p <= '9') ++p;
  }

  long offset = 0;

  if (*p == '+' || *p == '-') {
    int hours = 0, minutes = 0;
    if (sscanf(p + 1, "%2d:%2d", &hours, &minutes) != 2)
      throw std::runtime_error("malformed time zone offset: " + str);

    offset = (hours * 60 + minutes) * 60;
    if (*p == '-') offset = -offset;
  } else if (*p != 'Z' && *p != '\0') {
    throw std::runtime_error("malformed timestamp: " + str);
  }

  const time_t utc = timegm(&t);
  if (utc == static_cast<time_t>(-1))
    throw std::runtime_error("timestamp out of range: " + str);

  return utc - offset;
}

time_t Timer::ParseHttpTime(const std::string &str) {
  tm t;
  memset(&t, 0, sizeof(t));

  const char *end = strptime(str.c_str(), "%a, %d %b %Y %H:%M:%S", &t);
  if (!end) throw std::runtime_error("malformed HTTP date: " + str);

  return timegm(&t);
}

std::string Timer::GetLocalTimeString(time_t t) {
  tm local;
  if (!localtime_r(&t, &local))
    throw std::runtime_error("localtime_r() failed.");

  char time_str[32];
  strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &local);
  return time_str;
}

}  // namespace base
}  // namespace s3xfer

/*
 * base/timer.h
 * -------------------------------------------------------------------------
 * Timing and time-conversion helpers.
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

#ifndef S3XFER_BASE_TIMER_H
#define S3XFER_BASE_TIMER_H

#include <sys/time.h>
#include <time.h>

#include <string>

namespace s3xfer {
namespace base {
class Timer {
 public:
  inline static double GetCurrentTime() {
    timeval t;
    gettimeofday(&t, nullptr);
    return static_cast<double>(t.tv_sec) +
           static_cast<double>(t.tv_usec) / 1.0e6;
  }

  inline static std::string GetHttpTime() {
    time_t sys_time;
    time(&sys_time);

    tm gm_time;
    gmtime_r(&sys_time, &gm_time);

    char time_str[128];
    strftime(time_str, 128, "%a, %d %b %Y %H:%M:%S GMT", &gm_time);
    return time_str;
  }

  inline static void Sleep(int sec) {
    struct timespec ts = {sec, 0};
    nanosleep(&ts, nullptr);
  }

  // Parses ISO 8601 timestamps as found in S3 listings, e.g.
  // "2014-03-01T12:00:00.000Z". Fractional seconds are dropped. Throws
  // std::runtime_error on malformed input.
  static time_t ParseIsoTime(const std::string &str);

  // Parses RFC 1123 dates as found in the Last-Modified header.
  static time_t ParseHttpTime(const std::string &str);

  // "YYYY-MM-DD HH:MM:SS" in the local time zone.
  static std::string GetLocalTimeString(time_t t);
};
}  // namespace base
}  // namespace s3xfer

#endif

/*
 * main.cc
 * -------------------------------------------------------------------------
 * Command-line driver for bucket and object tasks.
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

#include <getopt.h>
#include <sys/stat.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "base/config.h"
#include "base/logger.h"
#include "base/paths.h"
#include "base/xml.h"
#include "fs/mime_types.h"
#include "services/service.h"
#include "tasks/bucket_task.h"
#include "tasks/errors.h"
#include "tasks/file_task.h"
#include "tasks/task.h"

namespace s3xfer {
namespace {
constexpr char SHORT_OPTIONS[] = "c:r:vhV";
constexpr char S3_SCHEME[] = "s3://";

enum LongOnlyOption {
  OPT_ACL = 256,
  OPT_GRANTS,
  OPT_SSE,
  OPT_STORAGE_CLASS,
  OPT_WEBSITE_REDIRECT,
  OPT_GUESS_MIME_TYPE,
  OPT_CONTENT_TYPE,
  OPT_CACHE_CONTROL,
  OPT_CONTENT_DISPOSITION,
  OPT_CONTENT_ENCODING,
  OPT_CONTENT_LANGUAGE,
  OPT_EXPIRES
};

constexpr option LONG_OPTIONS[] = {
    {"config", required_argument, nullptr, 'c'},
    {"region", required_argument, nullptr, 'r'},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {"acl", required_argument, nullptr, OPT_ACL},
    {"grants", required_argument, nullptr, OPT_GRANTS},
    {"sse", no_argument, nullptr, OPT_SSE},
    {"storage-class", required_argument, nullptr, OPT_STORAGE_CLASS},
    {"website-redirect", required_argument, nullptr, OPT_WEBSITE_REDIRECT},
    {"guess-mime-type", no_argument, nullptr, OPT_GUESS_MIME_TYPE},
    {"content-type", required_argument, nullptr, OPT_CONTENT_TYPE},
    {"cache-control", required_argument, nullptr, OPT_CACHE_CONTROL},
    {"content-disposition", required_argument, nullptr,
     OPT_CONTENT_DISPOSITION},
    {"content-encoding", required_argument, nullptr, OPT_CONTENT_ENCODING},
    {"content-language", required_argument, nullptr, OPT_CONTENT_LANGUAGE},
    {"expires", required_argument, nullptr, OPT_EXPIRES},
    {nullptr, 0, nullptr, '\0'}};

struct Location {
  std::string path;
  tasks::PathType type = tasks::PathType::UNSET;
};

void PrintUsage(const char *arg0) {
  const char *base_name = std::strrchr(arg0, '/');
  base_name = base_name ? base_name + 1 : arg0;

  std::cerr
      << "Usage: " << base_name
      << " [options] <command> [args]\n"
         "\n"
         "Commands:\n"
         "  ls [s3://bucket/prefix]   list buckets, or objects under a prefix\n"
         "  mb s3://bucket            create a bucket\n"
         "  rb s3://bucket            remove an (empty) bucket\n"
         "  cp <src> <dest>           upload, download or copy an object\n"
         "  mv <src> <dest>           like cp, then remove <src>\n"
         "  rm <path>                 remove an object or a local file\n"
         "\n"
         "Options:\n"
         "  -c, --config FILE         use FILE rather than the default "
         "configuration file\n"
         "  -r, --region REGION       override the configured region\n"
         "  -v, --verbose             log to stderr (repeat for more "
         "verbosity)\n"
         "  -h, --help                print this help message and exit\n"
         "  -V, --version             print version and exit\n"
         "\n"
         "Object options (cp, mv):\n"
         "  --acl ACL                 canned ACL, e.g. public-read\n"
         "  --grants PERM=PRINCIPAL   PERM is read, readacl, writeacl or full "
         "(repeatable)\n"
         "  --sse                     server-side encryption (AES256)\n"
         "  --storage-class CLASS     e.g. REDUCED_REDUNDANCY\n"
         "  --website-redirect URL    redirect location metadata\n"
         "  --guess-mime-type         set Content-Type from the file "
         "extension\n"
         "  --content-type, --cache-control, --content-disposition,\n"
         "  --content-encoding, --content-language, --expires VALUE\n"
         "                            set the corresponding header\n"
      << std::endl;
}

void PrintVersion() {
  std::cout << PACKAGE_NAME << ", " << PACKAGE_VERSION << ", "
            << "file transfer tool for S3" << std::endl;
}

// First occurrence wins.
void SetOnce(boost::optional<std::string> *field, const char *value) {
  if (!*field) *field = value;
}

Location ParseLocation(const std::string &arg) {
  Location loc;

  if (arg.compare(0, std::strlen(S3_SCHEME), S3_SCHEME) == 0) {
    loc.path = arg.substr(std::strlen(S3_SCHEME));
    loc.type = tasks::PathType::S3;
  } else {
    loc.path = base::Paths::Absolute(base::Paths::Transform(arg));
    loc.type = tasks::PathType::LOCAL;
  }

  return loc;
}

bool IsLocalDirectory(const std::string &path) {
  struct stat s;
  return stat(path.c_str(), &s) == 0 && S_ISDIR(s.st_mode);
}

// "cp file s3://bucket/dir/" and "cp s3://bucket/key ./" take the source's
// name.
std::string ResolveDestination(const Location &src, const Location &dest) {
  const std::string name = base::Paths::BaseName(src.path);
  std::string bucket, key;

  if (dest.type == tasks::PathType::S3) {
    tasks::SplitBucketKey(dest.path, &bucket, &key);

    if (key.empty()) return bucket + "/" + name;
    if (key.back() == '/') return dest.path + name;

    return dest.path;
  }

  if (!dest.path.empty() && dest.path.back() == '/') return dest.path + name;
  if (IsLocalDirectory(dest.path)) return dest.path + "/" + name;

  return dest.path;
}

void Init(const std::string &config_file, const std::string &region,
          int verbosity) {
  base::Logger::Init(base::Logger::Mode::STDERR, verbosity);
  base::Config::Init(config_file);

  if (!region.empty()) base::Config::set_region(region);

  base::XmlDocument::Init();
  fs::MimeTypes::Init();
}

tasks::Task::Command GetTransferCommand(const std::string &command,
                                        const Location &src,
                                        const Location &dest) {
  if (command == "mv") return tasks::Task::Command::MOVE;

  switch (tasks::GetTransferDirection(src.type, dest.type)) {
    case tasks::TransferDirection::UPLOAD:
      return tasks::Task::Command::UPLOAD;
    case tasks::TransferDirection::COPY:
      return tasks::Task::Command::COPY;
    case tasks::TransferDirection::DOWNLOAD:
      return tasks::Task::Command::DOWNLOAD;
    case tasks::TransferDirection::INVALID:
      break;
  }

  throw tasks::ValidationError(
      "cp needs at least one s3:// path; use your shell for local copies.");
}

tasks::Task BuildTask(const std::string &command,
                      const std::vector<std::string> &args,
                      const tasks::TransferOptions &options,
                      tasks::Task::Command *to_run) {
  auto service = services::Service::Create(base::Config::region());

  if (command == "ls") {
    const Location loc = args.empty() ? Location() : ParseLocation(args[0]);

    if (!args.empty() && loc.type != tasks::PathType::S3)
      throw tasks::ValidationError("ls needs an s3:// path.");

    *to_run = tasks::Task::Command::LIST;
    return tasks::Task(tasks::BucketTask(service, loc.path, loc.type, command));
  }

  if (command == "mb" || command == "rb") {
    if (args.size() != 1)
      throw tasks::ValidationError(command + " needs a bucket.");

    const Location loc = ParseLocation(args[0]);
    std::string bucket, key;

    tasks::SplitBucketKey(loc.path, &bucket, &key);

    if (loc.type != tasks::PathType::S3 || bucket.empty() || !key.empty())
      throw tasks::ValidationError(command + " needs an s3://bucket path.");

    *to_run = (command == "mb") ? tasks::Task::Command::MAKE_BUCKET
                                : tasks::Task::Command::REMOVE_BUCKET;
    return tasks::Task(tasks::BucketTask(service, bucket, loc.type, command));
  }

  if (command == "rm") {
    if (args.size() != 1) throw tasks::ValidationError("rm needs one path.");

    tasks::FileInfo info;
    const Location loc = ParseLocation(args[0]);

    info.src = loc.path;
    info.src_type = loc.type;
    info.operation = "delete";

    *to_run = tasks::Task::Command::DELETE;
    return tasks::Task(tasks::FileTask(service, info, options));
  }

  if (command == "cp" || command == "mv") {
    if (args.size() != 2)
      throw tasks::ValidationError(command +
                                   " needs a source and a destination.");

    tasks::FileInfo info;
    const Location src = ParseLocation(args[0]);
    const Location dest = ParseLocation(args[1]);

    info.src = src.path;
    info.src_type = src.type;
    info.dest = ResolveDestination(src, dest);
    info.dest_type = dest.type;
    info.compare_key = base::Paths::BaseName(src.path);

    *to_run = GetTransferCommand(command, src, dest);
    info.operation = tasks::Task::CommandToString(*to_run);

    return tasks::Task(tasks::FileTask(service, info, options));
  }

  throw tasks::ValidationError("unknown command [" + command + "].");
}
}  // namespace
}  // namespace s3xfer

int main(int argc, char **argv) {
  int opt = 0;
  int verbosity = LOG_WARNING;
  std::string config_file, region;
  s3xfer::tasks::TransferOptions options;

  while ((opt = getopt_long(argc, argv, s3xfer::SHORT_OPTIONS,
                            s3xfer::LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
      case 'c':
        config_file = optarg;
        break;

      case 'r':
        region = optarg;
        break;

      case 'v':
        verbosity++;
        break;

      case 'h':
        s3xfer::PrintUsage(argv[0]);
        return 0;

      case 'V':
        s3xfer::PrintVersion();
        return 0;

      case s3xfer::OPT_ACL:
        s3xfer::SetOnce(&options.acl, optarg);
        break;

      case s3xfer::OPT_GRANTS:
        options.grants.push_back(optarg);
        break;

      case s3xfer::OPT_SSE:
        options.sse = true;
        break;

      case s3xfer::OPT_STORAGE_CLASS:
        s3xfer::SetOnce(&options.storage_class, optarg);
        break;

      case s3xfer::OPT_WEBSITE_REDIRECT:
        s3xfer::SetOnce(&options.website_redirect, optarg);
        break;

      case s3xfer::OPT_GUESS_MIME_TYPE:
        options.guess_mime_type = true;
        break;

      case s3xfer::OPT_CONTENT_TYPE:
        s3xfer::SetOnce(&options.content_type, optarg);
        break;

      case s3xfer::OPT_CACHE_CONTROL:
        s3xfer::SetOnce(&options.cache_control, optarg);
        break;

      case s3xfer::OPT_CONTENT_DISPOSITION:
        s3xfer::SetOnce(&options.content_disposition, optarg);
        break;

      case s3xfer::OPT_CONTENT_ENCODING:
        s3xfer::SetOnce(&options.content_encoding, optarg);
        break;

      case s3xfer::OPT_CONTENT_LANGUAGE:
        s3xfer::SetOnce(&options.content_language, optarg);
        break;

      case s3xfer::OPT_EXPIRES:
        s3xfer::SetOnce(&options.expires, optarg);
        break;

      default:
        s3xfer::PrintUsage(argv[0]);
        return 1;
    }
  }

  if (optind >= argc) {
    s3xfer::PrintUsage(argv[0]);
    return 1;
  }

  const std::string command = argv[optind++];
  const std::vector<std::string> args(argv + optind, argv + argc);

  try {
    s3xfer::tasks::Task::Command to_run = s3xfer::tasks::Task::Command::LIST;

    s3xfer::Init(config_file, region, verbosity);

    auto task = s3xfer::BuildTask(command, args, options, &to_run);
    task.Run(to_run, &std::cout);

  } catch (const s3xfer::tasks::IntegrityError &e) {
    std::cerr << "integrity check failed: " << e.what() << std::endl;
    return 1;

  } catch (const s3xfer::tasks::ValidationError &e) {
    std::cerr << "invalid arguments: " << e.what() << std::endl;
    return 1;

  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/pid_file.h"

#include <string>

#include <base/files/file_util.h>
#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>

namespace btserial {

namespace {

// A pid is at most 7 digits on Linux, anything longer is not ours.
constexpr size_t kMaxPidFileSize = 64;

}  // namespace

PidFile::PidFile(const base::FilePath& path) : path_(path) {}

base::Optional<pid_t> PidFile::Read() const {
  std::string contents;
  if (!base::ReadFileToStringWithMaxSize(path_, &contents, kMaxPidFileSize))
    return base::nullopt;

  std::string trimmed;
  base::TrimWhitespaceASCII(contents, base::TRIM_ALL, &trimmed);
  int pid = 0;
  if (!base::StringToInt(trimmed, &pid) || pid <= 0) {
    LOG(WARNING) << "Ignoring malformed pid file " << path_.value();
    return base::nullopt;
  }
  return static_cast<pid_t>(pid);
}

bool PidFile::Write(pid_t pid) const {
  const base::FilePath dir = path_.DirName();
  if (!base::DirectoryExists(dir) && !base::CreateDirectory(dir)) {
    PLOG(ERROR) << "Failed to create " << dir.value();
    return false;
  }

  const std::string contents = base::StringPrintf("%d\n", pid);
  if (base::WriteFile(path_, contents.data(), contents.size()) !=
      static_cast<int>(contents.size())) {
    PLOG(ERROR) << "Failed to write " << path_.value();
    return false;
  }
  return true;
}

bool PidFile::Remove() const {
  if (!base::DeleteFile(path_, false /* recursive */)) {
    PLOG(ERROR) << "Failed to remove " << path_.value();
    return false;
  }
  return true;
}

}  // namespace btserial

// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_PID_FILE_H_
#define BTSERIAL_PID_FILE_H_

#include <sys/types.h>

#include <base/files/file_path.h>
#include <base/optional.h>

namespace btserial {

// Plain-text marker holding the decimal pid of the running daemon followed
// by a newline.
class PidFile {
 public:
  explicit PidFile(const base::FilePath& path);
  ~PidFile() = default;

  const base::FilePath& path() const { return path_; }

  // Returns the recorded pid. A missing, unreadable or malformed file, as
  // well as a non-positive pid, yields no value.
  base::Optional<pid_t> Read() const;

  // Writes |pid|, creating the parent directory if needed.
  bool Write(pid_t pid) const;

  // Deletes the file. Returns true if the file is gone afterwards.
  bool Remove() const;

 private:
  base::FilePath path_;
};

}  // namespace btserial

#endif  // BTSERIAL_PID_FILE_H_

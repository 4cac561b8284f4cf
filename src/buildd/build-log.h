// buildd - Build Execution Daemon
// Copyright (c) 2026 The buildd Authors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BUILDD_BUILD_LOG_H_
#define BUILDD_BUILD_LOG_H_

#include <kj/async-io.h>
#include <kj/time.h>
#include "util.h"

namespace buildd {

class BuildLog {
  // The append-only log of one build. Everything the build's commands print lands here, in the
  // order it was printed. Each write counts as activity for stall detection.

public:
  static constexpr size_t TAIL_SIZE = 2048;

  BuildLog(kj::Timer& timer, kj::Maybe<kj::AutoCloseFd> fd);
  // With a null `fd` the log is kept in memory only (just the tail survives).

  static kj::Own<BuildLog> open(kj::Timer& timer, kj::StringPtr path);
  // Create or truncate the log file at `path`.

  KJ_DISALLOW_COPY(BuildLog);

  void write(kj::ArrayPtr<const byte> data);
  void write(kj::StringPtr text) { write(text.asBytes()); }

  void writeCommand(kj::ArrayPtr<const kj::String> argv);
  // Write a timestamp line and a "RUN:" line announcing a command.

  void touch();
  // Count as activity without writing anything.

  kj::TimePoint getLastActivity() const { return lastActivity; }

  kj::Array<byte> getTail() const;
  // The last TAIL_SIZE bytes written.

private:
  kj::Timer& timer;
  kj::Maybe<kj::AutoCloseFd> fd;
  kj::Vector<byte> tail;
  kj::TimePoint lastActivity;
};

kj::String sanitizeLogTail(kj::ArrayPtr<const byte> tail);
// Prepare a log tail from a private build for the dispatcher: drop the first line, which is
// usually partial, strip "user:password@" from URLs and remove ",proxyauth=user:token"
// fragments.

kj::String sanitizeLog(kj::ArrayPtr<const char> text);
// Strip credentials from complete log lines, as above, keeping the first line.

kj::String formatTimestamp(time_t when);
// ctime(3)-style local time, without the trailing newline.

}  // namespace buildd

#endif  // BUILDD_BUILD_LOG_H_

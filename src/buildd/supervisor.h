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

#ifndef BUILDD_SUPERVISOR_H_
#define BUILDD_SUPERVISOR_H_

#include <kj/async-io.h>
#include <kj/time.h>
#include "util.h"
#include "build-log.h"

namespace buildd {

class ProcessSupervisor {
  // Runs the commands of one build, one at a time. Each command gets its own process group, its
  // stdin is /dev/null, and its stdout and stderr are merged into the build log as the output
  // arrives.
  //
  // The promise returned by run() may be dropped at any time (e.g. by the stall watchdog). The
  // process keeps running and its output keeps flowing into the log until terminate() or the
  // next run() / the supervisor's destruction.

public:
  ProcessSupervisor(kj::LowLevelAsyncIoProvider& ioProvider, SubprocessSet& subprocesses,
                    kj::Timer& timer, BuildLog& log);
  ~ProcessSupervisor() noexcept(false);
  KJ_DISALLOW_COPY(ProcessSupervisor);

  struct Result {
    int exitCode;
    // 128 + signo if the process was killed by a signal.

    kj::String output;
    // The command's output, if capture was requested.
  };

  kj::Promise<Result> run(kj::ArrayPtr<const kj::String> argv,
                          kj::Maybe<kj::StringPtr> workingDirectory = nullptr,
                          bool captureOutput = false);
  // Start `argv` and resolve once it has exited and its output pipe is drained. Throws if a
  // previous command is still running.

  kj::Promise<void> runChecked(kj::ArrayPtr<const kj::String> argv);
  // Like run() but throws if the command fails.

  bool isRunning();

  kj::Promise<void> terminate(kj::Duration gracePeriod);
  // SIGTERM the current command's process group, then SIGKILL it if it is still alive after
  // `gracePeriod`. Resolves once the command's main process has exited; a no-op if nothing is
  // running.

  kj::Own<ProcessSupervisor> newSibling();
  // Another supervisor writing to the same log. For a command that has to run while this one's
  // command is still going, such as the sandbox's process reaper during an abort.

  BuildLog& getLog() { return log; }

  kj::Maybe<kj::Duration> getLastRunTime() { return lastRunTime; }
  // Wall-clock duration of the most recent command that ran to completion.

private:
  kj::LowLevelAsyncIoProvider& ioProvider;
  SubprocessSet& subprocesses;
  kj::Timer& timer;
  BuildLog& log;

  struct Running;
  kj::Maybe<kj::Own<Running>> running;
  kj::Maybe<kj::Duration> lastRunTime;

  static kj::Promise<void> pumpToLog(kj::AsyncInputStream& input, BuildLog& log,
                                     kj::Maybe<kj::Vector<char>&> capture);
};

}  // namespace buildd

#endif  // BUILDD_SUPERVISOR_H_

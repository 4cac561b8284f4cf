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

#include "supervisor.h"
#include <signal.h>
#include <sys/wait.h>

namespace buildd {

struct ProcessSupervisor::Running {
  Subprocess process;
  kj::TimePoint startTime;
  kj::Vector<char> captured;

  kj::ForkedPromise<void> drained = nullptr;
  kj::ForkedPromise<int> exited = nullptr;
  // Declared after `process`, so they are canceled before ~Subprocess() kills it.

  Running(Subprocess&& process, kj::TimePoint startTime)
      : process(kj::mv(process)), startTime(startTime) {}
};

ProcessSupervisor::ProcessSupervisor(kj::LowLevelAsyncIoProvider& ioProvider,
                                     SubprocessSet& subprocesses, kj::Timer& timer,
                                     BuildLog& log)
    : ioProvider(ioProvider), subprocesses(subprocesses), timer(timer), log(log) {}

ProcessSupervisor::~ProcessSupervisor() noexcept(false) {}

kj::Promise<ProcessSupervisor::Result> ProcessSupervisor::run(
    kj::ArrayPtr<const kj::String> argv, kj::Maybe<kj::StringPtr> workingDirectory,
    bool captureOutput) {
  KJ_REQUIRE(argv.size() > 0, "empty command");
  KJ_REQUIRE(!isRunning(), "a supervised command is already running", argv[0]);

  // Whatever is left of the previous command (at most a pipe still held open by an orphan) goes.
  running = nullptr;

  log.writeCommand(argv);

  auto argvPtrs = KJ_MAP(arg, argv) -> kj::StringPtr { return arg; };
  Subprocess::Options options(argvPtrs.asPtr());
  auto pipe = Pipe::make();
  auto devNull = raiiOpen("/dev/null", O_RDONLY | O_CLOEXEC);
  options.stdin = devNull;
  options.stdout = pipe.writeEnd;
  options.stderr = pipe.writeEnd;
  options.newProcessGroup = true;
  options.workingDirectory = workingDirectory;

  auto r = kj::heap<Running>(Subprocess(kj::mv(options)), timer.now());
  pipe.writeEnd = nullptr;

  auto input = ioProvider.wrapInputFd(pipe.readEnd.release(),
      kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
      kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);

  Running& ref = *r;
  kj::Maybe<kj::Vector<char>&> capture = nullptr;
  if (captureOutput) capture = ref.captured;

  ref.drained = pumpToLog(*input, log, capture).attach(kj::mv(input)).fork();
  ref.exited = subprocesses.waitForExitOrSignal(ref.process).fork();
  running = kj::mv(r);

  return ref.drained.addBranch()
      .then([&ref]() { return ref.exited.addBranch(); })
      .then([this,&ref](int status) {
    lastRunTime = timer.now() - ref.startTime;
    if (WIFSIGNALED(status)) {
      log.write(kj::str("Command ", formatWaitStatus(status), ".\n"));
    }
    return Result { waitStatusToExitCode(status), kj::heapString(ref.captured.asPtr()) };
  });
}

kj::Promise<void> ProcessSupervisor::runChecked(kj::ArrayPtr<const kj::String> argv) {
  auto command = formatCommand(argv);
  return run(argv).then([KJ_MVCAP(command)](Result&& result) {
    KJ_REQUIRE(result.exitCode == 0, "command failed", command, result.exitCode);
  });
}

bool ProcessSupervisor::isRunning() {
  KJ_IF_MAYBE(r, running) {
    return (*r)->process.isRunning();
  } else {
    return false;
  }
}

kj::Promise<void> ProcessSupervisor::terminate(kj::Duration gracePeriod) {
  if (!isRunning()) return kj::READY_NOW;

  Running& r = *KJ_ASSERT_NONNULL(running);
  log.write(kj::str("Sending SIGTERM to process group ", r.process.getPid(), ".\n"));
  r.process.killGroup(SIGTERM);

  return r.exited.addBranch().ignoreResult()
      .exclusiveJoin(timer.afterDelay(gracePeriod).then([this,&r]() {
    if (r.process.isRunning()) {
      log.write(kj::str("Process group ", r.process.getPid(),
                        " survived SIGTERM; sending SIGKILL.\n"));
      r.process.killGroup(SIGKILL);
    }
    return r.exited.addBranch().ignoreResult();
  }));
}

kj::Own<ProcessSupervisor> ProcessSupervisor::newSibling() {
  return kj::heap<ProcessSupervisor>(ioProvider, subprocesses, timer, log);
}

kj::Promise<void> ProcessSupervisor::pumpToLog(kj::AsyncInputStream& input, BuildLog& log,
                                               kj::Maybe<kj::Vector<char>&> capture) {
  auto buffer = kj::heapArray<byte>(8192);
  auto promise = input.tryRead(buffer.begin(), 1, buffer.size());
  return promise.then([&input,&log,capture,KJ_MVCAP(buffer)](size_t n) mutable
                      -> kj::Promise<void> {
    if (n == 0) return kj::READY_NOW;

    auto chunk = buffer.slice(0, n);
    log.write(chunk);
    KJ_IF_MAYBE(c, capture) {
      c->addAll(reinterpret_cast<const char*>(chunk.begin()),
                reinterpret_cast<const char*>(chunk.end()));
    }
    return pumpToLog(input, log, capture);
  });
}

}  // namespace buildd

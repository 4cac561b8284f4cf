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
#include <kj/test.h>
#include <kj/async-unix.h>

namespace buildd {
namespace {

struct SupervisorFixture {
  SupervisorFixture()
      : io(kj::setupAsyncIo()),
        subprocesses(io.unixEventPort),
        log(io.provider->getTimer(), nullptr),
        supervisor(*io.lowLevelProvider, subprocesses, io.provider->getTimer(), log) {}

  kj::AsyncIoContext io;
  SubprocessSet subprocesses;
  BuildLog log;
  ProcessSupervisor supervisor;

  template <typename T>
  T waitBriefly(kj::Promise<T>&& promise) {
    return promise.exclusiveJoin(
        io.provider->getTimer().afterDelay(10 * kj::SECONDS).then([]() -> T {
      KJ_FAIL_ASSERT("timed out");
    })).wait(io.waitScope);
  }

  kj::String tail() {
    auto bytes = log.getTail();
    return kj::heapString(bytes.asChars());
  }

  bool logContains(kj::StringPtr text) {
    return findSubstring(tail(), text) != nullptr;
  }
};

KJ_TEST("ProcessSupervisor merges output into the log") {
  SupervisorFixture fixture;

  auto result = fixture.waitBriefly(fixture.supervisor.run(
      makeArgv("sh", "-c", "echo out; echo err >&2; exit 3")));
  KJ_EXPECT(result.exitCode == 3);
  KJ_EXPECT(result.output == "");

  KJ_EXPECT(fixture.logContains("RUN: sh -c 'echo out; echo err >&2; exit 3'\n"), fixture.tail());
  KJ_EXPECT(fixture.logContains("out\n"));
  KJ_EXPECT(fixture.logContains("err\n"));
  KJ_EXPECT(!fixture.supervisor.isRunning());
  KJ_EXPECT(fixture.supervisor.getLastRunTime() != nullptr);
}

KJ_TEST("ProcessSupervisor captures output on request") {
  SupervisorFixture fixture;

  auto result = fixture.waitBriefly(fixture.supervisor.run(
      makeArgv("printf", "abc"), nullptr, true));
  KJ_EXPECT(result.exitCode == 0);
  KJ_EXPECT(result.output == "abc");
  KJ_EXPECT(fixture.tail().endsWith("abc"));

  auto pwd = fixture.waitBriefly(fixture.supervisor.run(
      makeArgv("pwd"), kj::StringPtr("/"), true));
  KJ_EXPECT(pwd.output == "/\n");
}

KJ_TEST("ProcessSupervisor reports signal deaths as 128 + signo") {
  SupervisorFixture fixture;

  auto result = fixture.waitBriefly(fixture.supervisor.run(
      makeArgv("sh", "-c", "kill -TERM $$")));
  KJ_EXPECT(result.exitCode == 128 + SIGTERM);
}

KJ_TEST("ProcessSupervisor::runChecked") {
  SupervisorFixture fixture;

  fixture.waitBriefly(fixture.supervisor.runChecked(makeArgv("true")));
  KJ_EXPECT_THROW_MESSAGE("command failed",
      fixture.waitBriefly(fixture.supervisor.runChecked(makeArgv("false"))));
}

KJ_TEST("ProcessSupervisor runs one command at a time") {
  SupervisorFixture fixture;

  auto first = fixture.supervisor.run(makeArgv("sleep", "30"));
  KJ_EXPECT(fixture.supervisor.isRunning());
  KJ_EXPECT_THROW_MESSAGE("already running", fixture.supervisor.run(makeArgv("true")));

  fixture.waitBriefly(fixture.supervisor.terminate(5 * kj::SECONDS));
  auto result = fixture.waitBriefly(kj::mv(first));
  KJ_EXPECT(result.exitCode == 128 + SIGTERM);
  KJ_EXPECT(!fixture.supervisor.isRunning());
}

KJ_TEST("ProcessSupervisor terminates the whole process group") {
  SupervisorFixture fixture;

  // The background sleep holds the output pipe open; the command only counts as finished once
  // it is gone too.
  auto promise = fixture.supervisor.run(
      makeArgv("sh", "-c", "sleep 30 & echo started; wait"));
  fixture.io.provider->getTimer().afterDelay(200 * kj::MILLISECONDS).wait(fixture.io.waitScope);

  fixture.waitBriefly(fixture.supervisor.terminate(5 * kj::SECONDS));
  auto result = fixture.waitBriefly(kj::mv(promise));
  KJ_EXPECT(result.exitCode == 128 + SIGTERM);
  KJ_EXPECT(fixture.logContains("Sending SIGTERM to process group"));
}

KJ_TEST("ProcessSupervisor escalates to SIGKILL") {
  SupervisorFixture fixture;
  auto& timer = fixture.io.provider->getTimer();

  auto promise = fixture.supervisor.run(
      makeArgv("sh", "-c", "trap '' TERM; echo ready; sleep 30"));
  timer.afterDelay(200 * kj::MILLISECONDS).wait(fixture.io.waitScope);

  auto start = timer.now();
  fixture.waitBriefly(fixture.supervisor.terminate(300 * kj::MILLISECONDS));
  KJ_EXPECT(timer.now() - start >= 300 * kj::MILLISECONDS);

  auto result = fixture.waitBriefly(kj::mv(promise));
  KJ_EXPECT(result.exitCode == 128 + SIGKILL);
  KJ_EXPECT(fixture.logContains("survived SIGTERM; sending SIGKILL"));
  KJ_EXPECT(fixture.logContains("Command killed by signal 9"));
}

KJ_TEST("ProcessSupervisor::newSibling runs beside a busy supervisor") {
  SupervisorFixture fixture;

  auto busy = fixture.supervisor.run(makeArgv("sleep", "30"));
  auto sibling = fixture.supervisor.newSibling();
  auto result = fixture.waitBriefly(sibling->run(makeArgv("echo", "reaper ran")));
  KJ_EXPECT(result.exitCode == 0);
  KJ_EXPECT(fixture.supervisor.isRunning());
  KJ_EXPECT(fixture.logContains("reaper ran\n"));

  fixture.waitBriefly(fixture.supervisor.terminate(5 * kj::SECONDS));
}

KJ_TEST("ProcessSupervisor::terminate with nothing running") {
  SupervisorFixture fixture;
  fixture.waitBriefly(fixture.supervisor.terminate(1 * kj::SECONDS));
  KJ_EXPECT(fixture.tail() == "");
}

}  // namespace
}  // namespace buildd

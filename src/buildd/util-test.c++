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

#include "util.h"
#include <kj/test.h>
#include <sys/wait.h>
#include <errno.h>
#include <signal.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>

namespace buildd {
namespace {

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  return findSubstring(haystack, needle) != nullptr;
}

struct ChildFixture {
  kj::AsyncIoContext io = kj::setupAsyncIo();
  SubprocessSet set;

  ChildFixture(): set(io.unixEventPort) {}

  int waitFor(Subprocess& child) {
    return set.waitForExitOrSignal(child).wait(io.waitScope);
  }

  int exitCodeOf(Subprocess& child) {
    return waitStatusToExitCode(waitFor(child));
  }
};

Subprocess::Options optionsFor(kj::ArrayPtr<const kj::StringPtr> argv) {
  return Subprocess::Options(argv);
}

KJ_TEST("Subprocess") {
  ChildFixture fixture;

  {
    auto argv = kj::heapArray<kj::StringPtr>({"true"});
    Subprocess child(optionsFor(argv));
    KJ_EXPECT(fixture.exitCodeOf(child) == 0);
    KJ_EXPECT(!child.isRunning());
  }

  {
    auto argv = kj::heapArray<kj::StringPtr>({"sh", "-c", "exit 7"});
    Subprocess child(optionsFor(argv));
    KJ_EXPECT(fixture.exitCodeOf(child) == 7);
  }

  {
    // Never waited for: the destructor kills and reaps it.
    auto argv = kj::heapArray<kj::StringPtr>({"cat"});
    Subprocess child(optionsFor(argv));
  }

  {
    Pipe pipe = Pipe::make();
    auto argv = kj::heapArray<kj::StringPtr>({"echo", "dpkg-buildpackage"});
    auto options = optionsFor(argv);
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "dpkg-buildpackage\n");
    KJ_EXPECT(fixture.exitCodeOf(child) == 0);
  }

  {
    // exec() failures are reported on the child's stderr.
    Pipe pipe = Pipe::make();
    auto argv = kj::heapArray<kj::StringPtr>({"no-such-file-eb8c433f35f3063e"});
    auto options = optionsFor(argv);
    options.stderr = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(hasSubstring(readAll(pipe.readEnd), "execvp("));
    KJ_EXPECT(fixture.exitCodeOf(child) == 127);
  }

  {
    Pipe pipe = Pipe::make();
    auto argv = kj::heapArray<kj::StringPtr>({"pwd"});
    auto options = optionsFor(argv);
    options.workingDirectory = kj::StringPtr("/tmp");
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "/tmp\n");
    KJ_EXPECT(fixture.exitCodeOf(child) == 0);
  }
}

KJ_TEST("Subprocess process group") {
  ChildFixture fixture;

  // The grandchild inherits the group and the pipe; killing the group must take both down, or
  // the read below would never see EOF.
  Pipe pipe = Pipe::make();
  auto argv = kj::heapArray<kj::StringPtr>({"sh", "-c", "sleep 60 & echo started; wait"});
  auto options = optionsFor(argv);
  options.stdout = pipe.writeEnd;
  options.newProcessGroup = true;
  Subprocess child(kj::mv(options));
  pipe.writeEnd = nullptr;

  char buffer[8];
  kj::FdInputStream(pipe.readEnd.get()).read(buffer, 8);
  KJ_EXPECT(kj::StringPtr(buffer, 7) == "started");

  child.killGroup(SIGKILL);
  int status = fixture.waitFor(child);
  KJ_EXPECT(WIFSIGNALED(status));
  KJ_EXPECT(readAll(pipe.readEnd) == "");
}

KJ_TEST("SubprocessSet") {
  ChildFixture fixture;
  auto& set = fixture.set;
  auto& io = fixture.io;

  Pipe catPipe = Pipe::make();
  auto catArgv = kj::heapArray<kj::StringPtr>({"cat"});
  auto catOptions = optionsFor(catArgv);
  catOptions.stdin = catPipe.readEnd;
  Subprocess cat(kj::mv(catOptions));
  catPipe.readEnd = nullptr;

  auto failsArgv = kj::heapArray<kj::StringPtr>({"false"});
  Subprocess fails(optionsFor(failsArgv));

  bool catDone = false;
  auto catExit = set.waitForExitOrSignal(cat).then([&](int status) {
    catDone = true;
    return status;
  });
  auto failsExit = set.waitForExitOrSignal(fails);

  int status = failsExit.wait(io.waitScope);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) != 0);
  KJ_EXPECT(!fails.isRunning());
  KJ_EXPECT(!catDone);

  // cat exits once its input closes.
  catPipe.writeEnd = nullptr;
  KJ_EXPECT(waitStatusToExitCode(catExit.wait(io.waitScope)) == 0);
  KJ_EXPECT(!cat.isRunning());
}

KJ_TEST("SubprocessSet reaps a child destroyed while still running") {
  ChildFixture fixture;
  auto& timer = fixture.io.provider->getTimer();

  Pipe pipe = Pipe::make();
  pid_t pid;
  {
    auto argv = kj::heapArray<kj::StringPtr>({"cat"});
    auto options = optionsFor(argv);
    options.stdin = pipe.readEnd;
    options.newProcessGroup = true;
    Subprocess child(kj::mv(options));
    pid = child.getPid();
    auto exited = fixture.set.waitForExitOrSignal(child);
    // Destroying the child must not block; the set reaps it later.
  }

  for (uint i = 0; i < 500 && kill(pid, 0) == 0; i++) {
    timer.afterDelay(10 * kj::MILLISECONDS).wait(fixture.io.waitScope);
  }
  KJ_EXPECT(kill(pid, 0) < 0 && errno == ESRCH, "child was never reaped", pid);
}

KJ_TEST("shellEscape") {
  KJ_EXPECT(shellEscape("apt-get") == "apt-get");
  KJ_EXPECT(shellEscape("DEB_BUILD_OPTIONS=parallel=4") == "DEB_BUILD_OPTIONS=parallel=4");
  KJ_EXPECT(shellEscape("/home/buildd/work") == "/home/buildd/work");
  KJ_EXPECT(shellEscape("") == "''");
  KJ_EXPECT(shellEscape("two words") == "'two words'");
  KJ_EXPECT(shellEscape("it's") == "'it'\\''s'");
  KJ_EXPECT(shellEscape("$HOME") == "'$HOME'");

  auto argv = kj::arr(kj::str("echo"), kj::str("a b"), kj::str("c"));
  KJ_EXPECT(formatCommand(argv) == "echo 'a b' c");
}

KJ_TEST("wait status helpers") {
  ChildFixture fixture;

  auto exitArgv = kj::heapArray<kj::StringPtr>({"sh", "-c", "exit 3"});
  Subprocess exited(optionsFor(exitArgv));
  int status = fixture.waitFor(exited);
  KJ_EXPECT(waitStatusToExitCode(status) == 3);
  KJ_EXPECT(formatWaitStatus(status) == "exit status 3");

  auto killArgv = kj::heapArray<kj::StringPtr>({"sh", "-c", "kill -TERM $$"});
  Subprocess killed(optionsFor(killArgv));
  status = fixture.waitFor(killed);
  KJ_EXPECT(waitStatusToExitCode(status) == 128 + SIGTERM);
  KJ_EXPECT(formatWaitStatus(status).startsWith("killed by signal 15"));
}

KJ_TEST("string helpers") {
  auto lines = splitLines("  FOO=bar  \n\n# comment\nBAZ=qux # trailing\n");
  KJ_ASSERT(lines.size() == 2);
  KJ_EXPECT(lines[0] == "FOO=bar");
  KJ_EXPECT(lines[1] == "BAZ=qux");

  auto parts = split(kj::StringPtr("a,,b"), ',');
  KJ_ASSERT(parts.size() == 3);
  KJ_EXPECT(kj::heapString(parts[2]) == "b");

  auto words = splitSpace(kj::StringPtr("  one two\tthree "));
  KJ_ASSERT(words.size() == 3);
  KJ_EXPECT(kj::heapString(words[1]) == "two");

  kj::ArrayPtr<const char> rest = kj::StringPtr("key: value: more");
  KJ_EXPECT(kj::heapString(KJ_ASSERT_NONNULL(splitFirst(rest, ':'))) == "key");
  KJ_EXPECT(trim(rest) == "value: more");

  KJ_EXPECT(KJ_ASSERT_NONNULL(findSubstring("abcabc", "bc", 2)) == 4);
  KJ_EXPECT(findSubstring("abc", "abcd") == nullptr);

  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt("120", 10)) == 120);
  KJ_EXPECT(parseUInt("12x", 10) == nullptr);
  KJ_EXPECT(parseUInt("", 10) == nullptr);
}

KJ_TEST("file helpers") {
  auto dir = makeTemporaryDirectory("/tmp/buildd-util-test.");
  KJ_DEFER(recursivelyDelete(dir));

  auto nested = kj::str(dir, "/a/b/file");
  recursivelyCreateParent(nested);
  writeFile(nested, "content", 0600);
  KJ_EXPECT(readAll(nested) == "content");

  struct stat stats;
  KJ_SYSCALL(stat(nested.cStr(), &stats));
  KJ_EXPECT((stats.st_mode & 0777) == 0600);

  KJ_EXPECT(pathExists(nested));
  KJ_EXPECT(!pathExists(kj::str(dir, "/missing")));
  KJ_EXPECT(isDirectory(kj::str(dir, "/a")));

  auto entries = listDirectory(kj::str(dir, "/a/b"));
  KJ_ASSERT(entries.size() == 1);
  KJ_EXPECT(entries[0] == "file");

  recursivelyDelete(kj::str(dir, "/a"));
  KJ_EXPECT(!pathExists(kj::str(dir, "/a")));
}

}  // namespace
}  // namespace buildd

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

#include "chroot.h"
#include <kj/test.h>
#include <kj/async-unix.h>
#include "supervisor.h"

namespace buildd {
namespace {

struct ChrootFixture {
  ChrootFixture()
      : io(kj::setupAsyncIo()),
        subprocesses(io.unixEventPort),
        log(io.provider->getTimer(), nullptr),
        supervisor(*io.lowLevelProvider, subprocesses, io.provider->getTimer(), log),
        home(makeTemporaryDirectory("/tmp/buildd-chroot-test.")),
        sandbox(home, supervisor, io.provider->getTimer(), "/usr/bin/buildd") {}

  ~ChrootFixture() noexcept(false) {
    recursivelyDelete(home);
  }

  kj::AsyncIoContext io;
  SubprocessSet subprocesses;
  BuildLog log;
  ProcessSupervisor supervisor;
  kj::String home;
  ChrootSandbox sandbox;
};

KJ_TEST("ChrootSandbox::commandFor") {
  ChrootFixture fixture;
  auto& sandbox = fixture.sandbox;
  KJ_EXPECT(sandbox.getRoot() == kj::str(fixture.home, "/chroot-autobuild"));

  Command command;
  command.argv = makeArgv("dpkg-buildpackage", "-S", "it's");
  command.env = makeArgv("LANG=C");
  command.cwd = kj::str("/home/buildd/work");

  sandbox.setQuirks(resolveQuirks("i386", "precise"));
  auto argv = sandbox.commandFor(command);
  KJ_EXPECT(argv[0] == "sudo");
  KJ_EXPECT(argv[1] == "/usr/sbin/chroot");
  KJ_EXPECT(argv[2] == sandbox.getRoot());
  KJ_EXPECT(argv[3] == "linux32");
  KJ_EXPECT(argv[4] == "--uname-2.6");
  KJ_EXPECT(argv[5] == "env");
  KJ_EXPECT(argv[6] == "DEB_CFLAGS_APPEND=-Wno-error");
  KJ_EXPECT(argv[8] == "LANG=C");
  KJ_ASSERT(argv.size() == 12);
  KJ_EXPECT(argv[9] == "/bin/sh");
  KJ_EXPECT(argv[11] == "cd /home/buildd/work && dpkg-buildpackage -S 'it'\\''s'");

  Command noCwd;
  noCwd.argv = makeArgv("true");
  sandbox.setQuirks(resolveQuirks("amd64", "noble"));
  auto plain = sandbox.commandFor(noCwd);
  KJ_EXPECT(plain[plain.size() - 1] == "cd / && true");
  KJ_EXPECT(plain[3] == "linux64");
}

KJ_TEST("ChrootSandbox teardown of a sandbox that was never created") {
  ChrootFixture fixture;
  auto& waitScope = fixture.io.waitScope;

  fixture.sandbox.destroy().wait(waitScope);
  fixture.sandbox.destroy().wait(waitScope);

  // Nothing needed doing, so nothing ran.
  KJ_EXPECT(fixture.log.getTail().size() == 0);
}

KJ_TEST("ChrootSandbox rejects relative sandbox paths") {
  ChrootFixture fixture;
  KJ_EXPECT_THROW_MESSAGE("must be absolute",
      fixture.sandbox.copyIn("/etc/hosts", "etc/hosts", 0644).wait(fixture.io.waitScope));
  KJ_EXPECT_THROW_MESSAGE("must be absolute",
      fixture.sandbox.copyOut("work/x", "/tmp/x").wait(fixture.io.waitScope));
}

KJ_TEST("findMountsUnder") {
  kj::StringPtr table =
      "sysfs /sys sysfs rw,nosuid,nodev,noexec,relatime 0 0\n"
      "proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0\n"
      "none /srv/build-1/chroot-autobuild/proc proc rw 0 0\n"
      "none /srv/build-1/chroot-autobuild/dev/pts devpts rw,gid=5,mode=620 0 0\n"
      "none /srv/build-1/chroot-autobuild-other/proc proc rw 0 0\n"
      "none /srv/build-1/chroot-autobuild/home/odd\\040name tmpfs rw 0 0\n"
      "none /srv/build-1/chroot-autobuild/dev/shm tmpfs rw 0 0\n";

  auto mounts = findMountsUnder(table, "/srv/build-1/chroot-autobuild");
  KJ_ASSERT(mounts.size() == 4);
  KJ_EXPECT(mounts[0] == "/srv/build-1/chroot-autobuild/dev/shm");
  KJ_EXPECT(mounts[1] == "/srv/build-1/chroot-autobuild/home/odd name");
  KJ_EXPECT(mounts[2] == "/srv/build-1/chroot-autobuild/dev/pts");
  KJ_EXPECT(mounts[3] == "/srv/build-1/chroot-autobuild/proc");

  KJ_EXPECT(findMountsUnder(table, "/srv/build-2/chroot-autobuild").size() == 0);
  KJ_EXPECT(findMountsUnder("", "/srv/build-1/chroot-autobuild").size() == 0);
}

KJ_TEST("killProcessesRootedIn ignores processes outside the root") {
  auto home = makeTemporaryDirectory("/tmp/buildd-chroot-test.");
  KJ_DEFER(recursivelyDelete(home));
  KJ_EXPECT(killProcessesRootedIn(home) == 0);
}

}  // namespace
}  // namespace buildd
